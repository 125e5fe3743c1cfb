#include "pipewire_capture.hpp"
#include "util/logger.hpp"

#include <pipewire/pipewire.h>
#include <spa/param/video/format-utils.h>
#include <spa/debug/types.h>
#include <spa/param/video/type-info.h>
#include <spa/utils/result.h>
#include <spa/pod/pod.h>

#include <gio/gio.h>
#include <gio/gunixfdlist.h>

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <thread>

namespace screen_mirror {

static const char* PORTAL_BUS_NAME = "org.freedesktop.portal.Desktop";
static const char* PORTAL_OBJECT_PATH = "/org/freedesktop/portal/desktop";
static const char* SCREENCAST_INTERFACE = "org.freedesktop.portal.ScreenCast";
static const char* REQUEST_INTERFACE = "org.freedesktop.portal.Request";
static const char* SESSION_INTERFACE = "org.freedesktop.portal.Session";

// ScreenCast source types and cursor modes
static const uint32_t SOURCE_TYPE_MONITOR = 1;
static const uint32_t SOURCE_TYPE_WINDOW = 2;
static const uint32_t CURSOR_MODE_HIDDEN = 1;
static const uint32_t CURSOR_MODE_EMBEDDED = 2;

// Portal response timeouts, ms. Source selection waits on the user.
static const int REQUEST_TIMEOUT_MS = 30000;
static const int SELECTION_TIMEOUT_MS = 120000;

static const int STREAM_START_TIMEOUT_MS = 5000;

static bool map_spa_format(uint32_t spa_format, PixelFormat& out) {
    switch (spa_format) {
        case SPA_VIDEO_FORMAT_BGRx: out = PixelFormat::BGRX; return true;
        case SPA_VIDEO_FORMAT_BGRA: out = PixelFormat::BGRA; return true;
        case SPA_VIDEO_FORMAT_RGBx: out = PixelFormat::RGBX; return true;
        case SPA_VIDEO_FORMAT_RGBA: out = PixelFormat::RGBA; return true;
        case SPA_VIDEO_FORMAT_xBGR: out = PixelFormat::XBGR; return true;
        default: return false;
    }
}

static uint64_t now_us() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

// One PipeWire stream on a node the portal granted. Frames are scaled to
// the configured size on the PipeWire thread and handed to deliver().
class PipeWireSubscription : public CaptureSubscription {
public:
    PipeWireSubscription(int fd, uint32_t node_id, const StreamConfig& config)
        : CaptureSubscription(config)
        , m_fd(fd)
        , m_node_id(node_id) {
    }

    ~PipeWireSubscription() override {
        stop();
        release();
        if (m_fd >= 0) {
            close(m_fd);
            m_fd = -1;
        }
    }

    // Called from the PipeWire thread
    void handle_state(pw_stream_state old_state, pw_stream_state state, const char* error);
    void handle_format(uint32_t id, const spa_pod* param);
    void handle_buffer();

protected:
    bool start_producer() override;
    void stop_producer() override { release(); }
    const char* get_name() const override { return "PipeWire"; }

private:
    bool open_stream();
    void release();

    int m_fd = -1;
    uint32_t m_node_id = 0;

    pw_thread_loop* m_thread_loop = nullptr;
    pw_context* m_context = nullptr;
    pw_core* m_core = nullptr;
    pw_stream* m_stream = nullptr;
    spa_hook m_listener;

    // Negotiated by the compositor; PipeWire thread only
    int m_src_width = 0;
    int m_src_height = 0;
    uint32_t m_spa_format = SPA_VIDEO_FORMAT_UNKNOWN;
    bool m_format_warned = false;

    std::mutex m_state_mutex;
    std::condition_variable m_state_cv;
    bool m_streaming = false;
    bool m_failed = false;
};

static const pw_stream_events* subscription_events() {
    static pw_stream_events events = []() {
        pw_stream_events e;
        memset(&e, 0, sizeof(e));
        e.version = PW_VERSION_STREAM_EVENTS;
        e.state_changed = [](void* data, pw_stream_state old_state, pw_stream_state state,
                             const char* error) {
            static_cast<PipeWireSubscription*>(data)->handle_state(old_state, state, error);
        };
        e.param_changed = [](void* data, uint32_t id, const spa_pod* param) {
            static_cast<PipeWireSubscription*>(data)->handle_format(id, param);
        };
        e.process = [](void* data) {
            static_cast<PipeWireSubscription*>(data)->handle_buffer();
        };
        return e;
    }();
    return &events;
}

bool PipeWireSubscription::start_producer() {
    m_thread_loop = pw_thread_loop_new("mirror-pipewire", nullptr);
    m_context = m_thread_loop ? pw_context_new(pw_thread_loop_get_loop(m_thread_loop), nullptr, 0)
                              : nullptr;
    if (!m_context || pw_thread_loop_start(m_thread_loop) < 0) {
        LOG_ERROR("Failed to set up PipeWire loop for node %u", m_node_id);
        release();
        return false;
    }

    pw_thread_loop_lock(m_thread_loop);
    // The core owns the fd from here on, even if connecting fails
    m_core = pw_context_connect_fd(m_context, m_fd, nullptr, 0);
    m_fd = -1;
    bool opened = m_core && open_stream();
    pw_thread_loop_unlock(m_thread_loop);

    if (!opened) {
        LOG_ERROR("Failed to open PipeWire node %u", m_node_id);
        release();
        return false;
    }

    bool streaming = false;
    {
        std::unique_lock<std::mutex> lock(m_state_mutex);
        m_state_cv.wait_for(lock, std::chrono::milliseconds(STREAM_START_TIMEOUT_MS),
                            [this]() { return m_streaming || m_failed; });
        streaming = m_streaming;
    }
    if (!streaming) {
        LOG_ERROR("PipeWire node %u never started streaming", m_node_id);
        release();
        return false;
    }
    return true;
}

bool PipeWireSubscription::open_stream() {
    m_stream = pw_stream_new(m_core, "screen-mirror", pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Video",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Screen",
        nullptr));
    if (!m_stream) {
        LOG_ERROR("pw_stream_new failed for node %u", m_node_id);
        return false;
    }

    spa_zero(m_listener);
    pw_stream_add_listener(m_stream, &m_listener, subscription_events(), this);

    // Preferred size and rate; the compositor has the final say
    spa_rectangle want_size = SPA_RECTANGLE(static_cast<uint32_t>(m_config.width),
                                            static_cast<uint32_t>(m_config.height));
    spa_rectangle min_size = SPA_RECTANGLE(1, 1);
    spa_rectangle max_size = SPA_RECTANGLE(8192, 8192);
    spa_fraction want_rate = SPA_FRACTION(static_cast<uint32_t>(m_config.fps), 1);
    spa_fraction min_rate = SPA_FRACTION(0, 1);

    uint8_t pod_buffer[1024];
    spa_pod_builder builder = SPA_POD_BUILDER_INIT(pod_buffer, sizeof(pod_buffer));
    const spa_pod* format = static_cast<const spa_pod*>(spa_pod_builder_add_object(&builder,
        SPA_TYPE_OBJECT_Format, SPA_PARAM_EnumFormat,
        SPA_FORMAT_mediaType, SPA_POD_Id(SPA_MEDIA_TYPE_video),
        SPA_FORMAT_mediaSubtype, SPA_POD_Id(SPA_MEDIA_SUBTYPE_raw),
        SPA_FORMAT_VIDEO_format, SPA_POD_CHOICE_ENUM_Id(6,
            SPA_VIDEO_FORMAT_BGRx,
            SPA_VIDEO_FORMAT_BGRx,
            SPA_VIDEO_FORMAT_BGRA,
            SPA_VIDEO_FORMAT_RGBx,
            SPA_VIDEO_FORMAT_RGBA,
            SPA_VIDEO_FORMAT_xBGR),
        SPA_FORMAT_VIDEO_size, SPA_POD_CHOICE_RANGE_Rectangle(&want_size, &min_size, &max_size),
        SPA_FORMAT_VIDEO_framerate, SPA_POD_CHOICE_RANGE_Fraction(&want_rate, &min_rate, &want_rate)));

    const spa_pod* params[] = {format};
    int ret = pw_stream_connect(m_stream, PW_DIRECTION_INPUT, m_node_id,
                                static_cast<pw_stream_flags>(PW_STREAM_FLAG_AUTOCONNECT |
                                                             PW_STREAM_FLAG_MAP_BUFFERS),
                                params, 1);
    if (ret < 0) {
        LOG_ERROR("pw_stream_connect to node %u: %s", m_node_id, spa_strerror(ret));
        return false;
    }

    LOG_DEBUG("PipeWire stream opened on node %u", m_node_id);
    return true;
}

void PipeWireSubscription::release() {
    if (m_thread_loop) {
        pw_thread_loop_lock(m_thread_loop);
    }
    if (m_stream) {
        pw_stream_disconnect(m_stream);
        pw_stream_destroy(m_stream);
        m_stream = nullptr;
    }
    if (m_core) {
        pw_core_disconnect(m_core);
        m_core = nullptr;
    }
    if (m_thread_loop) {
        pw_thread_loop_unlock(m_thread_loop);
        pw_thread_loop_stop(m_thread_loop);
    }
    if (m_context) {
        pw_context_destroy(m_context);
        m_context = nullptr;
    }
    if (m_thread_loop) {
        pw_thread_loop_destroy(m_thread_loop);
        m_thread_loop = nullptr;
    }

    std::lock_guard<std::mutex> lock(m_state_mutex);
    m_streaming = false;
}

void PipeWireSubscription::handle_state(pw_stream_state old_state, pw_stream_state state,
                                        const char* error) {
    LOG_DEBUG("Node %u: %s -> %s", m_node_id,
              pw_stream_state_as_string(old_state), pw_stream_state_as_string(state));

    std::lock_guard<std::mutex> lock(m_state_mutex);
    switch (state) {
        case PW_STREAM_STATE_STREAMING:
            m_streaming = true;
            break;
        case PW_STREAM_STATE_ERROR:
            LOG_ERROR("PipeWire node %u failed: %s", m_node_id, error ? error : "unknown error");
            m_streaming = false;
            m_failed = true;
            break;
        case PW_STREAM_STATE_UNCONNECTED:
            if (m_streaming) {
                LOG_WARN("Source on PipeWire node %u went away", m_node_id);
            }
            m_streaming = false;
            break;
        default:
            break;
    }
    m_state_cv.notify_all();
}

void PipeWireSubscription::handle_format(uint32_t id, const spa_pod* param) {
    if (id != SPA_PARAM_Format || !param) {
        return;
    }

    spa_video_info_raw info;
    spa_zero(info);
    if (spa_format_video_raw_parse(param, &info) < 0) {
        LOG_WARN("Unparseable format on PipeWire node %u", m_node_id);
        return;
    }

    m_src_width = static_cast<int>(info.size.width);
    m_src_height = static_cast<int>(info.size.height);
    m_spa_format = info.format;
    m_format_warned = false;

    LOG_INFO("Node %u negotiated %dx%d %s", m_node_id, m_src_width, m_src_height,
             spa_debug_type_find_name(spa_type_video_format, m_spa_format));
}

void PipeWireSubscription::handle_buffer() {
    pw_buffer* buffer = pw_stream_dequeue_buffer(m_stream);
    if (!buffer) {
        return;
    }

    const spa_data& plane = buffer->buffer->datas[0];
    PixelFormat format = PixelFormat::BGRA;
    bool usable = map_spa_format(m_spa_format, format);
    if (!usable && !m_format_warned) {
        LOG_WARN("Node %u delivers unsupported format %u, dropping its frames", m_node_id, m_spa_format);
        m_format_warned = true;
    }

    usable = usable && plane.data && plane.chunk && m_src_width > 0 && m_src_height > 0 &&
             !(plane.chunk->flags & SPA_CHUNK_FLAG_CORRUPTED);
    if (usable) {
        int src_stride = plane.chunk->stride > 0 ? plane.chunk->stride : m_src_width * 4;
        size_t have = plane.chunk->size ? plane.chunk->size : plane.maxsize - plane.chunk->offset;
        size_t need = static_cast<size_t>(src_stride) * (m_src_height - 1) +
                      static_cast<size_t>(m_src_width) * 4;

        if (have >= need) {
            RawFrame frame;
            frame.width = m_config.width;
            frame.height = m_config.height;
            frame.stride = m_config.width * 4;
            frame.format = format;
            frame.timestamp_us = now_us();
            frame.data.resize(static_cast<size_t>(frame.stride) * frame.height);
            // A resized source keeps its aspect inside the negotiated box
            scale_pixels_fit(static_cast<const uint8_t*>(plane.data) + plane.chunk->offset,
                             m_src_width, m_src_height, src_stride,
                             frame.data.data(), frame.width, frame.height, frame.stride, format);
            deliver(std::move(frame));
        }
    }

    pw_stream_queue_buffer(m_stream, buffer);
}

PipeWireCapture::PipeWireCapture(bool show_cursor)
    : m_show_cursor(show_cursor) {
}

PipeWireCapture::~PipeWireCapture() {
    shutdown();
}

bool PipeWireCapture::init(const char* /*display_name*/) {
    pw_init(nullptr, nullptr);

    // The ScreenCast session is negotiated lazily, on first enumeration
    if (!init_dbus()) {
        cleanup_portal();
        pw_deinit();
        return false;
    }

    LOG_INFO("PipeWire capture ready (portal %s)", m_request_prefix.c_str());
    m_initialized = true;
    return true;
}

void PipeWireCapture::shutdown() {
    if (!m_initialized.exchange(false)) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_portal_mutex);
    cleanup_portal();
    pw_deinit();
}

bool PipeWireCapture::init_dbus() {
    GError* error = nullptr;

    m_dbus_conn = g_bus_get_sync(G_BUS_TYPE_SESSION, nullptr, &error);
    if (!m_dbus_conn) {
        LOG_ERROR("No session bus: %s", error->message);
        g_error_free(error);
        return false;
    }

    m_portal_proxy = g_dbus_proxy_new_sync(m_dbus_conn, G_DBUS_PROXY_FLAGS_NONE, nullptr,
                                           PORTAL_BUS_NAME, PORTAL_OBJECT_PATH,
                                           SCREENCAST_INTERFACE, nullptr, &error);
    if (!m_portal_proxy) {
        LOG_ERROR("ScreenCast portal unavailable: %s", error->message);
        g_error_free(error);
        return false;
    }

    // Request objects live at .../request/<sender>/<token>, sender being
    // our unique bus name without the ':' and with '.' turned into '_'
    std::string sender = g_dbus_connection_get_unique_name(m_dbus_conn);
    if (!sender.empty() && sender[0] == ':') {
        sender.erase(0, 1);
    }
    for (char& c : sender) {
        if (c == '.') {
            c = '_';
        }
    }
    m_request_prefix = std::string(PORTAL_OBJECT_PATH) + "/request/" + sender + "/";
    return true;
}

std::string PipeWireCapture::next_token() {
    return "screen_mirror_" + std::to_string(getpid()) + "_" + std::to_string(++m_token_counter);
}

namespace {

struct PendingResponse {
    bool done = false;
    uint32_t code = 0;
    GVariant* results = nullptr;
};

void on_portal_response(GDBusConnection*, const gchar*, const gchar*, const gchar*, const gchar*,
                        GVariant* parameters, gpointer user_data) {
    auto* pending = static_cast<PendingResponse*>(user_data);
    GVariant* results = nullptr;
    g_variant_get(parameters, "(u@a{sv})", &pending->code, &results);
    if (pending->code == 0) {
        pending->results = results;
    } else {
        g_variant_unref(results);
    }
    pending->done = true;
}

}  // namespace

GVariant* PipeWireCapture::portal_request(const char* method, GVariant* params,
                                          const std::string& token, int timeout_ms) {
    std::string request_path = m_request_prefix + token;

    // Listen before calling so a fast Response cannot slip past. Dispatch on
    // a private context: enumeration runs off the main thread.
    GMainContext* context = g_main_context_new();
    g_main_context_push_thread_default(context);

    PendingResponse pending;
    guint subscription = g_dbus_connection_signal_subscribe(
        m_dbus_conn, PORTAL_BUS_NAME, REQUEST_INTERFACE, "Response", request_path.c_str(),
        nullptr, G_DBUS_SIGNAL_FLAGS_NO_MATCH_RULE, on_portal_response, &pending, nullptr);

    GError* error = nullptr;
    GVariant* reply = g_dbus_proxy_call_sync(m_portal_proxy, method, params,
                                             G_DBUS_CALL_FLAGS_NONE, -1, nullptr, &error);
    if (!reply) {
        LOG_ERROR("Portal %s failed: %s", method, error->message);
        g_error_free(error);
    } else {
        const char* handle = nullptr;
        g_variant_get(reply, "(&o)", &handle);
        if (request_path != handle) {
            // Older portals ignore handle_token
            LOG_DEBUG("Portal %s answered on %s", method, handle);
            g_dbus_connection_signal_unsubscribe(m_dbus_conn, subscription);
            request_path = handle;
            subscription = g_dbus_connection_signal_subscribe(
                m_dbus_conn, PORTAL_BUS_NAME, REQUEST_INTERFACE, "Response", request_path.c_str(),
                nullptr, G_DBUS_SIGNAL_FLAGS_NO_MATCH_RULE, on_portal_response, &pending, nullptr);
        }
        g_variant_unref(reply);

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (!pending.done && std::chrono::steady_clock::now() < deadline) {
            if (!g_main_context_iteration(context, FALSE)) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }

        if (!pending.done) {
            LOG_ERROR("Portal %s: no response within %d s", method, timeout_ms / 1000);
        } else if (pending.code != 0) {
            // 1 = user cancelled, 2 = other
            LOG_WARN("Portal %s %s", method, pending.code == 1 ? "cancelled by the user" : "refused");
        }
    }

    g_dbus_connection_signal_unsubscribe(m_dbus_conn, subscription);
    g_main_context_pop_thread_default(context);
    g_main_context_unref(context);
    return pending.results;
}

bool PipeWireCapture::ensure_session() {
    if (!m_session_handle.empty() && !m_streams.empty() && m_pipewire_fd >= 0) {
        return true;
    }

    m_session_handle.clear();
    m_streams.clear();

    if (create_session() && select_sources() && start_capture() && open_remote()) {
        return true;
    }

    LOG_ERROR("Could not establish a ScreenCast session");
    m_session_handle.clear();
    m_streams.clear();
    return false;
}

bool PipeWireCapture::create_session() {
    std::string token = next_token();

    GVariantBuilder options;
    g_variant_builder_init(&options, G_VARIANT_TYPE_VARDICT);
    g_variant_builder_add(&options, "{sv}", "handle_token", g_variant_new_string(token.c_str()));
    g_variant_builder_add(&options, "{sv}", "session_handle_token", g_variant_new_string(token.c_str()));

    GVariant* results = portal_request("CreateSession", g_variant_new("(a{sv})", &options),
                                       token, REQUEST_TIMEOUT_MS);
    if (!results) {
        return false;
    }

    const char* handle = nullptr;
    if (g_variant_lookup(results, "session_handle", "&s", &handle)) {
        m_session_handle = handle;
    }
    g_variant_unref(results);

    LOG_DEBUG("ScreenCast session %s", m_session_handle.c_str());
    return !m_session_handle.empty();
}

bool PipeWireCapture::select_sources() {
    std::string token = next_token();

    // Windows and monitors, several at once: the grant is our catalog
    GVariantBuilder options;
    g_variant_builder_init(&options, G_VARIANT_TYPE_VARDICT);
    g_variant_builder_add(&options, "{sv}", "handle_token", g_variant_new_string(token.c_str()));
    g_variant_builder_add(&options, "{sv}", "types",
                          g_variant_new_uint32(SOURCE_TYPE_MONITOR | SOURCE_TYPE_WINDOW));
    g_variant_builder_add(&options, "{sv}", "multiple", g_variant_new_boolean(TRUE));
    g_variant_builder_add(&options, "{sv}", "cursor_mode",
                          g_variant_new_uint32(m_show_cursor ? CURSOR_MODE_EMBEDDED : CURSOR_MODE_HIDDEN));

    GVariant* results = portal_request("SelectSources",
                                       g_variant_new("(oa{sv})", m_session_handle.c_str(), &options),
                                       token, SELECTION_TIMEOUT_MS);
    if (!results) {
        return false;
    }
    g_variant_unref(results);
    return true;
}

bool PipeWireCapture::start_capture() {
    std::string token = next_token();

    GVariantBuilder options;
    g_variant_builder_init(&options, G_VARIANT_TYPE_VARDICT);
    g_variant_builder_add(&options, "{sv}", "handle_token", g_variant_new_string(token.c_str()));

    GVariant* results = portal_request("Start",
                                       g_variant_new("(osa{sv})", m_session_handle.c_str(), "", &options),
                                       token, REQUEST_TIMEOUT_MS);
    if (!results) {
        return false;
    }

    // a(ua{sv}): node id plus size, position and source_type per stream
    GVariant* streams = nullptr;
    if (g_variant_lookup(results, "streams", "@a(ua{sv})", &streams)) {
        GVariantIter iter;
        g_variant_iter_init(&iter, streams);

        uint32_t node_id = 0;
        GVariant* props = nullptr;
        while (g_variant_iter_next(&iter, "(u@a{sv})", &node_id, &props)) {
            PortalStream stream;
            stream.node_id = node_id;
            stream.source_type = SOURCE_TYPE_MONITOR;
            g_variant_lookup(props, "source_type", "u", &stream.source_type);
            g_variant_lookup(props, "size", "(ii)", &stream.bounds.width, &stream.bounds.height);
            g_variant_lookup(props, "position", "(ii)", &stream.bounds.x, &stream.bounds.y);
            g_variant_unref(props);

            LOG_INFO("Portal granted node %u (%s, %dx%d)", node_id,
                     stream.source_type == SOURCE_TYPE_WINDOW ? "window" : "monitor",
                     stream.bounds.width, stream.bounds.height);
            m_streams.push_back(stream);
        }
        g_variant_unref(streams);
    }
    g_variant_unref(results);

    if (m_streams.empty()) {
        LOG_ERROR("Portal granted no streams");
        return false;
    }
    return true;
}

bool PipeWireCapture::open_remote() {
    GVariantBuilder options;
    g_variant_builder_init(&options, G_VARIANT_TYPE_VARDICT);

    GError* error = nullptr;
    GUnixFDList* fds = nullptr;
    GVariant* reply = g_dbus_proxy_call_with_unix_fd_list_sync(
        m_portal_proxy, "OpenPipeWireRemote",
        g_variant_new("(oa{sv})", m_session_handle.c_str(), &options),
        G_DBUS_CALL_FLAGS_NONE, -1, nullptr, &fds, nullptr, &error);
    if (!reply) {
        LOG_ERROR("Portal OpenPipeWireRemote failed: %s", error->message);
        g_error_free(error);
        return false;
    }

    int32_t index = -1;
    g_variant_get(reply, "(h)", &index);
    g_variant_unref(reply);

    if (fds) {
        m_pipewire_fd = g_unix_fd_list_get(fds, index, nullptr);
        g_object_unref(fds);
    }
    if (m_pipewire_fd < 0) {
        LOG_ERROR("Portal returned no PipeWire remote");
        return false;
    }
    return true;
}

void PipeWireCapture::cleanup_portal() {
    if (m_dbus_conn && !m_session_handle.empty()) {
        GError* error = nullptr;
        GVariant* ret = g_dbus_connection_call_sync(
            m_dbus_conn, PORTAL_BUS_NAME, m_session_handle.c_str(), SESSION_INTERFACE,
            "Close", nullptr, nullptr, G_DBUS_CALL_FLAGS_NONE, -1, nullptr, &error);
        if (ret) {
            g_variant_unref(ret);
        } else {
            LOG_WARN("Failed to close portal session: %s", error->message);
            g_error_free(error);
        }
    }
    m_session_handle.clear();
    m_streams.clear();

    if (m_portal_proxy) {
        g_object_unref(m_portal_proxy);
        m_portal_proxy = nullptr;
    }
    if (m_dbus_conn) {
        g_object_unref(m_dbus_conn);
        m_dbus_conn = nullptr;
    }
    if (m_pipewire_fd >= 0) {
        close(m_pipewire_fd);
        m_pipewire_fd = -1;
    }
}

int PipeWireCapture::dup_remote_fd() {
    if (m_pipewire_fd < 0) {
        return -1;
    }
    int fd = fcntl(m_pipewire_fd, F_DUPFD_CLOEXEC, 0);
    if (fd < 0) {
        LOG_ERROR("Failed to duplicate PipeWire fd: %s", strerror(errno));
    }
    return fd;
}

bool PipeWireCapture::enumerate_sources(std::vector<CaptureSource>& out) {
    std::lock_guard<std::mutex> lock(m_portal_mutex);
    out.clear();
    if (!m_initialized) {
        LOG_ERROR("PipeWire capture not initialized");
        return false;
    }

    if (!ensure_session()) {
        return false;
    }

    for (const PortalStream& stream : m_streams) {
        CaptureSource source;
        source.id = stream.node_id;
        source.kind = stream.source_type == SOURCE_TYPE_WINDOW ? SourceKind::WINDOW : SourceKind::DISPLAY;
        source.title = (source.kind == SourceKind::WINDOW ? "Portal window " : "Portal monitor ") +
                       std::to_string(stream.node_id);
        source.app_name = "xdg-desktop-portal";
        source.bounds = stream.bounds;
        out.push_back(std::move(source));
    }
    return true;
}

bool PipeWireCapture::capture_still(const CaptureSource& source, int max_width, int max_height,
                                    bool /*show_cursor*/, Image& out) {
    // Cursor mode is fixed per portal session
    StreamConfig config;
    fit_within(source.bounds.width, source.bounds.height, max_width, max_height,
               config.width, config.height);
    if (config.width <= 0 || config.height <= 0) {
        config.width = max_width;
        config.height = max_height;
    }
    config.queue_depth = 1;

    std::unique_ptr<CaptureSubscription> sub = subscribe(source, config);
    if (!sub) {
        return false;
    }

    std::mutex mutex;
    std::condition_variable cv;
    RawFrame first;
    bool received = false;

    bool started = sub->start([&](const RawFrame& frame) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!received) {
            first = frame;
            received = true;
            cv.notify_one();
        }
    });
    if (!started) {
        return false;
    }

    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, std::chrono::seconds(2), [&]() { return received; });
    }
    sub->stop();

    return received && convert_to_bgra(first, out);
}

std::unique_ptr<CaptureSubscription> PipeWireCapture::subscribe(const CaptureSource& source,
                                                                const StreamConfig& config) {
    std::lock_guard<std::mutex> lock(m_portal_mutex);
    if (!m_initialized) {
        LOG_ERROR("PipeWire capture not initialized");
        return nullptr;
    }

    bool granted = false;
    for (const PortalStream& stream : m_streams) {
        if (stream.node_id == source.id) {
            granted = true;
            break;
        }
    }
    if (!granted) {
        LOG_ERROR("PipeWire node %u is not part of the portal session", source.id);
        return nullptr;
    }

    int fd = dup_remote_fd();
    if (fd < 0) {
        return nullptr;
    }
    return std::make_unique<PipeWireSubscription>(fd, source.id, config);
}

}  // namespace screen_mirror
