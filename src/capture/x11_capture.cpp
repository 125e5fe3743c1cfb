#include "x11_capture.hpp"
#include "display/x11_display_backend.hpp"
#include "util/logger.hpp"

#include <xcb/composite.h>
#include <xcb/randr.h>
#include <xcb/shm.h>
#include <xcb/xfixes.h>
#include <sys/shm.h>
#include <pthread.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <thread>

namespace screen_mirror {

static xcb_atom_t intern_atom(xcb_connection_t* conn, const char* name) {
    xcb_intern_atom_cookie_t cookie = xcb_intern_atom(conn, 0, static_cast<uint16_t>(strlen(name)), name);
    xcb_intern_atom_reply_t* reply = xcb_intern_atom_reply(conn, cookie, nullptr);
    if (!reply) {
        return XCB_ATOM_NONE;
    }
    xcb_atom_t atom = reply->atom;
    free(reply);
    return atom;
}

static bool read_property(xcb_connection_t* conn, xcb_window_t window, xcb_atom_t property,
                          xcb_atom_t type, uint32_t max_words, std::vector<uint8_t>& out) {
    if (property == XCB_ATOM_NONE) {
        return false;
    }
    xcb_get_property_cookie_t cookie = xcb_get_property(conn, 0, window, property, type, 0, max_words);
    xcb_get_property_reply_t* reply = xcb_get_property_reply(conn, cookie, nullptr);
    if (!reply) {
        return false;
    }
    int length = xcb_get_property_value_length(reply);
    if (reply->type == XCB_ATOM_NONE || length <= 0) {
        free(reply);
        return false;
    }
    const uint8_t* value = static_cast<const uint8_t*>(xcb_get_property_value(reply));
    out.assign(value, value + length);
    free(reply);
    return true;
}

static bool read_string_property(xcb_connection_t* conn, xcb_window_t window, xcb_atom_t property,
                                 xcb_atom_t type, std::string& out) {
    std::vector<uint8_t> value;
    if (!read_property(conn, window, property, type, 1024, value)) {
        return false;
    }
    out.assign(reinterpret_cast<const char*>(value.data()), value.size());
    // Strings may carry a trailing NUL
    while (!out.empty() && out.back() == '\0') {
        out.pop_back();
    }
    return true;
}

static bool get_geometry(xcb_connection_t* conn, xcb_drawable_t drawable,
                         int& width, int& height, int& depth) {
    xcb_get_geometry_reply_t* geom = xcb_get_geometry_reply(conn, xcb_get_geometry(conn, drawable), nullptr);
    if (!geom) {
        return false;
    }
    width = geom->width;
    height = geom->height;
    depth = geom->depth;
    free(geom);
    return true;
}

static bool translate_to_root(xcb_connection_t* conn, xcb_window_t window, xcb_window_t root,
                              int& x, int& y) {
    xcb_translate_coordinates_reply_t* reply = xcb_translate_coordinates_reply(
        conn, xcb_translate_coordinates(conn, window, root, 0, 0), nullptr);
    if (!reply) {
        return false;
    }
    x = reply->dst_x;
    y = reply->dst_y;
    free(reply);
    return true;
}

// Screen sources are areas of the root window
static xcb_drawable_t source_drawable(const CaptureSource& source, xcb_window_t root) {
    return source.kind == SourceKind::DISPLAY ? root : source.id;
}

// 32-bit visuals carry alpha, 24-bit ones leave the fourth byte undefined
static PixelFormat format_for_depth(int depth) {
    return depth == 32 ? PixelFormat::BGRA : PixelFormat::BGRX;
}

// Composite the XFixes cursor onto a 4-byte BGR buffer whose top-left
// corner sits at (origin_x, origin_y) in root coordinates
static void draw_cursor(xcb_connection_t* conn, uint8_t* pixels, int width, int height, int stride,
                        int origin_x, int origin_y) {
    xcb_xfixes_get_cursor_image_cookie_t cookie = xcb_xfixes_get_cursor_image(conn);
    xcb_xfixes_get_cursor_image_reply_t* cursor = xcb_xfixes_get_cursor_image_reply(conn, cookie, nullptr);
    if (!cursor) {
        return;
    }

    // Cursor data is ARGB
    uint32_t* cursor_data = xcb_xfixes_get_cursor_image_cursor_image(cursor);
    int cursor_width = cursor->width;
    int cursor_height = cursor->height;
    int cursor_x = cursor->x - cursor->xhot - origin_x;
    int cursor_y = cursor->y - cursor->yhot - origin_y;

    for (int y = 0; y < cursor_height; y++) {
        int dst_y = cursor_y + y;
        if (dst_y < 0 || dst_y >= height) continue;

        for (int x = 0; x < cursor_width; x++) {
            int dst_x = cursor_x + x;
            if (dst_x < 0 || dst_x >= width) continue;

            uint32_t pixel = cursor_data[y * cursor_width + x];
            uint8_t a = (pixel >> 24) & 0xFF;
            uint8_t r = (pixel >> 16) & 0xFF;
            uint8_t g = (pixel >> 8) & 0xFF;
            uint8_t b = pixel & 0xFF;

            if (a == 0) continue;

            uint8_t* dst = pixels + static_cast<size_t>(dst_y) * stride + dst_x * 4;
            if (a == 255) {
                dst[0] = b;
                dst[1] = g;
                dst[2] = r;
                dst[3] = 255;
            } else {
                uint8_t inv_a = 255 - a;
                dst[0] = (b * a + dst[0] * inv_a) / 255;
                dst[1] = (g * a + dst[1] * inv_a) / 255;
                dst[2] = (r * a + dst[2] * inv_a) / 255;
                dst[3] = 255;
            }
        }
    }

    free(cursor);
}

// SysV shared memory segment attached to the X server
struct ShmSegment {
    xcb_shm_seg_t seg = 0;
    int id = -1;
    uint8_t* data = nullptr;
    size_t size = 0;

    bool create(xcb_connection_t* conn, size_t bytes) {
        size = bytes;
        id = shmget(IPC_PRIVATE, size, IPC_CREAT | 0600);
        if (id < 0) {
            LOG_ERROR("Failed to create shared memory segment (%zu bytes)", size);
            return false;
        }

        data = static_cast<uint8_t*>(shmat(id, nullptr, 0));
        if (data == reinterpret_cast<uint8_t*>(-1)) {
            LOG_ERROR("Failed to attach shared memory");
            data = nullptr;
            shmctl(id, IPC_RMID, nullptr);
            id = -1;
            return false;
        }

        seg = xcb_generate_id(conn);
        xcb_void_cookie_t cookie = xcb_shm_attach_checked(conn, seg, id, 0);
        xcb_generic_error_t* error = xcb_request_check(conn, cookie);
        if (error) {
            LOG_ERROR("Failed to attach SHM to X server: error code %d", error->error_code);
            free(error);
            seg = 0;
            destroy(conn);
            return false;
        }

        // Mark segment for deletion after detach
        shmctl(id, IPC_RMID, nullptr);
        id = -1;
        return true;
    }

    void destroy(xcb_connection_t* conn) {
        if (seg && conn) {
            xcb_shm_detach(conn, seg);
            seg = 0;
        }
        if (data) {
            shmdt(data);
            data = nullptr;
        }
        if (id >= 0) {
            shmctl(id, IPC_RMID, nullptr);
            id = -1;
        }
        size = 0;
    }
};

// Live stream of one window or of a region of the root window
class X11Subscription : public CaptureSubscription {
public:
    X11Subscription(const std::string& display_name, const CaptureSource& source,
                    const StreamConfig& config)
        : CaptureSubscription(config)
        , m_display_name(display_name)
        , m_source(source) {
    }

    ~X11Subscription() override {
        stop();
        cleanup();
    }

protected:
    bool start_producer() override;
    void stop_producer() override;
    const char* get_name() const override { return "X11"; }

private:
    void grab_loop();
    bool grab_frame();
    bool prepare_drawable(int width, int height);
    void cleanup();

    std::string m_display_name;
    CaptureSource m_source;

    xcb_connection_t* m_conn = nullptr;
    xcb_window_t m_root = 0;
    xcb_drawable_t m_drawable = 0;
    bool m_use_composite = false;
    bool m_redirected = false;
    bool m_xfixes_available = false;
    xcb_pixmap_t m_pixmap = 0;

    ShmSegment m_shm;
    int m_grab_width = 0;
    int m_grab_height = 0;

    std::thread m_grab_thread;
    std::atomic<bool> m_grabbing{false};
    bool m_source_lost_logged = false;
};

bool X11Subscription::start_producer() {
    int screen_num = 0;
    const char* display = m_display_name.empty() ? nullptr : m_display_name.c_str();
    m_conn = xcb_connect(display, &screen_num);
    if (xcb_connection_has_error(m_conn)) {
        LOG_ERROR("Failed to connect to X server for capture");
        xcb_disconnect(m_conn);
        m_conn = nullptr;
        return false;
    }

    xcb_screen_iterator_t iter = xcb_setup_roots_iterator(xcb_get_setup(m_conn));
    for (int i = 0; i < screen_num; i++) {
        xcb_screen_next(&iter);
    }
    m_root = iter.data->root;
    m_drawable = source_drawable(m_source, m_root);

    int width = 0, height = 0, depth = 0;
    if (!get_geometry(m_conn, m_drawable, width, height, depth)) {
        LOG_ERROR("Capture source 0x%x is no longer available", m_source.id);
        cleanup();
        return false;
    }

    if (m_source.kind == SourceKind::WINDOW) {
        const xcb_query_extension_reply_t* ext = xcb_get_extension_data(m_conn, &xcb_composite_id);
        m_use_composite = ext && ext->present;
        if (m_use_composite) {
            xcb_composite_redirect_window(m_conn, m_source.id, XCB_COMPOSITE_REDIRECT_AUTOMATIC);
            m_redirected = true;
        } else {
            LOG_WARN("Composite not available, capturing window 0x%x directly (must stay unobscured)",
                     m_source.id);
        }
    }

    if (m_config.show_cursor) {
        xcb_xfixes_query_version_reply_t* reply = xcb_xfixes_query_version_reply(
            m_conn, xcb_xfixes_query_version(m_conn, 4, 0), nullptr);
        if (reply) {
            m_xfixes_available = true;
            free(reply);
        } else {
            LOG_WARN("XFixes extension not available, cursor will not be visible");
        }
    }

    m_grabbing = true;
    m_grab_thread = std::thread(&X11Subscription::grab_loop, this);
    return true;
}

void X11Subscription::stop_producer() {
    m_grabbing = false;
    if (m_grab_thread.joinable()) {
        m_grab_thread.join();
    }
    cleanup();
}

void X11Subscription::cleanup() {
    if (!m_conn) {
        return;
    }
    m_shm.destroy(m_conn);
    if (m_pixmap) {
        xcb_free_pixmap(m_conn, m_pixmap);
        m_pixmap = 0;
    }
    if (m_redirected) {
        xcb_composite_unredirect_window(m_conn, m_source.id, XCB_COMPOSITE_REDIRECT_AUTOMATIC);
        m_redirected = false;
    }
    xcb_flush(m_conn);
    xcb_disconnect(m_conn);
    m_conn = nullptr;
    m_grab_width = 0;
    m_grab_height = 0;
}

void X11Subscription::grab_loop() {
    pthread_setname_np(pthread_self(), "mirror-grab");

    auto frame_interval = std::chrono::microseconds(m_config.frame_interval_us());
    auto next_frame = std::chrono::steady_clock::now();

    while (m_grabbing) {
        if (!grab_frame()) {
            // Source is gone; the last delivered frame stays on screen
            break;
        }

        next_frame += frame_interval;
        auto now = std::chrono::steady_clock::now();
        // If we're behind, skip frames
        if (next_frame < now) {
            next_frame = now + frame_interval;
        }
        std::this_thread::sleep_until(next_frame);
    }
}

bool X11Subscription::prepare_drawable(int width, int height) {
    if (width == m_grab_width && height == m_grab_height && m_shm.data) {
        return true;
    }

    size_t needed = static_cast<size_t>(width) * height * 4;
    if (needed > m_shm.size) {
        m_shm.destroy(m_conn);
        if (!m_shm.create(m_conn, needed)) {
            return false;
        }
    }

    if (m_use_composite) {
        // The named pixmap is tied to the window size at naming time
        if (m_pixmap) {
            xcb_free_pixmap(m_conn, m_pixmap);
            m_pixmap = 0;
        }
        xcb_pixmap_t pixmap = xcb_generate_id(m_conn);
        xcb_generic_error_t* error = xcb_request_check(
            m_conn, xcb_composite_name_window_pixmap_checked(m_conn, m_source.id, pixmap));
        if (error) {
            // Unmapped windows have no pixmap; retry next frame
            LOG_DEBUG("Cannot name pixmap for window 0x%x: error code %d", m_source.id, error->error_code);
            free(error);
            return false;
        }
        m_pixmap = pixmap;
    }

    m_grab_width = width;
    m_grab_height = height;
    LOG_DEBUG("X11 capture of 0x%x now %dx%d", m_source.id, width, height);
    return true;
}

bool X11Subscription::grab_frame() {
    int width = 0, height = 0, depth = 0;
    if (!get_geometry(m_conn, m_drawable, width, height, depth)) {
        if (!m_source_lost_logged) {
            LOG_WARN("Capture source 0x%x disappeared, feed stopped", m_source.id);
            m_source_lost_logged = true;
        }
        return false;
    }

    int src_x = 0;
    int src_y = 0;
    if (m_source.kind == SourceKind::DISPLAY) {
        src_x = m_source.bounds.x;
        src_y = m_source.bounds.y;
        width = std::min(m_source.bounds.width, width - src_x);
        height = std::min(m_source.bounds.height, height - src_y);
    }
    if (width <= 0 || height <= 0) {
        return true;
    }

    if (!prepare_drawable(width, height)) {
        return true;
    }

    xcb_drawable_t drawable = m_pixmap ? m_pixmap : m_drawable;
    xcb_shm_get_image_reply_t* reply = xcb_shm_get_image_reply(
        m_conn,
        xcb_shm_get_image(m_conn, drawable,
                          static_cast<int16_t>(src_x), static_cast<int16_t>(src_y),
                          static_cast<uint16_t>(width), static_cast<uint16_t>(height),
                          ~0, XCB_IMAGE_FORMAT_Z_PIXMAP, m_shm.seg, 0),
        nullptr);
    if (!reply) {
        LOG_DEBUG("Failed to read pixels of 0x%x", m_source.id);
        return true;
    }
    int image_depth = reply->depth;
    free(reply);

    if (m_xfixes_available) {
        int origin_x = src_x;
        int origin_y = src_y;
        if (m_source.kind == SourceKind::WINDOW) {
            translate_to_root(m_conn, m_source.id, m_root, origin_x, origin_y);
        }
        draw_cursor(m_conn, m_shm.data, width, height, width * 4, origin_x, origin_y);
    }

    RawFrame frame;
    frame.width = m_config.width;
    frame.height = m_config.height;
    frame.stride = m_config.width * 4;
    frame.format = format_for_depth(image_depth);
    frame.timestamp_us = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
    frame.data.resize(static_cast<size_t>(frame.stride) * frame.height);
    // The stream size is fixed at start; a resized window is letterboxed into it
    scale_pixels_fit(m_shm.data, width, height, width * 4,
                     frame.data.data(), frame.width, frame.height, frame.stride, frame.format);

    deliver(std::move(frame));
    return true;
}

X11Capture::X11Capture() = default;

X11Capture::~X11Capture() {
    shutdown();
}

bool X11Capture::init(const char* display_name) {
    m_display_name = display_name ? display_name : "";

    // Connect to X server
    int screen_num = 0;
    m_conn = xcb_connect(display_name, &screen_num);
    if (xcb_connection_has_error(m_conn)) {
        LOG_ERROR("Failed to connect to X server");
        xcb_disconnect(m_conn);
        m_conn = nullptr;
        return false;
    }

    // Get screen
    const xcb_setup_t* setup = xcb_get_setup(m_conn);
    xcb_screen_iterator_t iter = xcb_setup_roots_iterator(setup);
    for (int i = 0; i < screen_num; i++) {
        xcb_screen_next(&iter);
    }
    m_screen = iter.data;
    m_root = m_screen->root;

    m_width = m_screen->width_in_pixels;
    m_height = m_screen->height_in_pixels;

    LOG_INFO("Connected to X11 display: %dx%d, depth=%d", m_width, m_height, m_screen->root_depth);

    // Check SHM extension
    xcb_shm_query_version_reply_t* shm_reply = xcb_shm_query_version_reply(
        m_conn, xcb_shm_query_version(m_conn), nullptr);
    if (!shm_reply) {
        LOG_ERROR("SHM extension not available");
        shutdown();
        return false;
    }
    LOG_INFO("SHM extension version %d.%d", shm_reply->major_version, shm_reply->minor_version);
    free(shm_reply);

    if (!init_atoms()) {
        shutdown();
        return false;
    }

    init_composite();
    init_xfixes();
    init_randr();

    LOG_INFO("X11 capture initialized successfully");
    return true;
}

bool X11Capture::init_atoms() {
    m_atom_client_list = intern_atom(m_conn, "_NET_CLIENT_LIST");
    m_atom_wm_name = intern_atom(m_conn, "_NET_WM_NAME");
    m_atom_wm_pid = intern_atom(m_conn, "_NET_WM_PID");
    m_atom_utf8_string = intern_atom(m_conn, "UTF8_STRING");

    if (m_atom_client_list == XCB_ATOM_NONE || m_atom_utf8_string == XCB_ATOM_NONE) {
        LOG_ERROR("Failed to intern EWMH atoms");
        return false;
    }
    return true;
}

bool X11Capture::init_composite() {
    xcb_composite_query_version_reply_t* reply = xcb_composite_query_version_reply(
        m_conn, xcb_composite_query_version(m_conn, 0, 4), nullptr);

    if (reply) {
        LOG_INFO("Composite extension version %d.%d", reply->major_version, reply->minor_version);
        m_composite_available = true;
        free(reply);
        return true;
    }

    LOG_WARN("Composite extension not available, covered windows will capture what covers them");
    return false;
}

void X11Capture::init_xfixes() {
    xcb_xfixes_query_version_reply_t* reply = xcb_xfixes_query_version_reply(
        m_conn, xcb_xfixes_query_version(m_conn, 4, 0), nullptr);

    if (reply) {
        LOG_INFO("XFixes extension version %d.%d", reply->major_version, reply->minor_version);
        m_xfixes_available = true;
        free(reply);
        return;
    }

    LOG_WARN("XFixes extension not available, cursor will not be visible");
}

void X11Capture::init_randr() {
    const xcb_query_extension_reply_t* ext = xcb_get_extension_data(m_conn, &xcb_randr_id);
    if (!ext || !ext->present) {
        LOG_WARN("RandR extension not available, the whole screen is one source");
        return;
    }

    xcb_randr_query_version_reply_t* reply = xcb_randr_query_version_reply(
        m_conn, xcb_randr_query_version(m_conn, 1, 5), nullptr);
    if (reply && (reply->major_version > 1 || reply->minor_version >= 3)) {
        m_randr_available = true;
    } else {
        LOG_WARN("RandR older than 1.3, the whole screen is one source");
    }
    free(reply);
}

// One source per lit monitor, so a mirror pinned to one monitor can show
// another without filming itself
void X11Capture::add_display_sources(std::vector<CaptureSource>& out) {
    std::vector<DisplayDescriptor> displays;
    if (m_randr_available && query_randr_displays(m_conn, m_root, displays) && !displays.empty()) {
        Rect screen{0, 0, m_width, m_height};
        for (const DisplayDescriptor& display : displays) {
            if (!display.bounds.intersects(screen)) {
                continue;
            }
            CaptureSource source;
            source.id = display.id;
            source.kind = SourceKind::DISPLAY;
            source.title = "Display " + display.name;
            source.app_name = "X11";
            source.bounds = display.bounds;
            out.push_back(source);
        }
        return;
    }

    CaptureSource screen;
    screen.id = m_root;
    screen.kind = SourceKind::DISPLAY;
    screen.title = "Entire screen";
    screen.app_name = "X11";
    screen.bounds = Rect{0, 0, m_width, m_height};
    out.push_back(screen);
}

void X11Capture::shutdown() {
    std::lock_guard<std::mutex> lock(m_conn_mutex);
    if (m_conn) {
        xcb_disconnect(m_conn);
        m_conn = nullptr;
    }
    m_screen = nullptr;
    m_root = 0;
}

bool X11Capture::get_client_list(std::vector<xcb_window_t>& out) {
    std::vector<uint8_t> value;
    if (!read_property(m_conn, m_root, m_atom_client_list, XCB_ATOM_WINDOW, 4096, value)) {
        return false;
    }
    size_t count = value.size() / sizeof(xcb_window_t);
    out.resize(count);
    memcpy(out.data(), value.data(), count * sizeof(xcb_window_t));
    return true;
}

bool X11Capture::get_viewable_children(std::vector<xcb_window_t>& out) {
    xcb_query_tree_reply_t* tree = xcb_query_tree_reply(m_conn, xcb_query_tree(m_conn, m_root), nullptr);
    if (!tree) {
        return false;
    }
    xcb_window_t* children = xcb_query_tree_children(tree);
    int count = xcb_query_tree_children_length(tree);
    out.assign(children, children + count);
    free(tree);
    return true;
}

bool X11Capture::describe_window(xcb_window_t window, CaptureSource& out) {
    xcb_get_window_attributes_reply_t* attrs = xcb_get_window_attributes_reply(
        m_conn, xcb_get_window_attributes(m_conn, window), nullptr);
    if (!attrs) {
        return false;
    }
    bool viewable = attrs->map_state == XCB_MAP_STATE_VIEWABLE &&
                    attrs->_class != XCB_WINDOW_CLASS_INPUT_ONLY;
    free(attrs);
    if (!viewable) {
        return false;
    }

    int width = 0, height = 0, depth = 0;
    int x = 0, y = 0;
    if (!get_geometry(m_conn, window, width, height, depth) ||
        !translate_to_root(m_conn, window, m_root, x, y)) {
        return false;
    }

    out.id = window;
    out.kind = SourceKind::WINDOW;
    out.bounds = Rect{x, y, width, height};

    if (!read_string_property(m_conn, window, m_atom_wm_name, m_atom_utf8_string, out.title)) {
        read_string_property(m_conn, window, XCB_ATOM_WM_NAME, XCB_ATOM_STRING, out.title);
    }

    // WM_CLASS is "instance\0class\0"
    std::string wm_class;
    if (read_string_property(m_conn, window, XCB_ATOM_WM_CLASS, XCB_ATOM_STRING, wm_class)) {
        size_t split = wm_class.find('\0');
        std::string instance = wm_class.substr(0, split);
        out.owner_class = split == std::string::npos ? instance : wm_class.substr(split + 1);
        out.app_name = out.owner_class.empty() ? instance : out.owner_class;
    }
    if (out.app_name.empty()) {
        out.app_name = "Unknown";
    }

    std::vector<uint8_t> pid;
    if (read_property(m_conn, window, m_atom_wm_pid, XCB_ATOM_CARDINAL, 1, pid) &&
        pid.size() >= sizeof(uint32_t)) {
        memcpy(&out.owner_pid, pid.data(), sizeof(uint32_t));
    }

    return true;
}

bool X11Capture::enumerate_sources(std::vector<CaptureSource>& out) {
    std::lock_guard<std::mutex> lock(m_conn_mutex);
    out.clear();
    if (!m_conn) {
        LOG_ERROR("X11 capture not initialized");
        return false;
    }
    if (xcb_connection_has_error(m_conn)) {
        LOG_ERROR("X11 connection lost");
        return false;
    }

    std::vector<xcb_window_t> windows;
    if (!get_client_list(windows)) {
        LOG_WARN("_NET_CLIENT_LIST unavailable (no EWMH window manager?), using root children");
        if (!get_viewable_children(windows)) {
            LOG_ERROR("Failed to query X11 window tree");
            return false;
        }
    }

    add_display_sources(out);

    for (xcb_window_t window : windows) {
        CaptureSource source;
        if (describe_window(window, source)) {
            out.push_back(std::move(source));
        }
    }

    LOG_DEBUG("X11 enumeration: %zu windows, %zu candidates", windows.size(), out.size());
    return true;
}

bool X11Capture::capture_still(const CaptureSource& source, int max_width, int max_height,
                               bool show_cursor, Image& out) {
    std::lock_guard<std::mutex> lock(m_conn_mutex);
    if (!m_conn) {
        return false;
    }

    int width = 0, height = 0, depth = 0;
    if (!get_geometry(m_conn, source_drawable(source, m_root), width, height, depth)) {
        return false;
    }

    int src_x = 0;
    int src_y = 0;
    if (source.kind == SourceKind::DISPLAY) {
        src_x = source.bounds.x;
        src_y = source.bounds.y;
        width = std::min(source.bounds.width, width - src_x);
        height = std::min(source.bounds.height, height - src_y);
    }
    if (width <= 0 || height <= 0) {
        return false;
    }

    xcb_drawable_t drawable = source_drawable(source, m_root);
    xcb_pixmap_t pixmap = 0;
    bool redirected = false;
    if (source.kind == SourceKind::WINDOW && m_composite_available) {
        xcb_composite_redirect_window(m_conn, source.id, XCB_COMPOSITE_REDIRECT_AUTOMATIC);
        redirected = true;
        pixmap = xcb_generate_id(m_conn);
        xcb_generic_error_t* error = xcb_request_check(
            m_conn, xcb_composite_name_window_pixmap_checked(m_conn, source.id, pixmap));
        if (error) {
            free(error);
            pixmap = 0;
        } else {
            drawable = pixmap;
        }
    }

    xcb_get_image_reply_t* reply = xcb_get_image_reply(
        m_conn,
        xcb_get_image(m_conn, XCB_IMAGE_FORMAT_Z_PIXMAP, drawable,
                      static_cast<int16_t>(src_x), static_cast<int16_t>(src_y),
                      static_cast<uint16_t>(width), static_cast<uint16_t>(height), ~0),
        nullptr);

    if (pixmap) {
        xcb_free_pixmap(m_conn, pixmap);
    }
    if (redirected) {
        xcb_composite_unredirect_window(m_conn, source.id, XCB_COMPOSITE_REDIRECT_AUTOMATIC);
    }
    xcb_flush(m_conn);

    if (!reply) {
        return false;
    }

    uint8_t* data = xcb_get_image_data(reply);
    int length = xcb_get_image_data_length(reply);
    int stride = width * 4;

    if (show_cursor && m_xfixes_available && length >= stride * height) {
        int origin_x = src_x;
        int origin_y = src_y;
        if (source.kind == SourceKind::WINDOW) {
            translate_to_root(m_conn, source.id, m_root, origin_x, origin_y);
        }
        draw_cursor(m_conn, data, width, height, stride, origin_x, origin_y);
    }

    Image full;
    bool converted = convert_to_bgra(data, static_cast<size_t>(length), format_for_depth(reply->depth),
                                     width, height, stride, full);
    free(reply);
    if (!converted) {
        return false;
    }

    int thumb_width = 0, thumb_height = 0;
    fit_within(width, height, max_width, max_height, thumb_width, thumb_height);
    if (thumb_width <= 0 || thumb_height <= 0) {
        return false;
    }
    scale_image(full, thumb_width, thumb_height, out);
    return true;
}

std::unique_ptr<CaptureSubscription> X11Capture::subscribe(const CaptureSource& source,
                                                           const StreamConfig& config) {
    if (!m_conn) {
        LOG_ERROR("X11 capture not initialized");
        return nullptr;
    }
    if (config.format != PixelFormat::BGRA) {
        LOG_WARN("X11 capture delivers BGRA/BGRx, ignoring requested %s", pixel_format_name(config.format));
    }
    return std::make_unique<X11Subscription>(m_display_name, source, config);
}

}  // namespace screen_mirror
