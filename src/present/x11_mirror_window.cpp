#include "x11_mirror_window.hpp"
#include "frame_renderer.hpp"
#include "screen_mirror/config.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace screen_mirror {

static const char* WINDOW_TITLE = "Screen Mirror";

// Keysyms (X11/keysymdef.h)
static const xcb_keysym_t KEYSYM_ESCAPE = 0xff1b;
static const xcb_keysym_t KEYSYM_Q = 0x0071;

// _MOTIF_WM_HINTS: flags, functions, decorations, input_mode, status
static const uint32_t MOTIF_HINTS_DECORATIONS = 1u << 1;

// WM_NORMAL_HINTS flags
static const uint32_t SIZE_HINT_US_POSITION = 1u << 0;
static const uint32_t SIZE_HINT_US_SIZE = 1u << 1;

static const uint64_t FADE_TICK_MS = 16;

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

X11MirrorWindow::X11MirrorWindow(EventLoop& loop, const std::string& display_name)
    : m_loop(loop)
    , m_display_name(display_name) {
}

X11MirrorWindow::~X11MirrorWindow() {
    close();
}

uint64_t X11MirrorWindow::now_us() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

bool X11MirrorWindow::connect() {
    int screen_num = 0;
    m_conn = xcb_connect(m_display_name.empty() ? nullptr : m_display_name.c_str(), &screen_num);
    if (xcb_connection_has_error(m_conn)) {
        LOG_ERROR("Failed to connect to X server for the mirror window");
        xcb_disconnect(m_conn);
        m_conn = nullptr;
        return false;
    }

    const xcb_setup_t* setup = xcb_get_setup(m_conn);
    xcb_screen_iterator_t iter = xcb_setup_roots_iterator(setup);
    for (int i = 0; i < screen_num; i++) {
        xcb_screen_next(&iter);
    }
    m_screen = iter.data;

    if (m_screen->root_depth != 24 && m_screen->root_depth != 32) {
        LOG_ERROR("Unsupported root depth %u for the mirror window", m_screen->root_depth);
        disconnect();
        return false;
    }

    init_atoms();
    init_close_keys();
    return true;
}

void X11MirrorWindow::disconnect() {
    if (m_conn) {
        xcb_disconnect(m_conn);
        m_conn = nullptr;
        m_screen = nullptr;
    }
}

void X11MirrorWindow::init_atoms() {
    m_atom_wm_protocols = intern_atom(m_conn, "WM_PROTOCOLS");
    m_atom_wm_delete = intern_atom(m_conn, "WM_DELETE_WINDOW");
    m_atom_wm_pid = intern_atom(m_conn, "_NET_WM_PID");
    m_atom_motif_hints = intern_atom(m_conn, "_MOTIF_WM_HINTS");
    m_atom_wm_state = intern_atom(m_conn, "_NET_WM_STATE");
    m_atom_wm_state_above = intern_atom(m_conn, "_NET_WM_STATE_ABOVE");
}

void X11MirrorWindow::init_close_keys() {
    m_close_keys.clear();

    const xcb_setup_t* setup = xcb_get_setup(m_conn);
    xcb_keycode_t min_keycode = setup->min_keycode;
    xcb_keycode_t max_keycode = setup->max_keycode;

    xcb_get_keyboard_mapping_reply_t* reply = xcb_get_keyboard_mapping_reply(
        m_conn,
        xcb_get_keyboard_mapping(m_conn, min_keycode, static_cast<uint8_t>(max_keycode - min_keycode + 1)),
        nullptr);
    if (!reply) {
        LOG_WARN("Failed to read keyboard mapping, keyboard close disabled");
        return;
    }

    const xcb_keysym_t* keysyms = xcb_get_keyboard_mapping_keysyms(reply);
    int per_keycode = reply->keysyms_per_keycode;
    int count = xcb_get_keyboard_mapping_keysyms_length(reply);
    for (int i = 0; per_keycode > 0 && i + per_keycode <= count; i += per_keycode) {
        if (keysyms[i] == KEYSYM_ESCAPE || keysyms[i] == KEYSYM_Q) {
            m_close_keys.push_back(static_cast<xcb_keycode_t>(min_keycode + i / per_keycode));
        }
    }
    free(reply);
}

bool X11MirrorWindow::open(const SurfacePlacement& placement, bool controls_visible) {
    close();

    if (!connect()) {
        return false;
    }

    int x, y;
    if (placement.pinned && !placement.bounds.empty()) {
        x = placement.bounds.x;
        y = placement.bounds.y;
        m_width = placement.bounds.width;
        m_height = placement.bounds.height;
    } else {
        m_width = std::min<int>(DEFAULT_MIRROR_WIDTH, m_screen->width_in_pixels);
        m_height = std::min<int>(DEFAULT_MIRROR_HEIGHT, m_screen->height_in_pixels);
        x = (m_screen->width_in_pixels - m_width) / 2;
        y = (m_screen->height_in_pixels - m_height) / 2;
    }
    bool pinned = placement.pinned && !placement.bounds.empty();
    m_pinned = pinned;

    m_window = xcb_generate_id(m_conn);
    uint32_t mask = XCB_CW_BACK_PIXEL | XCB_CW_OVERRIDE_REDIRECT | XCB_CW_EVENT_MASK;
    uint32_t values[3] = {
        m_screen->black_pixel,
        pinned ? 1u : 0u,
        XCB_EVENT_MASK_EXPOSURE | XCB_EVENT_MASK_STRUCTURE_NOTIFY |
        XCB_EVENT_MASK_ENTER_WINDOW | XCB_EVENT_MASK_LEAVE_WINDOW |
        XCB_EVENT_MASK_BUTTON_PRESS | XCB_EVENT_MASK_KEY_PRESS
    };

    xcb_void_cookie_t cookie = xcb_create_window_checked(
        m_conn, XCB_COPY_FROM_PARENT, m_window, m_screen->root,
        static_cast<int16_t>(x), static_cast<int16_t>(y),
        static_cast<uint16_t>(m_width), static_cast<uint16_t>(m_height), 0,
        XCB_WINDOW_CLASS_INPUT_OUTPUT, m_screen->root_visual, mask, values);
    xcb_generic_error_t* error = xcb_request_check(m_conn, cookie);
    if (error) {
        LOG_ERROR("Failed to create mirror window (error %u)", error->error_code);
        free(error);
        m_window = 0;
        disconnect();
        return false;
    }

    m_gc = xcb_generate_id(m_conn);
    xcb_create_gc(m_conn, m_gc, m_window, 0, nullptr);

    set_window_properties(placement, x, y);

    m_controls = ControlsOverlay();
    m_controls.set_enabled(controls_visible);
    m_controls.layout(m_width, m_height);

    xcb_map_window(m_conn, m_window);
    if (pinned) {
        // Override-redirect windows are not raised by the WM
        uint32_t stack_mode = XCB_STACK_MODE_ABOVE;
        xcb_configure_window(m_conn, m_window, XCB_CONFIG_WINDOW_STACK_MODE, &stack_mode);
    }
    xcb_flush(m_conn);

    m_poll_handle = m_loop.add_poll(xcb_get_file_descriptor(m_conn), [this]() { on_events(); });
    if (!m_poll_handle) {
        LOG_ERROR("Failed to watch the mirror window connection");
        close();
        return false;
    }

    LOG_INFO("Mirror window 0x%x %s at %d,%d %dx%d", m_window, pinned ? "pinned" : "centered",
             x, y, m_width, m_height);
    return true;
}

void X11MirrorWindow::set_window_properties(const SurfacePlacement& placement, int x, int y) {
    xcb_change_property(m_conn, XCB_PROP_MODE_REPLACE, m_window, XCB_ATOM_WM_NAME, XCB_ATOM_STRING, 8,
                        static_cast<uint32_t>(strlen(WINDOW_TITLE)), WINDOW_TITLE);

    // Instance and class, both NUL terminated
    std::string wm_class = std::string(APP_WM_CLASS) + '\0' + APP_WM_CLASS + '\0';
    xcb_change_property(m_conn, XCB_PROP_MODE_REPLACE, m_window, XCB_ATOM_WM_CLASS, XCB_ATOM_STRING, 8,
                        static_cast<uint32_t>(wm_class.size()), wm_class.data());

    uint32_t pid = static_cast<uint32_t>(getpid());
    if (m_atom_wm_pid != XCB_ATOM_NONE) {
        xcb_change_property(m_conn, XCB_PROP_MODE_REPLACE, m_window, m_atom_wm_pid, XCB_ATOM_CARDINAL, 32, 1, &pid);
    }

    if (m_atom_wm_protocols != XCB_ATOM_NONE && m_atom_wm_delete != XCB_ATOM_NONE) {
        xcb_change_property(m_conn, XCB_PROP_MODE_REPLACE, m_window, m_atom_wm_protocols, XCB_ATOM_ATOM, 32,
                            1, &m_atom_wm_delete);
    }

    if (m_atom_motif_hints != XCB_ATOM_NONE) {
        uint32_t hints[5] = {MOTIF_HINTS_DECORATIONS, 0, 0, 0, 0};
        xcb_change_property(m_conn, XCB_PROP_MODE_REPLACE, m_window, m_atom_motif_hints, m_atom_motif_hints, 32,
                            5, hints);
    }

    if (m_atom_wm_state != XCB_ATOM_NONE && m_atom_wm_state_above != XCB_ATOM_NONE) {
        xcb_change_property(m_conn, XCB_PROP_MODE_REPLACE, m_window, m_atom_wm_state, XCB_ATOM_ATOM, 32,
                            1, &m_atom_wm_state_above);
    }

    if (!placement.pinned) {
        // Ask the WM to honor the centered position
        uint32_t size_hints[18] = {0};
        size_hints[0] = SIZE_HINT_US_POSITION | SIZE_HINT_US_SIZE;
        size_hints[1] = static_cast<uint32_t>(x);
        size_hints[2] = static_cast<uint32_t>(y);
        size_hints[3] = static_cast<uint32_t>(m_width);
        size_hints[4] = static_cast<uint32_t>(m_height);
        xcb_change_property(m_conn, XCB_PROP_MODE_REPLACE, m_window, XCB_ATOM_WM_NORMAL_HINTS,
                            XCB_ATOM_WM_SIZE_HINTS, 32, 18, size_hints);
    }
}

void X11MirrorWindow::close() {
    stop_fade_timer();
    release_focus();
    if (m_poll_handle) {
        m_loop.remove_poll(m_poll_handle);
        m_poll_handle = nullptr;
    }
    if (m_conn && m_window) {
        if (m_gc) {
            xcb_free_gc(m_conn, m_gc);
            m_gc = 0;
        }
        xcb_destroy_window(m_conn, m_window);
        xcb_flush(m_conn);
        LOG_INFO("Mirror window 0x%x closed", m_window);
    }
    m_window = 0;
    m_pinned = false;
    m_frame = PresentedFrame();
    m_buffer = Image();
    disconnect();
}

void X11MirrorWindow::present(const PresentedFrame& frame) {
    m_frame = frame;
    redraw();
}

void X11MirrorWindow::on_events() {
    if (!m_conn) {
        return;
    }

    xcb_generic_event_t* event;
    while (m_conn && (event = xcb_poll_for_event(m_conn)) != nullptr) {
        handle_event(event);
        free(event);
    }

    if (m_conn && xcb_connection_has_error(m_conn)) {
        LOG_ERROR("Lost X server connection of the mirror window");
        m_close_requested = true;
    }

    if (m_close_requested) {
        m_close_requested = false;
        // The handler may destroy this surface; nothing below may touch it
        CloseRequestCallback callback = m_on_close_request;
        if (callback) {
            callback();
        } else {
            close();
        }
    }
}

void X11MirrorWindow::handle_event(xcb_generic_event_t* event) {
    switch (event->response_type & ~0x80) {
        case XCB_EXPOSE: {
            auto* expose = reinterpret_cast<xcb_expose_event_t*>(event);
            if (expose->count == 0) {
                redraw();
            }
            break;
        }
        case XCB_CONFIGURE_NOTIFY: {
            auto* configure = reinterpret_cast<xcb_configure_notify_event_t*>(event);
            if (configure->width != m_width || configure->height != m_height) {
                m_width = configure->width;
                m_height = configure->height;
                m_controls.layout(m_width, m_height);
                redraw();
            }
            break;
        }
        case XCB_ENTER_NOTIFY:
            if (m_pinned) {
                take_focus();
            }
            update_hover(true);
            break;
        case XCB_LEAVE_NOTIFY: {
            auto* leave = reinterpret_cast<xcb_leave_notify_event_t*>(event);
            // Entering a child is not leaving
            if (leave->detail != XCB_NOTIFY_DETAIL_INFERIOR) {
                release_focus();
                update_hover(false);
            }
            break;
        }
        case XCB_BUTTON_PRESS: {
            auto* press = reinterpret_cast<xcb_button_press_event_t*>(event);
            FlipAxis axis;
            if (press->detail == XCB_BUTTON_INDEX_1 &&
                m_controls.hit_test(press->event_x, press->event_y, axis) && m_on_flip_toggle) {
                m_on_flip_toggle(axis);
            }
            break;
        }
        case XCB_KEY_PRESS: {
            auto* key = reinterpret_cast<xcb_key_press_event_t*>(event);
            if (std::find(m_close_keys.begin(), m_close_keys.end(), key->detail) != m_close_keys.end()) {
                m_close_requested = true;
            }
            break;
        }
        case XCB_CLIENT_MESSAGE: {
            auto* message = reinterpret_cast<xcb_client_message_event_t*>(event);
            if (message->type == m_atom_wm_protocols && message->data.data32[0] == m_atom_wm_delete) {
                m_close_requested = true;
            }
            break;
        }
        default:
            break;
    }
}

void X11MirrorWindow::update_hover(bool hovering) {
    if (!m_controls.is_enabled()) {
        return;
    }
    m_controls.set_hovering(hovering, now_us());
    start_fade_timer();
    redraw();
}

// Escape and q only reach a pinned window while it holds the focus
void X11MirrorWindow::take_focus() {
    xcb_get_input_focus_reply_t* reply = xcb_get_input_focus_reply(m_conn, xcb_get_input_focus(m_conn), nullptr);
    xcb_window_t previous = reply ? reply->focus : XCB_NONE;
    free(reply);

    if (!m_focus.take(m_window, previous)) {
        return;
    }
    xcb_set_input_focus(m_conn, XCB_INPUT_FOCUS_POINTER_ROOT, m_window, XCB_CURRENT_TIME);
    xcb_flush(m_conn);
    LOG_DEBUG("Mirror window 0x%x took keyboard focus from 0x%x", m_window, previous);
}

void X11MirrorWindow::release_focus() {
    uint32_t restore = 0;
    if (!m_focus.release(restore) || !m_conn) {
        return;
    }
    // A previous owner that is gone by now only yields an ignored error
    xcb_window_t focus = restore ? restore : static_cast<xcb_window_t>(XCB_INPUT_FOCUS_POINTER_ROOT);
    xcb_set_input_focus(m_conn, XCB_INPUT_FOCUS_POINTER_ROOT, focus, XCB_CURRENT_TIME);
    xcb_flush(m_conn);
}

void X11MirrorWindow::redraw() {
    if (!m_conn || !m_window) {
        return;
    }
    render_frame(m_frame.image.get(), m_frame.flip, m_width, m_height, m_buffer);
    m_controls.draw(m_buffer, m_frame.flip, now_us());
    put_buffer();
}

void X11MirrorWindow::put_buffer() {
    if (m_buffer.empty()) {
        return;
    }

    // Split into bands that fit a single request
    uint32_t max_request_bytes = xcb_get_maximum_request_length(m_conn) * 4;
    uint32_t header_bytes = sizeof(xcb_put_image_request_t);
    int stride = m_buffer.stride();
    int rows_per_band = static_cast<int>((max_request_bytes - header_bytes) / static_cast<uint32_t>(stride));
    if (rows_per_band <= 0) {
        LOG_ERROR("Mirror window row of %d bytes exceeds the X request size", stride);
        return;
    }

    for (int y = 0; y < m_buffer.height; y += rows_per_band) {
        int rows = std::min(rows_per_band, m_buffer.height - y);
        xcb_put_image(m_conn, XCB_IMAGE_FORMAT_Z_PIXMAP, m_window, m_gc,
                      static_cast<uint16_t>(m_buffer.width), static_cast<uint16_t>(rows),
                      0, static_cast<int16_t>(y), 0, m_screen->root_depth,
                      static_cast<uint32_t>(rows * stride), m_buffer.row(y));
    }
    xcb_flush(m_conn);
}

void X11MirrorWindow::start_fade_timer() {
    if (m_fade_timer) {
        return;
    }
    m_fade_timer = m_loop.add_timer(FADE_TICK_MS, FADE_TICK_MS, [this]() { on_fade_tick(); });
}

void X11MirrorWindow::stop_fade_timer() {
    if (m_fade_timer) {
        m_loop.remove_timer(m_fade_timer);
        m_fade_timer = nullptr;
    }
}

void X11MirrorWindow::on_fade_tick() {
    bool animating = m_controls.is_animating(now_us());
    redraw();
    if (!animating) {
        stop_fade_timer();
    }
}

}  // namespace screen_mirror
