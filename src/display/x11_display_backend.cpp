#include "x11_display_backend.hpp"
#include "util/logger.hpp"

#include <xcb/randr.h>
#include <cstdlib>
#include <string>

namespace screen_mirror {

X11DisplayBackend::~X11DisplayBackend() {
    shutdown();
}

bool X11DisplayBackend::init(const char* display_name) {
    int screen_num = 0;
    m_conn = xcb_connect(display_name, &screen_num);
    if (xcb_connection_has_error(m_conn)) {
        LOG_ERROR("Failed to connect to X server for display enumeration");
        xcb_disconnect(m_conn);
        m_conn = nullptr;
        return false;
    }

    const xcb_setup_t* setup = xcb_get_setup(m_conn);
    xcb_screen_iterator_t iter = xcb_setup_roots_iterator(setup);
    for (int i = 0; i < screen_num; i++) {
        xcb_screen_next(&iter);
    }
    m_root = iter.data->root;

    const xcb_query_extension_reply_t* ext = xcb_get_extension_data(m_conn, &xcb_randr_id);
    if (!ext || !ext->present) {
        LOG_ERROR("RandR extension not available");
        shutdown();
        return false;
    }
    m_randr_event_base = ext->first_event;

    // Screen resources "current" and output primary need 1.3
    xcb_randr_query_version_reply_t* version = xcb_randr_query_version_reply(
        m_conn, xcb_randr_query_version(m_conn, 1, 5), nullptr);
    if (!version || (version->major_version == 1 && version->minor_version < 3)) {
        LOG_ERROR("RandR 1.3 or newer required");
        free(version);
        shutdown();
        return false;
    }
    LOG_INFO("RandR %u.%u", version->major_version, version->minor_version);
    free(version);

    xcb_randr_select_input(m_conn, m_root,
                           XCB_RANDR_NOTIFY_MASK_SCREEN_CHANGE |
                           XCB_RANDR_NOTIFY_MASK_CRTC_CHANGE |
                           XCB_RANDR_NOTIFY_MASK_OUTPUT_CHANGE);
    xcb_flush(m_conn);
    return true;
}

void X11DisplayBackend::shutdown() {
    if (m_conn) {
        xcb_disconnect(m_conn);
        m_conn = nullptr;
    }
}

bool query_randr_displays(xcb_connection_t* conn, xcb_window_t root, std::vector<DisplayDescriptor>& out) {
    out.clear();

    xcb_randr_get_screen_resources_current_reply_t* res = xcb_randr_get_screen_resources_current_reply(
        conn, xcb_randr_get_screen_resources_current(conn, root), nullptr);
    if (!res) {
        LOG_ERROR("Failed to get RandR screen resources");
        return false;
    }

    xcb_randr_output_t primary = XCB_NONE;
    xcb_randr_get_output_primary_reply_t* primary_reply = xcb_randr_get_output_primary_reply(
        conn, xcb_randr_get_output_primary(conn, root), nullptr);
    if (primary_reply) {
        primary = primary_reply->output;
        free(primary_reply);
    }

    xcb_timestamp_t timestamp = res->config_timestamp;
    int count = xcb_randr_get_screen_resources_current_outputs_length(res);
    xcb_randr_output_t* outputs = xcb_randr_get_screen_resources_current_outputs(res);

    for (int i = 0; i < count; i++) {
        xcb_randr_get_output_info_reply_t* info = xcb_randr_get_output_info_reply(
            conn, xcb_randr_get_output_info(conn, outputs[i], timestamp), nullptr);
        if (!info) {
            continue;
        }
        if (info->connection != XCB_RANDR_CONNECTION_CONNECTED || info->crtc == XCB_NONE) {
            free(info);
            continue;
        }

        xcb_randr_get_crtc_info_reply_t* crtc = xcb_randr_get_crtc_info_reply(
            conn, xcb_randr_get_crtc_info(conn, info->crtc, timestamp), nullptr);
        if (!crtc || crtc->width == 0 || crtc->height == 0) {
            free(crtc);
            free(info);
            continue;
        }

        DisplayDescriptor display;
        display.id = outputs[i];
        int name_len = xcb_randr_get_output_info_name_length(info);
        const uint8_t* name = xcb_randr_get_output_info_name(info);
        if (name_len > 0) {
            display.name.assign(reinterpret_cast<const char*>(name), static_cast<size_t>(name_len));
        } else {
            display.name = "Display " + std::to_string(out.size() + 1);
        }
        display.is_primary = outputs[i] == primary;
        display.bounds = Rect{crtc->x, crtc->y, crtc->width, crtc->height};
        out.push_back(display);

        free(crtc);
        free(info);
    }
    free(res);

    // No primary set: the first output is where the WM puts new windows
    bool has_primary = false;
    for (const DisplayDescriptor& display : out) {
        has_primary = has_primary || display.is_primary;
    }
    if (!has_primary && !out.empty()) {
        out[0].is_primary = true;
    }

    return true;
}

bool X11DisplayBackend::enumerate(std::vector<DisplayDescriptor>& out) {
    if (!m_conn) {
        out.clear();
        return false;
    }
    if (!query_randr_displays(m_conn, m_root, out)) {
        return false;
    }
    LOG_DEBUG("Enumerated %zu displays", out.size());
    return true;
}

int X11DisplayBackend::get_event_fd() const {
    return m_conn ? xcb_get_file_descriptor(m_conn) : -1;
}

bool X11DisplayBackend::process_events() {
    return drain_events(false);
}

// Replies waited on during enumerate() leave later events in xcb's queue
// without the fd becoming readable again
bool X11DisplayBackend::process_queued_events() {
    return drain_events(true);
}

bool X11DisplayBackend::drain_events(bool queued_only) {
    if (!m_conn) {
        return false;
    }

    bool changed = false;
    xcb_generic_event_t* event;
    while ((event = queued_only ? xcb_poll_for_queued_event(m_conn) : xcb_poll_for_event(m_conn)) != nullptr) {
        uint8_t type = event->response_type & ~0x80;
        if (type == m_randr_event_base + XCB_RANDR_SCREEN_CHANGE_NOTIFY ||
            type == m_randr_event_base + XCB_RANDR_NOTIFY) {
            changed = true;
        }
        free(event);
    }

    if (xcb_connection_has_error(m_conn)) {
        LOG_ERROR("Lost X server connection used for display changes");
        shutdown();
    }
    return changed;
}

}  // namespace screen_mirror
