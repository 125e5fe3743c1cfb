#pragma once

#include "display_directory.hpp"
#include <xcb/xcb.h>

namespace screen_mirror {

// Connected outputs driven by a CRTC on conn, in RandR order. The first one
// is marked primary when the server has no primary output set. Needs
// RandR 1.3 on conn.
bool query_randr_displays(xcb_connection_t* conn, xcb_window_t root, std::vector<DisplayDescriptor>& out);

// Displays are the RandR outputs that are connected and lit by a CRTC
class X11DisplayBackend : public DisplayBackend {
public:
    X11DisplayBackend() = default;
    ~X11DisplayBackend() override;

    bool init(const char* display_name = nullptr) override;
    void shutdown() override;

    bool enumerate(std::vector<DisplayDescriptor>& out) override;

    int get_event_fd() const override;
    bool process_events() override;
    bool process_queued_events() override;

    const char* get_name() const override { return "RandR"; }

private:
    bool drain_events(bool queued_only);

    xcb_connection_t* m_conn = nullptr;
    xcb_window_t m_root = 0;
    uint8_t m_randr_event_base = 0;
};

}  // namespace screen_mirror
