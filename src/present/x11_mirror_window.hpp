#pragma once

#include "controls_overlay.hpp"
#include "focus_hold.hpp"
#include "mirror_surface.hpp"
#include "util/event_loop.hpp"

#include <cstdint>
#include <string>
#include <vector>
#include <xcb/xcb.h>

namespace screen_mirror {

// Borderless xcb window. Pinned placement uses override-redirect so the
// window manager cannot move or decorate it.
class X11MirrorWindow : public MirrorSurface {
public:
    X11MirrorWindow(EventLoop& loop, const std::string& display_name);
    ~X11MirrorWindow() override;

    bool open(const SurfacePlacement& placement, bool controls_visible) override;
    void close() override;
    bool is_open() const override { return m_window != 0; }

    void present(const PresentedFrame& frame) override;

private:
    bool connect();
    void disconnect();
    void init_atoms();
    void init_close_keys();
    void set_window_properties(const SurfacePlacement& placement, int x, int y);

    void on_events();
    void handle_event(xcb_generic_event_t* event);
    void update_hover(bool hovering);
    void take_focus();
    void release_focus();
    void redraw();
    void put_buffer();

    void start_fade_timer();
    void stop_fade_timer();
    void on_fade_tick();

    static uint64_t now_us();

    EventLoop& m_loop;
    std::string m_display_name;

    xcb_connection_t* m_conn = nullptr;
    xcb_screen_t* m_screen = nullptr;
    xcb_window_t m_window = 0;
    xcb_gcontext_t m_gc = 0;

    xcb_atom_t m_atom_wm_protocols = XCB_ATOM_NONE;
    xcb_atom_t m_atom_wm_delete = XCB_ATOM_NONE;
    xcb_atom_t m_atom_wm_pid = XCB_ATOM_NONE;
    xcb_atom_t m_atom_motif_hints = XCB_ATOM_NONE;
    xcb_atom_t m_atom_wm_state = XCB_ATOM_NONE;
    xcb_atom_t m_atom_wm_state_above = XCB_ATOM_NONE;
    std::vector<xcb_keycode_t> m_close_keys;

    void* m_poll_handle = nullptr;
    void* m_fade_timer = nullptr;
    bool m_close_requested = false;

    // The window manager never focuses a pinned window
    bool m_pinned = false;
    FocusHold m_focus;

    int m_width = 0;
    int m_height = 0;

    PresentedFrame m_frame;
    ControlsOverlay m_controls;
    Image m_buffer;
};

}  // namespace screen_mirror
