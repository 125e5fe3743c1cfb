#pragma once

#include "capture_backend.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <xcb/xcb.h>

namespace screen_mirror {

// X11 capture through xcb. Windows come from the EWMH client list and are
// read from their Composite pixmap. Each RandR monitor is a DISPLAY source
// (id = output XID) read from its area of the root window; without RandR
// the whole root is one source.
class X11Capture : public CaptureBackend {
public:
    X11Capture();
    ~X11Capture() override;

    // Initialize capture for the given display
    bool init(const char* display_name = nullptr) override;

    // Shutdown and cleanup
    void shutdown() override;

    bool enumerate_sources(std::vector<CaptureSource>& out) override;

    bool capture_still(const CaptureSource& source, int max_width, int max_height,
                       bool show_cursor, Image& out) override;

    std::unique_ptr<CaptureSubscription> subscribe(const CaptureSource& source,
                                                   const StreamConfig& config) override;

    // Check if initialized
    bool is_initialized() const override { return m_conn != nullptr; }

    const char* get_name() const override { return "X11"; }

    // Get screen dimensions
    int get_width() const { return m_width; }
    int get_height() const { return m_height; }

private:
    bool init_atoms();
    bool init_composite();
    void init_xfixes();
    void init_randr();

    void add_display_sources(std::vector<CaptureSource>& out);

    bool get_client_list(std::vector<xcb_window_t>& out);
    bool get_viewable_children(std::vector<xcb_window_t>& out);
    bool describe_window(xcb_window_t window, CaptureSource& out);

    xcb_connection_t* m_conn = nullptr;
    xcb_screen_t* m_screen = nullptr;
    xcb_window_t m_root = 0;
    std::string m_display_name;

    int m_width = 0;
    int m_height = 0;

    xcb_atom_t m_atom_client_list = XCB_ATOM_NONE;
    xcb_atom_t m_atom_wm_name = XCB_ATOM_NONE;
    xcb_atom_t m_atom_wm_pid = XCB_ATOM_NONE;
    xcb_atom_t m_atom_utf8_string = XCB_ATOM_NONE;

    bool m_composite_available = false;
    bool m_xfixes_available = false;
    bool m_randr_available = false;

    // Enumeration and stills run on the catalog thread
    std::mutex m_conn_mutex;
};

}  // namespace screen_mirror
