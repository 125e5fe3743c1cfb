#pragma once

#include "display/display_directory.hpp"
#include "mirror_surface.hpp"
#include "session/stream_session.hpp"

#include <functional>
#include <memory>

namespace screen_mirror {

struct MirrorWindowState {
    uint32_t display_id = NO_DISPLAY;   // NO_DISPLAY = centered default window
    FlipState flip;
    bool controls_visible = false;
};

// A screen source whose area includes the pinned surface films its own
// output and shows an endless tunnel
bool captures_own_output(const CaptureSource& source, const SurfacePlacement& placement);

// Owns the one mirror surface. Closing it always stops the stream session.
class MirrorCoordinator {
public:
    using ClosedCallback = std::function<void()>;

    MirrorCoordinator(StreamSession& session, DisplayDirectory& displays, SurfaceFactory factory);
    ~MirrorCoordinator();

    MirrorCoordinator(const MirrorCoordinator&) = delete;
    MirrorCoordinator& operator=(const MirrorCoordinator&) = delete;

    // Close any open mirror, then open one for state
    bool open(const MirrorWindowState& state);

    // Close the surface and stop the session. Safe when nothing is open.
    void close();

    bool is_open() const { return m_surface != nullptr; }

    void set_flip(FlipState flip);
    void toggle_flip(FlipAxis axis);

    const MirrorWindowState& get_state() const { return m_state; }

    // Pinned to the display if it is listed, else the primary, else centered
    SurfacePlacement resolve_placement(uint32_t display_id);

    void set_closed_callback(ClosedCallback callback) { m_on_closed = std::move(callback); }

private:
    void present_latest();

    StreamSession& m_session;
    DisplayDirectory& m_displays;
    SurfaceFactory m_factory;

    std::unique_ptr<MirrorSurface> m_surface;
    MirrorWindowState m_state;
    int m_relay_subscription = 0;

    ClosedCallback m_on_closed;
};

}  // namespace screen_mirror
