#pragma once

#include "flip_state.hpp"
#include "util/rect.hpp"
#include "video/pixels.hpp"

#include <cstdint>
#include <functional>
#include <memory>

namespace screen_mirror {

struct SurfacePlacement {
    bool pinned = false;   // Cover bounds exactly, borderless, not movable
    Rect bounds;           // Ignored when not pinned: centered default size
};

// The newest relayed image together with the flips it is drawn with
struct PresentedFrame {
    std::shared_ptr<const Image> image;   // null until the first frame
    uint64_t sequence = 0;
    FlipState flip;
};

// An output window showing relayed frames. All calls on the loop thread.
class MirrorSurface {
public:
    using FlipToggleCallback = std::function<void(FlipAxis)>;
    using CloseRequestCallback = std::function<void()>;

    virtual ~MirrorSurface() = default;

    virtual bool open(const SurfacePlacement& placement, bool controls_visible) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    // Show frame with its flips applied. The surface keeps the image
    // reference for repaints.
    virtual void present(const PresentedFrame& frame) = 0;

    // The user clicked a flip toggle
    void set_flip_toggle_callback(FlipToggleCallback callback) { m_on_flip_toggle = std::move(callback); }

    // The user or the window manager asked to close
    void set_close_request_callback(CloseRequestCallback callback) { m_on_close_request = std::move(callback); }

protected:
    MirrorSurface() = default;

    MirrorSurface(const MirrorSurface&) = delete;
    MirrorSurface& operator=(const MirrorSurface&) = delete;

    FlipToggleCallback m_on_flip_toggle;
    CloseRequestCallback m_on_close_request;
};

using SurfaceFactory = std::function<std::unique_ptr<MirrorSurface>()>;

}  // namespace screen_mirror
