#include "capture_backend.hpp"
#include "util/logger.hpp"

#include <cstdlib>

#ifdef HAVE_X11
#include "capture/x11_capture.hpp"
#endif

#ifdef HAVE_PIPEWIRE
#include "capture/pipewire_capture.hpp"
#endif

namespace screen_mirror {

static CaptureBackendType detect_session_backend() {
    const char* wayland_display = std::getenv("WAYLAND_DISPLAY");
    const char* x11_display = std::getenv("DISPLAY");

    if (wayland_display && wayland_display[0] != '\0') {
#ifdef HAVE_PIPEWIRE
        LOG_INFO("Detected Wayland session, using PipeWire capture");
        return CaptureBackendType::PIPEWIRE;
#else
        LOG_WARN("Wayland detected but PipeWire not available, falling back to X11");
        return CaptureBackendType::X11;
#endif
    }

    if (x11_display && x11_display[0] != '\0') {
#ifdef HAVE_X11
        LOG_INFO("Detected X11 session, using X11 capture");
        return CaptureBackendType::X11;
#else
        LOG_WARN("X11 detected but X11 capture not available, trying PipeWire");
        return CaptureBackendType::PIPEWIRE;
#endif
    }

    LOG_WARN("No display session detected (WAYLAND_DISPLAY and DISPLAY not set), trying X11");
    return CaptureBackendType::X11;
}

std::unique_ptr<CaptureBackend> create_capture_backend(CaptureBackendType type,
                                                       const MirrorConfig& config) {
    if (type == CaptureBackendType::AUTO) {
        type = detect_session_backend();
    }

    std::unique_ptr<CaptureBackend> backend;
    const char* display = config.display.empty() ? nullptr : config.display.c_str();

    switch (type) {
        case CaptureBackendType::X11:
#ifdef HAVE_X11
            LOG_INFO("Creating X11 capture backend");
            backend = std::make_unique<X11Capture>();
            break;
#else
            LOG_ERROR("X11 capture not compiled in");
            return nullptr;
#endif

        case CaptureBackendType::PIPEWIRE:
#ifdef HAVE_PIPEWIRE
            LOG_INFO("Creating PipeWire capture backend");
            backend = std::make_unique<PipeWireCapture>(config.show_cursor);
            display = nullptr;  // PipeWire doesn't use display string
            break;
#else
            LOG_ERROR("PipeWire capture not compiled in");
            return nullptr;
#endif

        default:
            LOG_ERROR("Unknown capture backend type");
            return nullptr;
    }

    if (!backend->init(display)) {
        LOG_ERROR("Failed to initialize %s capture backend", backend->get_name());
        return nullptr;
    }
    return backend;
}

}  // namespace screen_mirror
