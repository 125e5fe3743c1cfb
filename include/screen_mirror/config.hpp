#pragma once

#include <cstdint>
#include <string>

namespace screen_mirror {

enum class CaptureBackendType {
    AUTO,       // Wayland session -> PipeWire, X11 session -> X11
    X11,        // xcb window/screen capture
    PIPEWIRE    // xdg-desktop-portal ScreenCast + PipeWire
};

// Sentinel ids. X11 windows, RandR outputs and PipeWire nodes are never 0.
constexpr uint32_t NO_SOURCE = 0;
constexpr uint32_t NO_DISPLAY = 0;

struct MirrorConfig {
    // Session
    std::string display;   // X11 display name (empty = $DISPLAY)
    CaptureBackendType capture_backend = CaptureBackendType::AUTO;

    // Stream
    int capture_fps = 60;      // Frame-rate cap
    int scale_factor = 2;      // Output size = source bounds * scale_factor
    int queue_depth = 5;       // Frames the delivery path may hold before dropping the oldest
    bool show_cursor = false;

    // Source catalog
    int min_source_width = 100;   // Sources must be strictly larger
    int min_source_height = 100;
    int thumbnail_width = 400;
    int thumbnail_height = 300;

    // Mirror surface
    uint32_t source_id = NO_SOURCE;        // Source to mirror at startup
    uint32_t target_display = NO_DISPLAY;  // NO_DISPLAY = resolved default
    bool flip_horizontal = true;
    bool flip_vertical = false;
    bool show_controls = false;
};

// Unpinned mirror window size
constexpr int DEFAULT_MIRROR_WIDTH = 800;
constexpr int DEFAULT_MIRROR_HEIGHT = 600;

// WM_CLASS of our own windows, also used to exclude them from the catalog
constexpr const char* APP_WM_CLASS = "screen-mirror";

constexpr int MAX_CAPTURE_FPS = 240;
constexpr int MAX_SCALE_FACTOR = 4;
constexpr int MAX_QUEUE_DEPTH = 16;

}  // namespace screen_mirror
