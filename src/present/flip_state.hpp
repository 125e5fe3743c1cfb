#pragma once

#include "video/pixels.hpp"

namespace screen_mirror {

enum class FlipAxis {
    HORIZONTAL,   // Mirror left/right, around the vertical axis
    VERTICAL      // Mirror top/bottom, around the horizontal axis
};

struct FlipState {
    bool horizontal = false;
    bool vertical = false;

    void toggle(FlipAxis axis) {
        if (axis == FlipAxis::HORIZONTAL) {
            horizontal = !horizontal;
        } else {
            vertical = !vertical;
        }
    }

    bool get(FlipAxis axis) const {
        return axis == FlipAxis::HORIZONTAL ? horizontal : vertical;
    }

    bool operator==(const FlipState& other) const {
        return horizontal == other.horizontal && vertical == other.vertical;
    }
    bool operator!=(const FlipState& other) const { return !(*this == other); }
};

const char* flip_axis_name(FlipAxis axis);

// dst = src with the flips applied; src is never modified
void render_flipped(const Image& src, FlipState flip, Image& dst);

// In-place single axis flip
void flip_axis(Image& image, FlipAxis axis);

}  // namespace screen_mirror
