#pragma once

#include "flip_state.hpp"
#include "video/pixels.hpp"

namespace screen_mirror {

// Compose one surface-sized BGRA buffer: the frame aspect-fitted with
// black bars and the flips applied, or a placeholder while no frame has
// arrived yet. The frame itself is only read.
void render_frame(const Image* frame, FlipState flip, int surface_width, int surface_height,
                  Image& out);

}  // namespace screen_mirror
