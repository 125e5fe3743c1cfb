#include "frame_renderer.hpp"
#include "letterbox.hpp"

#include <cstring>
#include <vector>

namespace screen_mirror {

static void fill(Image& image, uint8_t gray) {
    const uint8_t pixel[4] = {gray, gray, gray, 255};
    for (int y = 0; y < image.height; y++) {
        uint8_t* row = image.row(y);
        for (int x = 0; x < image.width; x++) {
            memcpy(row + x * 4, pixel, 4);
        }
    }
}

void render_frame(const Image* frame, FlipState flip, int surface_width, int surface_height,
                  Image& out) {
    if (surface_width <= 0 || surface_height <= 0) {
        out = Image();
        return;
    }
    out.allocate(surface_width, surface_height);

    if (!frame || frame->empty()) {
        fill(out, 0x1c);
        return;
    }
    fill(out, 0);

    Letterbox letterbox;
    letterbox.init(frame->width, frame->height, surface_width, surface_height);
    const Rect& viewport = letterbox.get_viewport();

    // Source column for every viewport column, flip folded in
    std::vector<int> columns(static_cast<size_t>(viewport.width));
    for (int x = 0; x < viewport.width; x++) {
        int cx = 0, cy = 0;
        letterbox.to_content(viewport.x + x, viewport.y, cx, cy);
        columns[x] = flip.horizontal ? frame->width - 1 - cx : cx;
    }

    for (int y = 0; y < viewport.height; y++) {
        int cx = 0, cy = 0;
        letterbox.to_content(viewport.x, viewport.y + y, cx, cy);
        const uint8_t* src_row = frame->row(flip.vertical ? frame->height - 1 - cy : cy);
        uint8_t* dst_row = out.row(viewport.y + y) + viewport.x * 4;
        for (int x = 0; x < viewport.width; x++) {
            memcpy(dst_row + x * 4, src_row + columns[x] * 4, 4);
        }
    }
}

}  // namespace screen_mirror
