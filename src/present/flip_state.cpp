#include "flip_state.hpp"

#include <algorithm>
#include <cstring>

namespace screen_mirror {

const char* flip_axis_name(FlipAxis axis) {
    return axis == FlipAxis::HORIZONTAL ? "horizontal" : "vertical";
}

void render_flipped(const Image& src, FlipState flip, Image& dst) {
    if (src.empty()) {
        dst = Image();
        return;
    }

    dst.allocate(src.width, src.height);
    for (int y = 0; y < src.height; y++) {
        const uint8_t* src_row = src.row(flip.vertical ? src.height - 1 - y : y);
        uint8_t* dst_row = dst.row(y);
        if (!flip.horizontal) {
            memcpy(dst_row, src_row, static_cast<size_t>(src.stride()));
            continue;
        }
        for (int x = 0; x < src.width; x++) {
            memcpy(dst_row + x * 4, src_row + (src.width - 1 - x) * 4, 4);
        }
    }
}

void flip_axis(Image& image, FlipAxis axis) {
    if (image.empty()) {
        return;
    }

    if (axis == FlipAxis::VERTICAL) {
        for (int top = 0, bottom = image.height - 1; top < bottom; top++, bottom--) {
            std::swap_ranges(image.row(top), image.row(top) + image.stride(), image.row(bottom));
        }
        return;
    }

    for (int y = 0; y < image.height; y++) {
        uint8_t* row = image.row(y);
        for (int left = 0, right = image.width - 1; left < right; left++, right--) {
            std::swap_ranges(row + left * 4, row + left * 4 + 4, row + right * 4);
        }
    }
}

}  // namespace screen_mirror
