#include "pixels.hpp"

#include <algorithm>
#include <cstring>

namespace screen_mirror {

const char* pixel_format_name(PixelFormat format) {
    switch (format) {
        case PixelFormat::BGRA: return "BGRA";
        case PixelFormat::BGRX: return "BGRx";
        case PixelFormat::RGBA: return "RGBA";
        case PixelFormat::RGBX: return "RGBx";
        case PixelFormat::XBGR: return "xBGR";
    }
    return "unknown";
}

bool convert_to_bgra(const uint8_t* src, size_t src_size, PixelFormat format,
                     int width, int height, int stride, Image& out) {
    if (!src || width <= 0 || height <= 0 || stride < width * 4) {
        return false;
    }
    size_t needed = static_cast<size_t>(stride) * (height - 1) + static_cast<size_t>(width) * 4;
    if (src_size < needed) {
        return false;
    }

    Image converted;
    converted.allocate(width, height);
    uint8_t* dst = converted.pixels.data();
    int dst_stride = converted.stride();

    switch (format) {
        case PixelFormat::BGRX:
        case PixelFormat::BGRA:
            if (stride == dst_stride) {
                memcpy(dst, src, static_cast<size_t>(height) * dst_stride);
            } else {
                for (int y = 0; y < height; y++) {
                    memcpy(dst + static_cast<size_t>(y) * dst_stride,
                           src + static_cast<size_t>(y) * stride, dst_stride);
                }
            }
            // X byte is undefined
            if (format == PixelFormat::BGRX) {
                for (size_t i = 3; i < converted.pixels.size(); i += 4) {
                    dst[i] = 255;
                }
            }
            break;

        case PixelFormat::RGBX:
        case PixelFormat::RGBA:
            for (int y = 0; y < height; y++) {
                const uint8_t* s = src + static_cast<size_t>(y) * stride;
                uint8_t* d = dst + static_cast<size_t>(y) * dst_stride;
                for (int x = 0; x < width; x++) {
                    d[x*4 + 0] = s[x*4 + 2];
                    d[x*4 + 1] = s[x*4 + 1];
                    d[x*4 + 2] = s[x*4 + 0];
                    d[x*4 + 3] = (format == PixelFormat::RGBA) ? s[x*4 + 3] : 255;
                }
            }
            break;

        case PixelFormat::XBGR:
            for (int y = 0; y < height; y++) {
                const uint8_t* s = src + static_cast<size_t>(y) * stride;
                uint8_t* d = dst + static_cast<size_t>(y) * dst_stride;
                for (int x = 0; x < width; x++) {
                    d[x*4 + 0] = s[x*4 + 1];
                    d[x*4 + 1] = s[x*4 + 2];
                    d[x*4 + 2] = s[x*4 + 3];
                    d[x*4 + 3] = 255;
                }
            }
            break;
    }

    out = std::move(converted);
    return true;
}

void scale_pixels(const uint8_t* src, int src_width, int src_height, int src_stride,
                  uint8_t* dst, int dst_width, int dst_height, int dst_stride) {
    if (src_width <= 0 || src_height <= 0 || dst_width <= 0 || dst_height <= 0) {
        return;
    }

    if (src_width == dst_width && src_height == dst_height) {
        for (int y = 0; y < dst_height; y++) {
            memcpy(dst + static_cast<size_t>(y) * dst_stride,
                   src + static_cast<size_t>(y) * src_stride,
                   static_cast<size_t>(dst_width) * 4);
        }
        return;
    }

    // Precompute source columns once per call
    std::vector<int> src_x(dst_width);
    for (int x = 0; x < dst_width; x++) {
        src_x[x] = static_cast<int>((static_cast<int64_t>(x) * src_width) / dst_width) * 4;
    }

    for (int y = 0; y < dst_height; y++) {
        int sy = static_cast<int>((static_cast<int64_t>(y) * src_height) / dst_height);
        const uint8_t* s = src + static_cast<size_t>(sy) * src_stride;
        uint8_t* d = dst + static_cast<size_t>(y) * dst_stride;
        for (int x = 0; x < dst_width; x++) {
            memcpy(d + x * 4, s + src_x[x], 4);
        }
    }
}

void scale_pixels_fit(const uint8_t* src, int src_width, int src_height, int src_stride,
                      uint8_t* dst, int dst_width, int dst_height, int dst_stride,
                      PixelFormat format) {
    int fit_width = 0, fit_height = 0;
    fit_within(src_width, src_height, dst_width, dst_height, fit_width, fit_height);
    if (fit_width <= 0 || fit_height <= 0) {
        return;
    }
    // Rounding leaves at most a one pixel gap; no hairline bars
    if (dst_width - fit_width <= 1) {
        fit_width = dst_width;
    }
    if (dst_height - fit_height <= 1) {
        fit_height = dst_height;
    }
    int offset_x = (dst_width - fit_width) / 2;
    int offset_y = (dst_height - fit_height) / 2;

    if (fit_width != dst_width || fit_height != dst_height) {
        uint8_t black[4] = {0, 0, 0, 255};
        if (format == PixelFormat::XBGR) {
            black[0] = 255;
            black[3] = 0;
        }
        for (int y = 0; y < dst_height; y++) {
            uint8_t* d = dst + static_cast<size_t>(y) * dst_stride;
            for (int x = 0; x < dst_width; x++) {
                memcpy(d + x * 4, black, 4);
            }
        }
    }

    scale_pixels(src, src_width, src_height, src_stride,
                 dst + static_cast<size_t>(offset_y) * dst_stride + offset_x * 4,
                 fit_width, fit_height, dst_stride);
}

void scale_image(const Image& src, int width, int height, Image& out) {
    Image scaled;
    scaled.allocate(width, height);
    scale_pixels(src.pixels.data(), src.width, src.height, src.stride(),
                 scaled.pixels.data(), width, height, scaled.stride());
    out = std::move(scaled);
}

void fit_within(int src_width, int src_height, int max_width, int max_height,
                int& out_width, int& out_height) {
    if (src_width <= 0 || src_height <= 0 || max_width <= 0 || max_height <= 0) {
        out_width = 0;
        out_height = 0;
        return;
    }

    double scale = std::min(static_cast<double>(max_width) / src_width,
                            static_cast<double>(max_height) / src_height);
    out_width = std::max(1, static_cast<int>(src_width * scale));
    out_height = std::max(1, static_cast<int>(src_height * scale));
}

}  // namespace screen_mirror
