#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace screen_mirror {

// Byte order in memory, 4 bytes per pixel
enum class PixelFormat {
    BGRA,
    BGRX,
    RGBA,
    RGBX,
    XBGR
};

const char* pixel_format_name(PixelFormat format);

// Raw frame as delivered by a capture backend. Owns its pixels so it can
// sit in the delivery queue after the producer has reused its buffers.
struct RawFrame {
    std::vector<uint8_t> data;
    int width = 0;
    int height = 0;
    int stride = 0;               // Bytes per row
    PixelFormat format = PixelFormat::BGRA;
    uint64_t timestamp_us = 0;
};

// Renderable image: tightly packed BGRA, alpha always valid
struct Image {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
    int stride() const { return width * 4; }

    uint8_t* row(int y) { return pixels.data() + static_cast<size_t>(y) * stride(); }
    const uint8_t* row(int y) const { return pixels.data() + static_cast<size_t>(y) * stride(); }

    void allocate(int w, int h) {
        width = w;
        height = h;
        pixels.assign(static_cast<size_t>(w) * h * 4, 0);
    }
};

// Convert a raw buffer to BGRA. Fails (leaving out untouched) when the
// extent is empty or the buffer is too small for stride * height.
bool convert_to_bgra(const uint8_t* src, size_t src_size, PixelFormat format,
                     int width, int height, int stride, Image& out);

inline bool convert_to_bgra(const RawFrame& frame, Image& out) {
    return convert_to_bgra(frame.data.data(), frame.data.size(), frame.format,
                           frame.width, frame.height, frame.stride, out);
}

// Nearest-neighbour resample of 4-byte pixels, format agnostic
void scale_pixels(const uint8_t* src, int src_width, int src_height, int src_stride,
                  uint8_t* dst, int dst_width, int dst_height, int dst_stride);

// Aspect-fit scale of src centered in the destination box, the rest
// filled with opaque black in format's byte order
void scale_pixels_fit(const uint8_t* src, int src_width, int src_height, int src_stride,
                      uint8_t* dst, int dst_width, int dst_height, int dst_stride,
                      PixelFormat format);

void scale_image(const Image& src, int width, int height, Image& out);

// Largest size with the source aspect ratio that fits the box
void fit_within(int src_width, int src_height, int max_width, int max_height,
                int& out_width, int& out_height);

}  // namespace screen_mirror
