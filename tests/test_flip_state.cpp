#include "present/flip_state.hpp"
#include "present/frame_renderer.hpp"

#include <gtest/gtest.h>

using namespace screen_mirror;

// Each pixel's blue byte holds its index
static Image make_indexed(int width, int height) {
    Image image;
    image.allocate(width, height);
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            uint8_t* p = image.row(y) + x * 4;
            p[0] = static_cast<uint8_t>(y * width + x);
            p[3] = 255;
        }
    }
    return image;
}

static uint8_t at(const Image& image, int x, int y) {
    return image.row(y)[x * 4];
}

TEST(FlipState, AxesToggleIndependently) {
    FlipState flip;
    flip.toggle(FlipAxis::HORIZONTAL);
    EXPECT_TRUE(flip.horizontal);
    EXPECT_FALSE(flip.vertical);

    flip.toggle(FlipAxis::VERTICAL);
    flip.toggle(FlipAxis::HORIZONTAL);
    EXPECT_FALSE(flip.get(FlipAxis::HORIZONTAL));
    EXPECT_TRUE(flip.get(FlipAxis::VERTICAL));
}

TEST(FlipState, HorizontalMirrorsColumns) {
    Image src = make_indexed(3, 2);
    Image out;
    render_flipped(src, FlipState{true, false}, out);

    EXPECT_EQ(at(out, 0, 0), 2);
    EXPECT_EQ(at(out, 2, 0), 0);
    EXPECT_EQ(at(out, 0, 1), 5);

    render_flipped(src, FlipState{false, true}, out);
    EXPECT_EQ(at(out, 0, 0), 3);
    EXPECT_EQ(at(out, 2, 1), 2);
}

TEST(FlipState, FlipsCommute) {
    Image src = make_indexed(4, 3);

    Image h_then_v = src;
    flip_axis(h_then_v, FlipAxis::HORIZONTAL);
    flip_axis(h_then_v, FlipAxis::VERTICAL);

    Image v_then_h = src;
    flip_axis(v_then_h, FlipAxis::VERTICAL);
    flip_axis(v_then_h, FlipAxis::HORIZONTAL);

    Image both;
    render_flipped(src, FlipState{true, true}, both);

    EXPECT_EQ(h_then_v.pixels, v_then_h.pixels);
    EXPECT_EQ(h_then_v.pixels, both.pixels);
    EXPECT_EQ(at(both, 0, 0), 11);
}

TEST(FlipState, SourceIsNeverModified) {
    Image src = make_indexed(4, 3);
    std::vector<uint8_t> before = src.pixels;

    Image out;
    render_flipped(src, FlipState{true, true}, out);
    render_frame(&src, FlipState{true, true}, 8, 8, out);
    EXPECT_EQ(src.pixels, before);
}

TEST(FrameRenderer, LetterboxesAndFlips) {
    Image frame;
    frame.allocate(2, 1);
    frame.pixels = {10, 0, 0, 255, 20, 0, 0, 255};

    Image out;
    render_frame(&frame, FlipState{true, false}, 4, 4, out);
    ASSERT_EQ(out.width, 4);
    ASSERT_EQ(out.height, 4);

    // Bars above and below
    for (int x = 0; x < 4; x++) {
        EXPECT_EQ(at(out, x, 0), 0);
        EXPECT_EQ(at(out, x, 3), 0);
        EXPECT_EQ(out.row(0)[x * 4 + 3], 255);
    }
    // Viewport rows 1-2, columns swapped
    for (int y = 1; y <= 2; y++) {
        EXPECT_EQ(at(out, 0, y), 20);
        EXPECT_EQ(at(out, 1, y), 20);
        EXPECT_EQ(at(out, 2, y), 10);
        EXPECT_EQ(at(out, 3, y), 10);
    }
}

TEST(FrameRenderer, PlaceholderWithoutFrame) {
    Image out;
    render_frame(nullptr, FlipState(), 3, 2, out);
    ASSERT_EQ(out.width, 3);
    for (int y = 0; y < 2; y++) {
        for (int x = 0; x < 3; x++) {
            EXPECT_EQ(at(out, x, y), 0x1c);
        }
    }

    render_frame(nullptr, FlipState(), 0, 2, out);
    EXPECT_TRUE(out.empty());
}
