#include "present/controls_overlay.hpp"

#include <gtest/gtest.h>

using namespace screen_mirror;

static const uint64_t MS = 1000;

class ControlsOverlayTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_overlay.set_enabled(true);
        m_overlay.layout(800, 600);
    }

    static void center_of(const Rect& rect, int& x, int& y) {
        x = rect.x + rect.width / 2;
        y = rect.y + rect.height / 2;
    }

    ControlsOverlay m_overlay;
};

TEST_F(ControlsOverlayTest, HiddenUntilHover) {
    EXPECT_FLOAT_EQ(m_overlay.get_opacity(0), 0.0f);
    EXPECT_FALSE(m_overlay.is_animating(0));

    m_overlay.set_hovering(true, 1000 * MS);
    EXPECT_FLOAT_EQ(m_overlay.get_opacity(1000 * MS), 0.0f);
    EXPECT_TRUE(m_overlay.is_animating(1100 * MS));
}

TEST_F(ControlsOverlayTest, FadeTakesQuarterSecond) {
    m_overlay.set_hovering(true, 0);
    EXPECT_NEAR(m_overlay.get_opacity(125 * MS), 0.5f, 1e-4);
    EXPECT_FLOAT_EQ(m_overlay.get_opacity(ControlsOverlay::FADE_DURATION_US), 1.0f);
    EXPECT_FALSE(m_overlay.is_animating(ControlsOverlay::FADE_DURATION_US));

    m_overlay.set_hovering(false, 1000 * MS);
    EXPECT_FLOAT_EQ(m_overlay.get_opacity(1000 * MS), 1.0f);
    EXPECT_FLOAT_EQ(m_overlay.get_opacity(1250 * MS), 0.0f);
}

TEST_F(ControlsOverlayTest, LeavingMidFadeReversesFromCurrentOpacity) {
    m_overlay.set_hovering(true, 0);
    m_overlay.set_hovering(false, 125 * MS);

    EXPECT_NEAR(m_overlay.get_opacity(125 * MS), 0.5f, 1e-4);
    float midway = m_overlay.get_opacity(250 * MS);
    EXPECT_GT(midway, 0.0f);
    EXPECT_LT(midway, 0.5f);
    EXPECT_FLOAT_EQ(m_overlay.get_opacity(375 * MS), 0.0f);
}

TEST_F(ControlsOverlayTest, ButtonsMapToAxes) {
    m_overlay.set_hovering(true, 0);

    int x = 0, y = 0;
    FlipAxis axis = FlipAxis::VERTICAL;
    center_of(m_overlay.get_button(FlipAxis::HORIZONTAL), x, y);
    ASSERT_TRUE(m_overlay.hit_test(x, y, axis));
    EXPECT_EQ(axis, FlipAxis::HORIZONTAL);

    center_of(m_overlay.get_button(FlipAxis::VERTICAL), x, y);
    ASSERT_TRUE(m_overlay.hit_test(x, y, axis));
    EXPECT_EQ(axis, FlipAxis::VERTICAL);

    EXPECT_FALSE(m_overlay.hit_test(5, 590, axis));
}

TEST_F(ControlsOverlayTest, PanelIsCenteredAtTop) {
    const Rect& panel = m_overlay.get_panel();
    EXPECT_EQ(panel.x + panel.width / 2, 400);
    EXPECT_EQ(panel.y, 20);
}

TEST_F(ControlsOverlayTest, ClicksIgnoredUnlessHoveringAndEnabled) {
    int x = 0, y = 0;
    FlipAxis axis;
    center_of(m_overlay.get_button(FlipAxis::HORIZONTAL), x, y);
    EXPECT_FALSE(m_overlay.hit_test(x, y, axis));

    m_overlay.set_hovering(true, 0);
    m_overlay.set_enabled(false);
    EXPECT_FALSE(m_overlay.hit_test(x, y, axis));
}

TEST_F(ControlsOverlayTest, DrawOnlyWhenVisible) {
    Image target;
    target.allocate(800, 600);
    std::vector<uint8_t> blank = target.pixels;

    m_overlay.draw(target, FlipState(), 0);
    EXPECT_EQ(target.pixels, blank);

    m_overlay.set_hovering(true, 0);
    m_overlay.set_enabled(false);
    m_overlay.draw(target, FlipState(), 500 * MS);
    EXPECT_EQ(target.pixels, blank);

    m_overlay.set_enabled(true);
    m_overlay.draw(target, FlipState{true, false}, 500 * MS);
    EXPECT_NE(target.pixels, blank);
}
