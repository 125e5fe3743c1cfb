#include "controls_overlay.hpp"

#include <algorithm>
#include <initializer_list>

namespace screen_mirror {

// Panel geometry, pixels
static const int MARGIN = 20;
static const int PAD_X = 14;
static const int PAD_Y = 12;
static const int SPACING = 10;
static const int BUTTON_W = 64;
static const int BUTTON_H = 40;
static const int ARROW_HEAD = 6;

struct Color {
    uint8_t b, g, r;
};

static const Color PANEL_COLOR = {40, 40, 40};
static const Color ACTIVE_COLOR = {255, 132, 10};
static const Color INACTIVE_COLOR = {255, 255, 255};
static const Color GLYPH_COLOR = {255, 255, 255};

static float ease_in_out(float t) {
    return t < 0.5f ? 2.0f * t * t : 1.0f - (-2.0f * t + 2.0f) * (-2.0f * t + 2.0f) / 2.0f;
}

static void blend_pixel(Image& image, int x, int y, Color color, float alpha) {
    if (x < 0 || y < 0 || x >= image.width || y >= image.height || alpha <= 0.0f) {
        return;
    }
    uint8_t* p = image.row(y) + x * 4;
    p[0] = static_cast<uint8_t>(p[0] + (color.b - p[0]) * alpha);
    p[1] = static_cast<uint8_t>(p[1] + (color.g - p[1]) * alpha);
    p[2] = static_cast<uint8_t>(p[2] + (color.r - p[2]) * alpha);
}

static void blend_rect(Image& image, const Rect& rect, Color color, float alpha) {
    int x0 = std::max(rect.x, 0);
    int y0 = std::max(rect.y, 0);
    int x1 = std::min(rect.x + rect.width, image.width);
    int y1 = std::min(rect.y + rect.height, image.height);
    for (int y = y0; y < y1; y++) {
        for (int x = x0; x < x1; x++) {
            blend_pixel(image, x, y, color, alpha);
        }
    }
}

// Double-headed arrow centred in the button
static void draw_arrow(Image& image, const Rect& button, FlipAxis axis, float alpha) {
    int cx = button.x + button.width / 2;
    int cy = button.y + button.height / 2;

    if (axis == FlipAxis::HORIZONTAL) {
        int half = button.width / 2 - 16;
        blend_rect(image, Rect{cx - half, cy - 1, half * 2, 2}, GLYPH_COLOR, alpha);
        for (int i = 0; i < ARROW_HEAD; i++) {
            blend_rect(image, Rect{cx - half + i, cy - i - 1, 1, i * 2 + 2}, GLYPH_COLOR, alpha);
            blend_rect(image, Rect{cx + half - 1 - i, cy - i - 1, 1, i * 2 + 2}, GLYPH_COLOR, alpha);
        }
    } else {
        int half = button.height / 2 - 8;
        blend_rect(image, Rect{cx - 1, cy - half, 2, half * 2}, GLYPH_COLOR, alpha);
        for (int i = 0; i < ARROW_HEAD; i++) {
            blend_rect(image, Rect{cx - i - 1, cy - half + i, i * 2 + 2, 1}, GLYPH_COLOR, alpha);
            blend_rect(image, Rect{cx - i - 1, cy + half - 1 - i, i * 2 + 2, 1}, GLYPH_COLOR, alpha);
        }
    }
}

void ControlsOverlay::layout(int surface_width, int /*surface_height*/) {
    m_panel.width = PAD_X * 2 + BUTTON_W * 2 + SPACING;
    m_panel.height = PAD_Y * 2 + BUTTON_H;
    m_panel.x = std::max(0, (surface_width - m_panel.width) / 2);
    m_panel.y = MARGIN;

    m_button_h = Rect{m_panel.x + PAD_X, m_panel.y + PAD_Y, BUTTON_W, BUTTON_H};
    m_button_v = Rect{m_button_h.x + BUTTON_W + SPACING, m_button_h.y, BUTTON_W, BUTTON_H};
}

void ControlsOverlay::set_hovering(bool hovering, uint64_t now_us) {
    if (hovering == m_hovering) {
        return;
    }
    // Reverse from wherever the current fade is
    m_fade_from = get_opacity(now_us);
    m_fade_to = hovering ? 1.0f : 0.0f;
    m_fade_start_us = now_us;
    m_hovering = hovering;
}

float ControlsOverlay::get_opacity(uint64_t now_us) const {
    if (now_us <= m_fade_start_us) {
        return m_fade_from;
    }
    uint64_t elapsed = now_us - m_fade_start_us;
    if (elapsed >= FADE_DURATION_US) {
        return m_fade_to;
    }
    float t = static_cast<float>(elapsed) / static_cast<float>(FADE_DURATION_US);
    return m_fade_from + (m_fade_to - m_fade_from) * ease_in_out(t);
}

bool ControlsOverlay::is_animating(uint64_t now_us) const {
    return m_fade_from != m_fade_to && now_us < m_fade_start_us + FADE_DURATION_US;
}

bool ControlsOverlay::hit_test(int x, int y, FlipAxis& axis) const {
    if (!m_enabled || !m_hovering) {
        return false;
    }
    if (m_button_h.contains(x, y)) {
        axis = FlipAxis::HORIZONTAL;
        return true;
    }
    if (m_button_v.contains(x, y)) {
        axis = FlipAxis::VERTICAL;
        return true;
    }
    return false;
}

void ControlsOverlay::draw(Image& target, FlipState flip, uint64_t now_us) const {
    if (!m_enabled || target.empty()) {
        return;
    }
    float opacity = get_opacity(now_us);
    if (opacity <= 0.0f) {
        return;
    }

    blend_rect(target, m_panel, PANEL_COLOR, 0.75f * opacity);

    for (FlipAxis axis : {FlipAxis::HORIZONTAL, FlipAxis::VERTICAL}) {
        const Rect& button = get_button(axis);
        if (flip.get(axis)) {
            blend_rect(target, button, ACTIVE_COLOR, opacity);
        } else {
            blend_rect(target, button, INACTIVE_COLOR, 0.15f * opacity);
        }
        draw_arrow(target, button, axis, opacity);
    }
}

}  // namespace screen_mirror
