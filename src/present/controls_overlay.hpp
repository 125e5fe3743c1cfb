#pragma once

#include "flip_state.hpp"
#include "util/rect.hpp"
#include "video/pixels.hpp"

#include <cstdint>

namespace screen_mirror {

// The two flip toggles drawn over the mirror. They fade in while the
// pointer is over the surface and fade out when it leaves.
class ControlsOverlay {
public:
    static constexpr uint64_t FADE_DURATION_US = 250000;

    ControlsOverlay() = default;

    void set_enabled(bool enabled) { m_enabled = enabled; }
    bool is_enabled() const { return m_enabled; }

    // Place the panel for a surface of this size
    void layout(int surface_width, int surface_height);

    void set_hovering(bool hovering, uint64_t now_us);
    bool is_hovering() const { return m_hovering; }

    // 0 = hidden, 1 = fully shown; ease-in-out between
    float get_opacity(uint64_t now_us) const;
    bool is_animating(uint64_t now_us) const;

    // Toggle under the point, only while hovering
    bool hit_test(int x, int y, FlipAxis& axis) const;

    // Blend the panel into target (surface coordinates)
    void draw(Image& target, FlipState flip, uint64_t now_us) const;

    const Rect& get_panel() const { return m_panel; }
    const Rect& get_button(FlipAxis axis) const {
        return axis == FlipAxis::HORIZONTAL ? m_button_h : m_button_v;
    }

private:
    bool m_enabled = false;
    bool m_hovering = false;

    float m_fade_from = 0.0f;
    float m_fade_to = 0.0f;
    uint64_t m_fade_start_us = 0;

    Rect m_panel;
    Rect m_button_h;
    Rect m_button_v;
};

}  // namespace screen_mirror
