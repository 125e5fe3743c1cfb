#pragma once

#include "util/rect.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace screen_mirror {

// Aspect-fit placement of content inside a surface, black bars around it
class Letterbox {
public:
    Letterbox() = default;

    void init(int content_width, int content_height, int surface_width, int surface_height) {
        m_content_width = content_width;
        m_content_height = content_height;
        m_surface_width = surface_width;
        m_surface_height = surface_height;

        calculate_viewport();
    }

    // Area of the surface covered by content, in surface pixels
    const Rect& get_viewport() const { return m_viewport; }

    // Surface pixel -> content pixel. False over the bars.
    bool to_content(int sx, int sy, int& cx, int& cy) const {
        if (!m_viewport.contains(sx, sy)) {
            return false;
        }
        cx = static_cast<int>(static_cast<int64_t>(sx - m_viewport.x) * m_content_width / m_viewport.width);
        cy = static_cast<int>(static_cast<int64_t>(sy - m_viewport.y) * m_content_height / m_viewport.height);
        cx = std::clamp(cx, 0, m_content_width - 1);
        cy = std::clamp(cy, 0, m_content_height - 1);
        return true;
    }

private:
    void calculate_viewport() {
        m_viewport = Rect();
        if (m_content_width <= 0 || m_content_height <= 0 ||
            m_surface_width <= 0 || m_surface_height <= 0) {
            return;
        }

        float surface_aspect = static_cast<float>(m_surface_width) / m_surface_height;
        float content_aspect = static_cast<float>(m_content_width) / m_content_height;

        if (content_aspect > surface_aspect) {
            // Content is wider - bars on top/bottom
            m_viewport.width = m_surface_width;
            m_viewport.height = std::max(1, static_cast<int>(std::lround(m_surface_width / content_aspect)));
            m_viewport.x = 0;
            m_viewport.y = (m_surface_height - m_viewport.height) / 2;
        } else {
            // Content is taller - bars on the sides
            m_viewport.width = std::max(1, static_cast<int>(std::lround(m_surface_height * content_aspect)));
            m_viewport.height = m_surface_height;
            m_viewport.x = (m_surface_width - m_viewport.width) / 2;
            m_viewport.y = 0;
        }
    }

    int m_content_width = 0;
    int m_content_height = 0;
    int m_surface_width = 0;
    int m_surface_height = 0;
    Rect m_viewport;
};

}  // namespace screen_mirror
