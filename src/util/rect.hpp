#pragma once

namespace screen_mirror {

struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool contains(int px, int py) const {
        return px >= x && py >= y && px < x + width && py < y + height;
    }

    bool empty() const { return width <= 0 || height <= 0; }

    bool intersects(const Rect& other) const {
        return !empty() && !other.empty() &&
               x < other.x + other.width && other.x < x + width &&
               y < other.y + other.height && other.y < y + height;
    }

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }
};

}  // namespace screen_mirror
