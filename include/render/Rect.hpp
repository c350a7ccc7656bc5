#pragma once

#include <algorithm>
#include <cstdint>

namespace tessera::render {

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const = default;
};

/**
 * Axis-aligned cell rectangle. Origin (0,0) is top-left.
 */
struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    int area() const { return width * height; }
    bool empty() const { return width <= 0 || height <= 0; }

    int right() const { return x + width; }
    int bottom() const { return y + height; }

    bool contains(int px, int py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }

    // Shrinks by `margin` on every side; collapses to zero size if too small
    Rect inner(int margin) const {
        int doubled = margin * 2;
        if (doubled > width || doubled > height) {
            return Rect{x, y, 0, 0};
        }
        return Rect{x + margin, y + margin, width - doubled, height - doubled};
    }

    Rect intersection(const Rect& other) const {
        int x1 = std::max(x, other.x);
        int y1 = std::max(y, other.y);
        int x2 = std::min(right(), other.right());
        int y2 = std::min(bottom(), other.bottom());
        if (x2 <= x1 || y2 <= y1) return Rect{x1, y1, 0, 0};
        return Rect{x1, y1, x2 - x1, y2 - y1};
    }

    struct HorizontalSplit;
    struct VerticalSplit;

    HorizontalSplit split_horizontal(int at) const;
    VerticalSplit split_vertical(int at) const;

    bool operator==(const Rect& other) const = default;
};

struct Rect::HorizontalSplit {
    Rect left;
    Rect right;
};

struct Rect::VerticalSplit {
    Rect top;
    Rect bottom;
};

inline Rect::HorizontalSplit Rect::split_horizontal(int at) const {
    int split_at = std::clamp(at, 0, width);
    return {
        Rect{x, y, split_at, height},
        Rect{x + split_at, y, width - split_at, height}
    };
}

inline Rect::VerticalSplit Rect::split_vertical(int at) const {
    int split_at = std::clamp(at, 0, height);
    return {
        Rect{x, y, width, split_at},
        Rect{x, y + split_at, width, height - split_at}
    };
}

}  // namespace tessera::render
