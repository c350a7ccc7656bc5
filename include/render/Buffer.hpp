#pragma once

#include "render/Cell.hpp"
#include "render/Rect.hpp"
#include "style/Color.hpp"
#include <string_view>
#include <vector>

namespace tessera::render {

/**
 * A 2D grid of Cells representing one full screen state.
 * Origin (0,0) is top-left. Writes outside the grid are clipped silently.
 */
class Buffer {
public:
    Buffer(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }
    Rect area() const { return Rect{0, 0, width_, height_}; }

    // nullptr when (x, y) is outside the grid
    Cell* get(int x, int y);
    const Cell* get(int x, int y) const;

    // Drawing primitives
    void set_char(int x, int y, char32_t ch, const style::Style& style = {});

    // Writes UTF-8 text left to right; returns the column after the last glyph written
    int set_string(int x, int y, std::string_view text, const style::Style& style = {});

    // Like set_string but never writes more than `max_width` columns
    int set_string_truncated(int x, int y, std::string_view text, int max_width,
                             const style::Style& style = {});

    void fill_area(const Rect& rect, char32_t ch, const style::Style& style = {});
    void set_style(const Rect& rect, const style::Style& style);

    void clear();

    // Reallocates storage; the overlapping top-left region is preserved
    void resize(int width, int height);

    // Copy cell contents from a buffer of identical size
    void copy_from(const Buffer& other);

    // Changed cells between this (displayed) buffer and `next`, in row-major order.
    // Throws std::invalid_argument when the dimensions differ.
    std::vector<Update> diff(const Buffer& next) const;

    bool operator==(const Buffer& other) const = default;

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<Cell> cells_;

    bool is_in_bounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    size_t index_of(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x);
    }

    int write_text(int x, int y, std::string_view text, int limit_x, const style::Style& style);
};

}  // namespace tessera::render
