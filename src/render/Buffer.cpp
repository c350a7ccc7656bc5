#include "render/Buffer.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace tessera::render {

static int clamp_dimension(int v) {
    return v < 0 ? 0 : v;
}

Buffer::Buffer(int width, int height)
    : width_(clamp_dimension(width)), height_(clamp_dimension(height)) {
    cells_.resize(static_cast<size_t>(width_) * static_cast<size_t>(height_));
}

Cell* Buffer::get(int x, int y) {
    if (!is_in_bounds(x, y)) return nullptr;
    return &cells_[index_of(x, y)];
}

const Cell* Buffer::get(int x, int y) const {
    if (!is_in_bounds(x, y)) return nullptr;
    return &cells_[index_of(x, y)];
}

void Buffer::set_char(int x, int y, char32_t ch, const style::Style& style) {
    Cell* cell = get(x, y);
    if (!cell) return;

    if (!util::is_scalar_value(ch) || util::is_control(ch)) {
        ch = util::REPLACEMENT_CHARACTER;
    }
    cell->set_char(ch);
    cell->set_style(style);
}

int Buffer::write_text(int x, int y, std::string_view text, int limit_x, const style::Style& style) {
    if (y < 0 || y >= height_) return x;

    int current_x = x;
    for (char32_t ch : util::decode_utf8(text)) {
        int char_width = util::display_width(ch);
        // Cells hold one code point; combining marks have nowhere to go
        if (char_width == 0) continue;
        if (current_x + char_width > limit_x) break;

        if (current_x >= 0) {
            set_char(current_x, y, ch, style);

            // The column covered by the right half of a wide glyph is blanked
            for (int i = 1; i < char_width; ++i) {
                set_char(current_x + i, y, U' ', style);
            }
        }
        current_x += char_width;
    }
    return current_x;
}

int Buffer::set_string(int x, int y, std::string_view text, const style::Style& style) {
    return write_text(x, y, text, width_, style);
}

int Buffer::set_string_truncated(int x, int y, std::string_view text, int max_width,
                                 const style::Style& style) {
    if (max_width <= 0) return x;
    return write_text(x, y, text, std::min(width_, x + max_width), style);
}

void Buffer::fill_area(const Rect& rect, char32_t ch, const style::Style& style) {
    Rect clipped = rect.intersection(area());
    for (int cy = clipped.y; cy < clipped.bottom(); ++cy) {
        for (int cx = clipped.x; cx < clipped.right(); ++cx) {
            set_char(cx, cy, ch, style);
        }
    }
}

void Buffer::set_style(const Rect& rect, const style::Style& style) {
    Rect clipped = rect.intersection(area());
    for (int cy = clipped.y; cy < clipped.bottom(); ++cy) {
        for (int cx = clipped.x; cx < clipped.right(); ++cx) {
            cells_[index_of(cx, cy)].set_style(style);
        }
    }
}

void Buffer::clear() {
    std::fill(cells_.begin(), cells_.end(), Cell{});
}

void Buffer::resize(int width, int height) {
    width = clamp_dimension(width);
    height = clamp_dimension(height);
    if (width_ == width && height_ == height) return;

    std::vector<Cell> resized(static_cast<size_t>(width) * static_cast<size_t>(height));
    int keep_w = std::min(width_, width);
    int keep_h = std::min(height_, height);
    for (int y = 0; y < keep_h; ++y) {
        auto row = cells_.begin() + static_cast<std::ptrdiff_t>(index_of(0, y));
        std::copy(row, row + keep_w,
                  resized.begin() + static_cast<std::ptrdiff_t>(y) * width);
    }

    // Swap in the new storage; the old vector is released on scope exit
    cells_.swap(resized);
    width_ = width;
    height_ = height;
}

void Buffer::copy_from(const Buffer& other) {
    if (other.width_ != width_ || other.height_ != height_) {
        throw std::invalid_argument("Buffer::copy_from: dimension mismatch");
    }
    std::copy(other.cells_.begin(), other.cells_.end(), cells_.begin());
}

std::vector<Update> Buffer::diff(const Buffer& next) const {
    if (next.width_ != width_ || next.height_ != height_) {
        throw std::invalid_argument(
            "Buffer::diff: dimension mismatch " +
            std::to_string(width_) + "x" + std::to_string(height_) + " vs " +
            std::to_string(next.width_) + "x" + std::to_string(next.height_));
    }

    std::vector<Update> updates;
    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            const Cell& cell = next.cells_[index_of(x, y)];
            if (cell != cells_[index_of(x, y)]) {
                updates.push_back(Update{x, y, cell});
            }
        }
    }
    return updates;
}

}  // namespace tessera::render
