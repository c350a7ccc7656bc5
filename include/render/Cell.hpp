#pragma once

#include "style/Color.hpp"

namespace tessera::render {

/**
 * A single cell on the terminal grid.
 * Represents what is visually displayed at one coordinate.
 */
struct Cell {
    char32_t ch = U' ';
    style::Color fg;
    style::Color bg;
    style::Modifier modifier = style::Modifier::None;

    void reset() { *this = Cell{}; }

    void set_char(char32_t c) { ch = c; }

    void set_style(const style::Style& s) {
        if (s.fg) fg = *s.fg;
        if (s.bg) bg = *s.bg;
        modifier = modifier | s.modifier;
    }

    bool operator==(const Cell& other) const = default;
};

// One changed cell, as produced by Buffer::diff
struct Update {
    int x = 0;
    int y = 0;
    Cell cell;
};

}  // namespace tessera::render
