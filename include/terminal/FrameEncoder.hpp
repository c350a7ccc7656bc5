#pragma once

#include "render/Cell.hpp"
#include "style/Color.hpp"
#include <string>
#include <vector>

namespace tessera::terminal {

/**
 * Serializes a list of cell updates into one escape-sequence string.
 *
 * Tracks where the terminal cursor ends up after each glyph so that runs of
 * adjacent cells need a single cursor move, and tracks the active colors and
 * modifiers so that a style is emitted only when it changes. Every frame
 * starts from an unknown cursor position and style and ends with an SGR reset.
 */
class FrameEncoder {
public:
    // Appends to `out`; returns the number of bytes appended
    size_t encode(const std::vector<render::Update>& updates, std::string& out);

    static void append_foreground(std::string& out, const style::Color& color);
    static void append_background(std::string& out, const style::Color& color);
    static void append_modifiers(std::string& out, style::Modifier modifier);
    static void append_glyph(std::string& out, char32_t ch);
};

}  // namespace tessera::terminal
