#include "terminal/FrameEncoder.hpp"
#include "backend/Ansi.hpp"
#include "util/UnicodeUtils.hpp"
#include <array>

namespace tessera::terminal {

namespace {

struct SgrModifier {
    style::Modifier modifier;
    int code;
};

constexpr std::array<SgrModifier, 9> SGR_MODIFIERS = {{
    {style::Modifier::Bold, 1},
    {style::Modifier::Dim, 2},
    {style::Modifier::Italic, 3},
    {style::Modifier::Underline, 4},
    {style::Modifier::SlowBlink, 5},
    {style::Modifier::RapidBlink, 6},
    {style::Modifier::Reverse, 7},
    {style::Modifier::Hidden, 8},
    {style::Modifier::CrossedOut, 9},
}};

void append_sgr(std::string& out, const std::string& params) {
    out += backend::ansi::CSI;
    out += params;
    out += 'm';
}

// base: 30 for foreground, 40 for background. Bright named colors sit 60 above.
void append_color(std::string& out, const style::Color& color, int base) {
    using Kind = style::Color::Kind;
    switch (color.kind) {
        case Kind::Reset:
            return;
        case Kind::Named: {
            int code = color.index < 8 ? base + color.index : base + 60 + (color.index - 8);
            append_sgr(out, std::to_string(code));
            return;
        }
        case Kind::Indexed:
            append_sgr(out, std::to_string(base + 8) + ";5;" + std::to_string(color.index));
            return;
        case Kind::Rgb:
            append_sgr(out, std::to_string(base + 8) + ";2;" + std::to_string(color.r) + ";" +
                            std::to_string(color.g) + ";" + std::to_string(color.b));
            return;
    }
}

}

void FrameEncoder::append_foreground(std::string& out, const style::Color& color) {
    append_color(out, color, 30);
}

void FrameEncoder::append_background(std::string& out, const style::Color& color) {
    append_color(out, color, 40);
}

void FrameEncoder::append_modifiers(std::string& out, style::Modifier modifier) {
    for (const auto& m : SGR_MODIFIERS) {
        if (style::has_modifier(modifier, m.modifier)) {
            append_sgr(out, std::to_string(m.code));
        }
    }
}

void FrameEncoder::append_glyph(std::string& out, char32_t ch) {
    // Cells filled through Cell::set_char bypass the buffer's filtering
    if (util::is_control(ch)) {
        out += '?';
        return;
    }
    if (ch < 0x80) {
        out += static_cast<char>(ch);
        return;
    }
    if (!util::append_utf8(out, ch)) {
        out += '?';
    }
}

size_t FrameEncoder::encode(const std::vector<render::Update>& updates, std::string& out) {
    const size_t start = out.size();
    if (updates.empty()) return 0;

    // Sentinels: no position or style is known at the start of a frame
    int cursor_x = -1;
    int cursor_y = -1;
    int covered_x = -1; // column hidden behind the last wide glyph, on cursor_y
    bool have_style = false;
    style::Color fg;
    style::Color bg;
    style::Modifier modifier = style::Modifier::None;

    for (const auto& update : updates) {
        const auto& cell = update.cell;

        if (update.y == cursor_y && update.x == covered_x) {
            continue;
        }

        if (update.y != cursor_y || update.x != cursor_x) {
            out += backend::ansi::move_cursor(update.x, update.y);
        }

        if (!have_style || cell.fg != fg || cell.bg != bg || cell.modifier != modifier) {
            out += backend::ansi::SGR_RESET;
            append_foreground(out, cell.fg);
            append_background(out, cell.bg);
            append_modifiers(out, cell.modifier);
            fg = cell.fg;
            bg = cell.bg;
            modifier = cell.modifier;
            have_style = true;
        }

        int width = 1;
        if (util::is_scalar_value(cell.ch)) {
            width = util::display_width(cell.ch);
        }
        append_glyph(out, cell.ch);

        cursor_y = update.y;
        cursor_x = update.x + width;
        covered_x = width == 2 ? update.x + 1 : -1;
    }

    out += backend::ansi::SGR_RESET;
    return out.size() - start;
}

}  // namespace tessera::terminal
