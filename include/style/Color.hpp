#pragma once

#include <cstdint>
#include <optional>

namespace tessera::style {

enum class NamedColor : uint8_t {
    Black = 0,
    Red = 1,
    Green = 2,
    Yellow = 3,
    Blue = 4,
    Magenta = 5,
    Cyan = 6,
    White = 7,

    // Bright/Bold variants
    BrightBlack = 8,
    BrightRed = 9,
    BrightGreen = 10,
    BrightYellow = 11,
    BrightBlue = 12,
    BrightMagenta = 13,
    BrightCyan = 14,
    BrightWhite = 15
};

/**
 * Terminal color: the terminal's default, one of the 16 named colors,
 * an entry of the 256-color palette, or a 24-bit RGB triple.
 */
struct Color {
    enum class Kind : uint8_t { Reset, Named, Indexed, Rgb };

    Kind kind = Kind::Reset;
    uint8_t index = 0; // NamedColor value or palette index
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    static constexpr Color reset() { return Color{}; }

    static constexpr Color named(NamedColor c) {
        return Color{Kind::Named, static_cast<uint8_t>(c), 0, 0, 0};
    }

    static constexpr Color indexed(uint8_t i) {
        return Color{Kind::Indexed, i, 0, 0, 0};
    }

    static constexpr Color rgb(uint8_t red, uint8_t green, uint8_t blue) {
        return Color{Kind::Rgb, 0, red, green, blue};
    }

    bool is_reset() const { return kind == Kind::Reset; }

    bool operator==(const Color& other) const = default;
};

enum class Modifier : uint16_t {
    None = 0,
    Bold = 1 << 0,
    Dim = 1 << 1,
    Italic = 1 << 2,
    Underline = 1 << 3,
    SlowBlink = 1 << 4,
    RapidBlink = 1 << 5,
    Reverse = 1 << 6,
    Hidden = 1 << 7,
    CrossedOut = 1 << 8
};

inline Modifier operator|(Modifier a, Modifier b) {
    return static_cast<Modifier>(static_cast<uint16_t>(a) | static_cast<uint16_t>(b));
}

inline Modifier operator&(Modifier a, Modifier b) {
    return static_cast<Modifier>(static_cast<uint16_t>(a) & static_cast<uint16_t>(b));
}

inline Modifier remove_modifier(Modifier set, Modifier remove) {
    return static_cast<Modifier>(static_cast<uint16_t>(set) & ~static_cast<uint16_t>(remove));
}

inline bool has_modifier(Modifier set, Modifier check) {
    return (static_cast<uint16_t>(set) & static_cast<uint16_t>(check)) != 0;
}

/**
 * A partial style. Unset colors leave the target cell's color alone when
 * the style is applied; modifiers are added to the cell's set.
 */
struct Style {
    std::optional<Color> fg;
    std::optional<Color> bg;
    Modifier modifier = Modifier::None;

    static Style with_fg(Color c) { Style s; s.fg = c; return s; }
    static Style with_bg(Color c) { Style s; s.bg = c; return s; }

    Style& add_modifier(Modifier m) {
        modifier = modifier | m;
        return *this;
    }

    // Values set in `other` win
    Style merge(const Style& other) const {
        Style out = *this;
        if (other.fg) out.fg = other.fg;
        if (other.bg) out.bg = other.bg;
        out.modifier = out.modifier | other.modifier;
        return out;
    }

    bool operator==(const Style& other) const = default;
};

}  // namespace tessera::style
