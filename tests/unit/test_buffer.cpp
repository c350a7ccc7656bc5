#include "../framework/SimpleTest.hpp"
#include "render/Buffer.hpp"
#include "util/UnicodeUtils.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

using namespace tessera::render;
using namespace tessera::style;

TEST_CASE(test_buffer_starts_blank) {
    Buffer buf(4, 3);
    ASSERT_EQ(buf.width(), 4);
    ASSERT_EQ(buf.height(), 3);
    ASSERT_EQ(buf.area(), (Rect{0, 0, 4, 3}));

    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 4; ++x) {
            const Cell* cell = buf.get(x, y);
            ASSERT_TRUE(cell != nullptr);
            ASSERT_TRUE(*cell == Cell{});
            ASSERT_TRUE(cell->ch == U' ');
        }
    }
}

TEST_CASE(test_buffer_get_out_of_range) {
    Buffer buf(2, 2);
    ASSERT_TRUE(buf.get(2, 0) == nullptr);
    ASSERT_TRUE(buf.get(0, 2) == nullptr);
    ASSERT_TRUE(buf.get(-1, 0) == nullptr);
    ASSERT_TRUE(buf.get(0, -1) == nullptr);

    // Writes outside the grid are dropped
    buf.set_char(5, 5, U'x');
    buf.set_string(0, 7, "hidden");
    ASSERT_TRUE(buf == Buffer(2, 2));
}

TEST_CASE(test_buffer_set_char_applies_style) {
    Buffer buf(3, 1);
    auto style = Style::with_fg(Color::named(NamedColor::Red)).add_modifier(Modifier::Bold);
    buf.set_char(1, 0, U'Q', style);

    const Cell* cell = buf.get(1, 0);
    ASSERT_TRUE(cell->ch == U'Q');
    ASSERT_EQ(cell->fg, Color::named(NamedColor::Red));
    ASSERT_TRUE(cell->bg.is_reset());
    ASSERT_TRUE(has_modifier(cell->modifier, Modifier::Bold));
}

TEST_CASE(test_buffer_set_char_rejects_surrogates) {
    Buffer buf(1, 1);
    buf.set_char(0, 0, static_cast<char32_t>(0xD800));
    ASSERT_TRUE(buf.get(0, 0)->ch == tessera::util::REPLACEMENT_CHARACTER);
}

TEST_CASE(test_buffer_set_char_replaces_controls) {
    Buffer buf(6, 1);
    buf.set_string(0, 0, "a\tb\033");
    ASSERT_TRUE(buf.get(0, 0)->ch == U'a');
    ASSERT_TRUE(buf.get(1, 0)->ch == tessera::util::REPLACEMENT_CHARACTER);
    ASSERT_TRUE(buf.get(2, 0)->ch == U'b');
    ASSERT_TRUE(buf.get(3, 0)->ch == tessera::util::REPLACEMENT_CHARACTER);

    buf.set_char(4, 0, static_cast<char32_t>(0x7F));
    buf.set_char(5, 0, static_cast<char32_t>(0x85));
    ASSERT_TRUE(buf.get(4, 0)->ch == tessera::util::REPLACEMENT_CHARACTER);
    ASSERT_TRUE(buf.get(5, 0)->ch == tessera::util::REPLACEMENT_CHARACTER);
}

TEST_CASE(test_buffer_set_string_clips_at_edge) {
    Buffer buf(5, 1);
    int end = buf.set_string(2, 0, "hello");
    ASSERT_EQ(end, 5);
    ASSERT_TRUE(buf.get(2, 0)->ch == U'h');
    ASSERT_TRUE(buf.get(3, 0)->ch == U'e');
    ASSERT_TRUE(buf.get(4, 0)->ch == U'l');
    ASSERT_TRUE(buf.get(1, 0)->ch == U' ');
}

TEST_CASE(test_buffer_set_string_negative_start) {
    Buffer buf(3, 1);
    int end = buf.set_string(-2, 0, "abcd");
    ASSERT_EQ(end, 2);
    ASSERT_TRUE(buf.get(0, 0)->ch == U'c');
    ASSERT_TRUE(buf.get(1, 0)->ch == U'd');
}

TEST_CASE(test_buffer_set_string_decodes_utf8) {
    Buffer buf(4, 1);
    buf.set_string(0, 0, "h\xC3\xA9!");
    ASSERT_TRUE(buf.get(0, 0)->ch == U'h');
    ASSERT_TRUE(buf.get(1, 0)->ch == U'\u00E9');
    ASSERT_TRUE(buf.get(2, 0)->ch == U'!');
}

TEST_CASE(test_buffer_set_string_wide_glyph) {
    Buffer buf(5, 1);
    buf.set_char(1, 0, U'x');
    buf.set_char(2, 0, U'y');
    int end = buf.set_string(1, 0, "\xE4\xB8\xAD");  // U+4E2D, two columns
    ASSERT_EQ(end, 3);
    ASSERT_TRUE(buf.get(1, 0)->ch == U'\u4E2D');
    ASSERT_TRUE(buf.get(2, 0)->ch == U' ');
}

TEST_CASE(test_buffer_wide_glyph_does_not_split_at_edge) {
    Buffer buf(3, 1);
    int end = buf.set_string(2, 0, "\xE4\xB8\xAD");
    ASSERT_EQ(end, 2);
    ASSERT_TRUE(buf.get(2, 0)->ch == U' ');
}

TEST_CASE(test_buffer_set_string_skips_combining_marks) {
    Buffer buf(3, 1);
    int end = buf.set_string(0, 0, "e\xCC\x81x");  // e + U+0301 + x
    ASSERT_EQ(end, 2);
    ASSERT_TRUE(buf.get(0, 0)->ch == U'e');
    ASSERT_TRUE(buf.get(1, 0)->ch == U'x');
}

TEST_CASE(test_buffer_set_string_truncated) {
    Buffer buf(10, 1);
    int end = buf.set_string_truncated(1, 0, "abcdef", 3);
    ASSERT_EQ(end, 4);
    ASSERT_TRUE(buf.get(3, 0)->ch == U'c');
    ASSERT_TRUE(buf.get(4, 0)->ch == U' ');

    ASSERT_EQ(buf.set_string_truncated(0, 0, "zz", 0), 0);
    ASSERT_TRUE(buf.get(0, 0)->ch == U' ');
}

TEST_CASE(test_buffer_fill_area_and_set_style) {
    Buffer buf(4, 4);
    buf.fill_area(Rect{2, 2, 5, 5}, U'#');
    ASSERT_TRUE(buf.get(1, 1)->ch == U' ');
    ASSERT_TRUE(buf.get(2, 2)->ch == U'#');
    ASSERT_TRUE(buf.get(3, 3)->ch == U'#');

    buf.set_style(Rect{0, 0, 1, 4}, Style::with_bg(Color::indexed(17)));
    ASSERT_EQ(buf.get(0, 3)->bg, Color::indexed(17));
    ASSERT_TRUE(buf.get(1, 3)->bg.is_reset());
    ASSERT_TRUE(buf.get(0, 3)->ch == U' ');
}

TEST_CASE(test_buffer_clear) {
    Buffer buf(3, 2);
    buf.set_string(0, 1, "abc", Style::with_fg(Color::rgb(1, 2, 3)));
    buf.clear();
    ASSERT_TRUE(buf == Buffer(3, 2));
}

TEST_CASE(test_buffer_resize_preserves_overlap) {
    Buffer buf(3, 3);
    buf.set_char(0, 0, U'a');
    buf.set_char(2, 2, U'z');
    buf.set_char(1, 1, U'm');

    buf.resize(2, 2);
    ASSERT_EQ(buf.width(), 2);
    ASSERT_EQ(buf.height(), 2);
    ASSERT_TRUE(buf.get(0, 0)->ch == U'a');
    ASSERT_TRUE(buf.get(1, 1)->ch == U'm');
    ASSERT_TRUE(buf.get(2, 2) == nullptr);

    buf.resize(4, 3);
    ASSERT_TRUE(buf.get(0, 0)->ch == U'a');
    ASSERT_TRUE(buf.get(1, 1)->ch == U'm');
    ASSERT_TRUE(buf.get(3, 2)->ch == U' ');
    ASSERT_EQ(buf.area(), (Rect{0, 0, 4, 3}));
}

TEST_CASE(test_diff_identical_is_empty) {
    Buffer a(5, 3);
    a.set_string(0, 0, "same");
    Buffer b = a;
    ASSERT_TRUE(a.diff(b).empty());
}

TEST_CASE(test_diff_reports_changes_row_major) {
    Buffer current(4, 3);
    Buffer next(4, 3);
    next.set_char(3, 2, U'c');
    next.set_char(1, 0, U'a');
    next.set_char(0, 1, U'b');

    auto updates = current.diff(next);
    ASSERT_EQ(updates.size(), 3u);
    ASSERT_EQ(updates[0].x, 1);
    ASSERT_EQ(updates[0].y, 0);
    ASSERT_TRUE(updates[0].cell.ch == U'a');
    ASSERT_EQ(updates[1].x, 0);
    ASSERT_EQ(updates[1].y, 1);
    ASSERT_EQ(updates[2].x, 3);
    ASSERT_EQ(updates[2].y, 2);
}

namespace {

// Deterministic filler so every run covers the same grids
struct GridFiller {
    uint32_t state;

    uint32_t next() {
        state = state * 1664525u + 1013904223u;
        return state >> 8;
    }

    void fill(Buffer& buf) {
        static const char32_t glyphs[] = {U'a', U'Z', U' ', U'#', U'\u00E9', U'\u4E2D', U'\u2500'};
        static const Color colors[] = {Color::reset(), Color::named(NamedColor::Red),
                                       Color::indexed(17), Color::rgb(1, 2, 3)};
        int writes = buf.width() * buf.height() / 2 + 1;
        for (int i = 0; i < writes; ++i) {
            int x = static_cast<int>(next() % static_cast<uint32_t>(buf.width()));
            int y = static_cast<int>(next() % static_cast<uint32_t>(buf.height()));
            Style style = Style::with_fg(colors[next() % 4]);
            style.bg = colors[next() % 4];
            if (next() % 3 == 0) style = style.add_modifier(Modifier::Bold);

            std::string text;
            tessera::util::append_utf8(text, glyphs[next() % 7]);
            buf.set_string(x, y, text, style);
        }
    }
};

}

TEST_CASE(test_diff_applied_reproduces_next) {
    const Size sizes[] = {{1, 1}, {3, 2}, {7, 5}, {16, 4}, {40, 12}};
    uint32_t seed = 7;
    for (const auto& size : sizes) {
        for (int round = 0; round < 8; ++round) {
            Buffer current(size.width, size.height);
            Buffer next(size.width, size.height);
            GridFiller filler{seed++};
            filler.fill(current);
            filler.fill(next);

            auto updates = current.diff(next);
            Buffer patched = current;
            int last_x = -1;
            int last_y = -1;
            for (const auto& u : updates) {
                ASSERT_TRUE(u.y > last_y || (u.y == last_y && u.x > last_x));
                last_x = u.x;
                last_y = u.y;
                *patched.get(u.x, u.y) = u.cell;
            }
            ASSERT_TRUE(patched == next);
            ASSERT_TRUE(patched.diff(next).empty());
        }
    }
}

TEST_CASE(test_diff_detects_style_only_change) {
    Buffer current(2, 1);
    Buffer next(2, 1);
    next.set_style(Rect{1, 0, 1, 1}, Style{}.add_modifier(Modifier::Italic));

    auto updates = current.diff(next);
    ASSERT_EQ(updates.size(), 1u);
    ASSERT_EQ(updates[0].x, 1);
}

TEST_CASE(test_diff_dimension_mismatch_throws) {
    Buffer a(2, 2);
    Buffer b(3, 2);
    ASSERT_THROWS(a.diff(b), std::invalid_argument);
    ASSERT_THROWS(a.copy_from(b), std::invalid_argument);
}

TEST_CASE(test_copy_from_makes_diff_empty) {
    Buffer current(3, 2);
    Buffer next(3, 2);
    next.set_string(0, 0, "xyz");
    ASSERT_FALSE(current.diff(next).empty());
    current.copy_from(next);
    ASSERT_TRUE(current.diff(next).empty());
}

TEST_CASE(test_rect_helpers) {
    Rect r{2, 3, 10, 4};
    ASSERT_EQ(r.area(), 40);
    ASSERT_EQ(r.right(), 12);
    ASSERT_EQ(r.bottom(), 7);
    ASSERT_TRUE(r.contains(2, 3));
    ASSERT_FALSE(r.contains(12, 3));

    ASSERT_EQ(r.inner(1), (Rect{3, 4, 8, 2}));
    ASSERT_TRUE(r.inner(3).empty());

    auto halves = r.split_horizontal(4);
    ASSERT_EQ(halves.left, (Rect{2, 3, 4, 4}));
    ASSERT_EQ(halves.right, (Rect{6, 3, 6, 4}));

    auto rows = r.split_vertical(10);
    ASSERT_EQ(rows.top, r);
    ASSERT_TRUE(rows.bottom.empty());

    ASSERT_EQ(r.intersection(Rect{0, 0, 5, 5}), (Rect{2, 3, 3, 2}));
    ASSERT_TRUE(r.intersection(Rect{50, 50, 1, 1}).empty());
}

TEST_CASE(test_style_merge) {
    auto base = Style::with_fg(Color::named(NamedColor::Green)).add_modifier(Modifier::Dim);
    auto over = Style::with_bg(Color::rgb(9, 9, 9)).add_modifier(Modifier::Underline);
    auto merged = base.merge(over);

    ASSERT_EQ(*merged.fg, Color::named(NamedColor::Green));
    ASSERT_EQ(*merged.bg, Color::rgb(9, 9, 9));
    ASSERT_TRUE(has_modifier(merged.modifier, Modifier::Dim));
    ASSERT_TRUE(has_modifier(merged.modifier, Modifier::Underline));
    ASSERT_FALSE(has_modifier(remove_modifier(merged.modifier, Modifier::Dim), Modifier::Dim));
}

int main() {
    return tessera::test::TestRunner::instance().run_all();
}
