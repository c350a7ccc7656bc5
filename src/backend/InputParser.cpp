#include "backend/InputParser.hpp"
#include "util/UnicodeUtils.hpp"
#include <charconv>
#include <vector>

namespace tessera::backend {

using events::Event;
using events::KeyCode;
using events::KeyEvent;
using events::KeyEventKind;
using events::KeyModifiers;
using events::MouseButton;
using events::MouseEvent;
using events::MouseEventKind;

namespace {
    // A CSI sequence with no final byte after this many bytes is junk
    constexpr size_t MAX_CSI_LENGTH = 64;
    // Graphics replies are short; anything longer without a terminator is junk
    constexpr size_t MAX_APC_LENGTH = 4096;

    constexpr std::string_view PASTE_START = "\033[200~";
    constexpr std::string_view PASTE_END = "\033[201~";

    size_t utf8_sequence_length(unsigned char c) {
        if ((c & 0x80) == 0) return 1;
        if ((c & 0xE0) == 0xC0) return 2;
        if ((c & 0xF0) == 0xE0) return 3;
        if ((c & 0xF8) == 0xF0) return 4;
        return 0; // continuation or invalid lead byte
    }

    // "1;5:3" -> {{1}, {5, 3}}; empty fields read as 0
    std::vector<std::vector<int>> split_params(std::string_view params) {
        std::vector<std::vector<int>> out;
        if (params.empty()) return out;

        size_t start = 0;
        while (true) {
            size_t semi = params.find(';', start);
            std::string_view field = params.substr(
                start, semi == std::string_view::npos ? std::string_view::npos : semi - start);

            std::vector<int> sub;
            size_t s = 0;
            while (true) {
                size_t colon = field.find(':', s);
                std::string_view piece = field.substr(
                    s, colon == std::string_view::npos ? std::string_view::npos : colon - s);
                int value = 0;
                auto [ptr, ec] = std::from_chars(piece.data(), piece.data() + piece.size(), value);
                if (ec != std::errc()) value = 0;
                sub.push_back(value);
                if (colon == std::string_view::npos) break;
                s = colon + 1;
            }
            out.push_back(std::move(sub));

            if (semi == std::string_view::npos) break;
            start = semi + 1;
        }
        return out;
    }

    int param_at(const std::vector<std::vector<int>>& params, size_t i, size_t j, int fallback) {
        if (i >= params.size() || j >= params[i].size()) return fallback;
        return params[i][j];
    }

    // xterm/Kitty modifier parameter: 1 + bitmask
    KeyModifiers modifiers_from_param(int value) {
        KeyModifiers mods;
        if (value <= 1) return mods;
        int bits = value - 1;
        mods.shift = bits & 1;
        mods.alt = bits & 2;
        mods.ctrl = bits & 4;
        mods.super = bits & 8;
        mods.hyper = bits & 16;
        mods.meta = bits & 32;
        mods.caps_lock = bits & 64;
        mods.num_lock = bits & 128;
        return mods;
    }

    KeyEventKind kind_from_param(int value) {
        switch (value) {
            case 2: return KeyEventKind::Repeat;
            case 3: return KeyEventKind::Release;
            default: return KeyEventKind::Press;
        }
    }

    KeyEvent key_from_codepoint(char32_t cp) {
        KeyEvent key;
        switch (cp) {
            case U'\r':
            case U'\n': key.code = KeyCode::of(KeyCode::Type::Enter); return key;
            case U'\t': key.code = KeyCode::of(KeyCode::Type::Tab); return key;
            case 0x7F:
            case 0x08: key.code = KeyCode::of(KeyCode::Type::Backspace); return key;
            case 0x1B: key.code = KeyCode::of(KeyCode::Type::Esc); return key;
            case 0x00:
                key.code = KeyCode::from_char(U' ');
                key.modifiers.ctrl = true;
                return key;
            default: break;
        }

        if (cp >= 0x01 && cp <= 0x1A) {
            key.code = KeyCode::from_char(U'a' + (cp - 0x01));
            key.modifiers.ctrl = true;
        } else if (cp >= 0x1C && cp <= 0x1F) {
            key.code = KeyCode::from_char(cp + 0x40);
            key.modifiers.ctrl = true;
        } else {
            key.code = KeyCode::from_char(cp);
        }
        return key;
    }

    // Kitty keyboard protocol key numbers (CSI code u)
    KeyCode key_from_kitty_code(int code) {
        switch (code) {
            case 27:    return KeyCode::of(KeyCode::Type::Esc);
            case 13:    return KeyCode::of(KeyCode::Type::Enter);
            case 9:     return KeyCode::of(KeyCode::Type::Tab);
            case 127:   return KeyCode::of(KeyCode::Type::Backspace);
            case 57358: return KeyCode::of(KeyCode::Type::CapsLock);
            case 57359: return KeyCode::of(KeyCode::Type::ScrollLock);
            case 57360: return KeyCode::of(KeyCode::Type::NumLock);
            case 57361: return KeyCode::of(KeyCode::Type::PrintScreen);
            case 57362: return KeyCode::of(KeyCode::Type::Pause);
            case 57363: return KeyCode::of(KeyCode::Type::Menu);
            default: break;
        }
        if (code >= 57376 && code <= 57398) return KeyCode::f(13 + (code - 57376));
        if (code >= 57344 && code <= 63743) {
            return KeyCode{KeyCode::Type::Functional, static_cast<uint32_t>(code)};
        }
        if (code >= 0 && util::is_scalar_value(static_cast<char32_t>(code))) {
            return KeyCode::from_char(static_cast<char32_t>(code));
        }
        return KeyCode::from_char(util::REPLACEMENT_CHARACTER);
    }

    // CSI number ~
    bool key_from_tilde(int number, KeyCode& out) {
        switch (number) {
            case 1: case 7: out = KeyCode::of(KeyCode::Type::Home); return true;
            case 2:  out = KeyCode::of(KeyCode::Type::Insert); return true;
            case 3:  out = KeyCode::of(KeyCode::Type::Delete); return true;
            case 4: case 8: out = KeyCode::of(KeyCode::Type::End); return true;
            case 5:  out = KeyCode::of(KeyCode::Type::PageUp); return true;
            case 6:  out = KeyCode::of(KeyCode::Type::PageDown); return true;
            case 11: out = KeyCode::f(1); return true;
            case 12: out = KeyCode::f(2); return true;
            case 13: out = KeyCode::f(3); return true;
            case 14: out = KeyCode::f(4); return true;
            case 15: out = KeyCode::f(5); return true;
            case 17: out = KeyCode::f(6); return true;
            case 18: out = KeyCode::f(7); return true;
            case 19: out = KeyCode::f(8); return true;
            case 20: out = KeyCode::f(9); return true;
            case 21: out = KeyCode::f(10); return true;
            case 23: out = KeyCode::f(11); return true;
            case 24: out = KeyCode::f(12); return true;
            case 25: out = KeyCode::f(13); return true;
            case 26: out = KeyCode::f(14); return true;
            case 28: out = KeyCode::f(15); return true;
            case 29: out = KeyCode::f(16); return true;
            case 31: out = KeyCode::f(17); return true;
            case 32: out = KeyCode::f(18); return true;
            case 33: out = KeyCode::f(19); return true;
            case 34: out = KeyCode::f(20); return true;
            default: return false;
        }
    }

    // CSI [1;mods] letter and SS3 letter
    bool key_from_letter(char final_byte, KeyCode& out) {
        switch (final_byte) {
            case 'A': out = KeyCode::of(KeyCode::Type::Up); return true;
            case 'B': out = KeyCode::of(KeyCode::Type::Down); return true;
            case 'C': out = KeyCode::of(KeyCode::Type::Right); return true;
            case 'D': out = KeyCode::of(KeyCode::Type::Left); return true;
            case 'H': out = KeyCode::of(KeyCode::Type::Home); return true;
            case 'F': out = KeyCode::of(KeyCode::Type::End); return true;
            case 'P': out = KeyCode::f(1); return true;
            case 'Q': out = KeyCode::f(2); return true;
            case 'R': out = KeyCode::f(3); return true;
            case 'S': out = KeyCode::f(4); return true;
            default: return false;
        }
    }
}

void InputParser::feed(std::string_view bytes) {
    buffer_.append(bytes.data(), bytes.size());
}

void InputParser::absorb_replies(Parsed& parsed) {
    if (parsed.keyboard_flags) keyboard_flags_reply_ = parsed.keyboard_flags;
    if (parsed.graphics_reply) graphics_reply_ = std::move(parsed.graphics_reply);
}

std::optional<Event> InputParser::next() {
    while (!buffer_.empty()) {
        Parsed parsed = parse_one(false);
        if (parsed.status == Status::Incomplete) return std::nullopt;

        absorb_replies(parsed);
        buffer_.erase(0, parsed.consumed);
        if (parsed.status == Status::Produced) return parsed.event;
    }
    return std::nullopt;
}

std::optional<Event> InputParser::flush_pending() {
    while (!buffer_.empty()) {
        Parsed parsed = parse_one(true);
        // An unterminated bracketed paste stays buffered
        if (parsed.status == Status::Incomplete) return std::nullopt;

        absorb_replies(parsed);
        buffer_.erase(0, parsed.consumed);
        if (parsed.status == Status::Produced) return parsed.event;
    }
    return std::nullopt;
}

std::optional<uint32_t> InputParser::take_keyboard_flags_reply() {
    auto reply = keyboard_flags_reply_;
    keyboard_flags_reply_.reset();
    return reply;
}

std::optional<std::string> InputParser::take_graphics_reply() {
    auto reply = std::move(graphics_reply_);
    graphics_reply_.reset();
    return reply;
}

InputParser::Parsed InputParser::parse_one(bool force) const {
    if (static_cast<unsigned char>(buffer_[0]) == 0x1B) {
        return parse_escape(force);
    }

    Parsed parsed = parse_text(0, false);
    if (parsed.status == Status::Incomplete && force) {
        // Truncated UTF-8 at the end of input
        parsed.status = Status::Produced;
        parsed.consumed = buffer_.size();
        parsed.event = Event::key_event(key_from_codepoint(util::REPLACEMENT_CHARACTER));
    }
    return parsed;
}

InputParser::Parsed InputParser::parse_escape(bool force) const {
    Parsed esc_key;
    esc_key.status = Status::Produced;
    esc_key.consumed = 1;
    esc_key.event = Event::key_event(KeyEvent{KeyCode::of(KeyCode::Type::Esc), {}, KeyEventKind::Press});

    if (buffer_.size() == 1) {
        if (force) return esc_key;
        return Parsed{};
    }

    Parsed parsed;
    switch (buffer_[1]) {
        case '[':
            parsed = parse_csi();
            break;
        case 'O':
            parsed = parse_ss3();
            break;
        case '_':
            parsed = parse_apc();
            break;
        case '\033':
            return esc_key;
        default:
            parsed = parse_text(1, true);
            break;
    }

    if (parsed.status == Status::Incomplete && force) {
        // Paste bodies may legitimately span many reads
        if (std::string_view(buffer_).substr(0, PASTE_START.size()) == PASTE_START) return parsed;
        return esc_key;
    }
    return parsed;
}

InputParser::Parsed InputParser::parse_text(size_t offset, bool alt) const {
    Parsed parsed;
    auto lead = static_cast<unsigned char>(buffer_[offset]);
    size_t len = utf8_sequence_length(lead);

    if (len == 0) {
        parsed.status = Status::Produced;
        parsed.consumed = offset + 1;
        parsed.event = Event::key_event(key_from_codepoint(util::REPLACEMENT_CHARACTER));
        return parsed;
    }
    // A byte that cannot continue the sequence ends it early; that byte is
    // decoded on its own next time round
    for (size_t i = offset + 1; i < offset + len && i < buffer_.size(); ++i) {
        if ((static_cast<unsigned char>(buffer_[i]) & 0xC0) != 0x80) {
            parsed.status = Status::Produced;
            parsed.consumed = offset + 1;
            parsed.event = Event::key_event(key_from_codepoint(util::REPLACEMENT_CHARACTER));
            return parsed;
        }
    }
    if (buffer_.size() < offset + len) return parsed; // Incomplete

    std::u32string decoded = util::decode_utf8(std::string_view(buffer_).substr(offset, len));
    char32_t cp = decoded.empty() ? util::REPLACEMENT_CHARACTER : decoded.front();

    KeyEvent key = key_from_codepoint(cp);
    if (alt) key.modifiers.alt = true;

    parsed.status = Status::Produced;
    parsed.consumed = offset + len;
    parsed.event = Event::key_event(key);
    return parsed;
}

InputParser::Parsed InputParser::parse_ss3() const {
    Parsed parsed;
    if (buffer_.size() < 3) return parsed;

    parsed.consumed = 3;
    KeyCode code;
    if (key_from_letter(buffer_[2], code)) {
        parsed.status = Status::Produced;
        parsed.event = Event::key_event(KeyEvent{code, {}, KeyEventKind::Press});
    } else {
        parsed.status = Status::Skipped;
    }
    return parsed;
}

InputParser::Parsed InputParser::parse_apc() const {
    Parsed parsed;
    size_t end = buffer_.find("\033\\", 2);
    if (end == std::string::npos) {
        if (buffer_.size() > MAX_APC_LENGTH) {
            parsed.status = Status::Skipped;
            parsed.consumed = 2;
        }
        return parsed;
    }

    parsed.status = Status::Skipped;
    parsed.consumed = end + 2;
    if (buffer_.compare(0, 3, "\033_G") == 0) {
        parsed.graphics_reply = buffer_.substr(0, end + 2);
    }
    return parsed;
}

InputParser::Parsed InputParser::parse_csi() const {
    Parsed parsed;
    std::string_view view(buffer_);

    if (view.substr(0, PASTE_START.size()) == PASTE_START) {
        size_t end = view.find(PASTE_END, PASTE_START.size());
        if (end == std::string_view::npos) return parsed;

        parsed.status = Status::Produced;
        parsed.consumed = end + PASTE_END.size();
        parsed.event = Event::paste(std::string(view.substr(PASTE_START.size(), end - PASTE_START.size())));
        return parsed;
    }

    // Locate the final byte (0x40-0x7E); parameters and intermediates are 0x20-0x3F
    size_t i = 2;
    for (; i < view.size(); ++i) {
        auto ch = static_cast<unsigned char>(view[i]);
        if (ch >= 0x40 && ch <= 0x7E) break;
        if (ch < 0x20 || ch > 0x7E) {
            // Malformed: drop what we have and resume at the offending byte
            parsed.status = Status::Skipped;
            parsed.consumed = i;
            return parsed;
        }
    }
    if (i >= view.size()) {
        if (view.size() > MAX_CSI_LENGTH) {
            parsed.status = Status::Skipped;
            parsed.consumed = 2;
        }
        return parsed;
    }

    char final_byte = view[i];
    parsed.consumed = i + 1;
    parsed.status = Status::Skipped;

    size_t start = 2;
    char prefix = 0;
    if (start < i && (view[start] == '<' || view[start] == '=' || view[start] == '>' || view[start] == '?')) {
        prefix = view[start];
        ++start;
    }
    auto params = split_params(view.substr(start, i - start));

    // Kitty keyboard flags reply: CSI ? flags u
    if (prefix == '?' && final_byte == 'u') {
        parsed.keyboard_flags = static_cast<uint32_t>(param_at(params, 0, 0, 0));
        return parsed;
    }

    // SGR mouse: CSI < Cb ; Cx ; Cy M|m
    if (prefix == '<' && (final_byte == 'M' || final_byte == 'm')) {
        if (params.size() < 3) return parsed;

        int cb = param_at(params, 0, 0, 0);
        MouseEvent mouse;
        mouse.x = param_at(params, 1, 0, 1) - 1;
        mouse.y = param_at(params, 2, 0, 1) - 1;
        mouse.modifiers.shift = cb & 4;
        mouse.modifiers.alt = cb & 8;
        mouse.modifiers.ctrl = cb & 16;

        switch (cb & 3) {
            case 0: mouse.button = MouseButton::Left; break;
            case 1: mouse.button = MouseButton::Middle; break;
            case 2: mouse.button = MouseButton::Right; break;
            default: mouse.button = MouseButton::None; break;
        }

        if (cb & 64) {
            mouse.kind = (cb & 1) ? MouseEventKind::ScrollDown : MouseEventKind::ScrollUp;
            mouse.button = MouseButton::None;
        } else if (cb & 32) {
            mouse.kind = mouse.button == MouseButton::None ? MouseEventKind::Moved : MouseEventKind::Drag;
        } else {
            mouse.kind = final_byte == 'M' ? MouseEventKind::Down : MouseEventKind::Up;
        }

        parsed.status = Status::Produced;
        parsed.event = Event::mouse_event(mouse);
        return parsed;
    }

    if (prefix != 0) return parsed; // DA replies and other private sequences

    if (params.empty() && (final_byte == 'I' || final_byte == 'O')) {
        parsed.status = Status::Produced;
        parsed.event = Event::focus(final_byte == 'I');
        return parsed;
    }

    KeyEvent key;
    key.modifiers = modifiers_from_param(param_at(params, 1, 0, 1));
    key.kind = kind_from_param(param_at(params, 1, 1, 1));

    switch (final_byte) {
        case 'u':
            key.code = key_from_kitty_code(param_at(params, 0, 0, 0));
            break;
        case '~':
            if (!key_from_tilde(param_at(params, 0, 0, 0), key.code)) return parsed;
            break;
        case 'Z':
            key.code = KeyCode::of(KeyCode::Type::BackTab);
            key.modifiers.shift = true;
            break;
        case 'R':
            // Bare CSI R is a cursor position report, not F3
            if (params.size() != 2 || param_at(params, 0, 0, 0) != 1) return parsed;
            key.code = KeyCode::f(3);
            break;
        default:
            if (!key_from_letter(final_byte, key.code)) return parsed;
            break;
    }

    parsed.status = Status::Produced;
    parsed.event = Event::key_event(key);
    return parsed;
}

}  // namespace tessera::backend
