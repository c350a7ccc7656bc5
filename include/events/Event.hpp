#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace tessera::events {

struct KeyModifiers {
    bool shift = false;
    bool ctrl = false;
    bool alt = false;
    bool meta = false;
    bool super = false;
    bool hyper = false;
    bool caps_lock = false;
    bool num_lock = false;

    bool any() const { return shift || ctrl || alt || meta || super || hyper; }

    bool operator==(const KeyModifiers& other) const = default;
};

struct KeyCode {
    enum class Type {
        Char,
        F,          // F1-F35, number in `value`
        Functional, // Kitty private-use key code in `value`
        Backspace,
        Enter,
        Left,
        Right,
        Up,
        Down,
        Home,
        End,
        PageUp,
        PageDown,
        Tab,
        BackTab,
        Delete,
        Insert,
        Esc,
        CapsLock,
        ScrollLock,
        NumLock,
        PrintScreen,
        Pause,
        Menu
    };

    Type type = Type::Char;
    uint32_t value = 0; // code point for Char

    static KeyCode from_char(char32_t c) { return KeyCode{Type::Char, static_cast<uint32_t>(c)}; }
    static KeyCode f(int n) { return KeyCode{Type::F, static_cast<uint32_t>(n)}; }
    static KeyCode of(Type t) { return KeyCode{t, 0}; }

    bool operator==(const KeyCode& other) const = default;
};

enum class KeyEventKind { Press, Repeat, Release };

struct KeyEvent {
    KeyCode code;
    KeyModifiers modifiers;
    KeyEventKind kind = KeyEventKind::Press;

    bool is_char(char32_t c) const {
        return code.type == KeyCode::Type::Char && code.value == static_cast<uint32_t>(c);
    }

    bool operator==(const KeyEvent& other) const = default;
};

enum class MouseButton { Left, Right, Middle, None };

enum class MouseEventKind { Down, Up, Drag, Moved, ScrollUp, ScrollDown };

struct MouseEvent {
    MouseEventKind kind = MouseEventKind::Moved;
    MouseButton button = MouseButton::None;
    int x = 0; // zero-based cell column
    int y = 0; // zero-based cell row
    KeyModifiers modifiers;

    bool operator==(const MouseEvent& other) const = default;
};

struct Event {
    enum class Type {
        None,
        Key,
        Mouse,
        Resize,
        FocusGained,
        FocusLost,
        Paste
    };

    Type type = Type::None;
    KeyEvent key;
    MouseEvent mouse;
    int width = 0;  // Resize
    int height = 0; // Resize
    std::string text; // Paste

    static Event none() { return Event{}; }

    static Event key_event(KeyEvent k) {
        Event e;
        e.type = Type::Key;
        e.key = k;
        return e;
    }

    static Event mouse_event(MouseEvent m) {
        Event e;
        e.type = Type::Mouse;
        e.mouse = m;
        return e;
    }

    static Event resize(int w, int h) {
        Event e;
        e.type = Type::Resize;
        e.width = w;
        e.height = h;
        return e;
    }

    static Event focus(bool gained) {
        Event e;
        e.type = gained ? Type::FocusGained : Type::FocusLost;
        return e;
    }

    static Event paste(std::string content) {
        Event e;
        e.type = Type::Paste;
        e.text = std::move(content);
        return e;
    }

    bool is_none() const { return type == Type::None; }
    bool is_resize() const { return type == Type::Resize; }

    bool is_char(char32_t c) const {
        return type == Type::Key && key.is_char(c);
    }

    bool is_key(KeyCode code) const {
        return type == Type::Key && key.code == code;
    }
};

}  // namespace tessera::events
