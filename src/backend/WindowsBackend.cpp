#include "backend/WindowsBackend.hpp"

#ifdef _WIN32

#include "backend/Ansi.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <chrono>

namespace tessera::backend {

namespace {

events::KeyModifiers modifiers_from(DWORD state) {
    events::KeyModifiers mods;
    mods.shift = (state & SHIFT_PRESSED) != 0;
    mods.ctrl = (state & (LEFT_CTRL_PRESSED | RIGHT_CTRL_PRESSED)) != 0;
    mods.alt = (state & (LEFT_ALT_PRESSED | RIGHT_ALT_PRESSED)) != 0;
    mods.caps_lock = (state & CAPSLOCK_ON) != 0;
    mods.num_lock = (state & NUMLOCK_ON) != 0;
    return mods;
}

bool virtual_key_code(WORD vk, events::KeyCode& code) {
    using Type = events::KeyCode::Type;
    switch (vk) {
        case VK_BACK:     code = events::KeyCode::of(Type::Backspace); return true;
        case VK_RETURN:   code = events::KeyCode::of(Type::Enter); return true;
        case VK_TAB:      code = events::KeyCode::of(Type::Tab); return true;
        case VK_ESCAPE:   code = events::KeyCode::of(Type::Esc); return true;
        case VK_LEFT:     code = events::KeyCode::of(Type::Left); return true;
        case VK_RIGHT:    code = events::KeyCode::of(Type::Right); return true;
        case VK_UP:       code = events::KeyCode::of(Type::Up); return true;
        case VK_DOWN:     code = events::KeyCode::of(Type::Down); return true;
        case VK_HOME:     code = events::KeyCode::of(Type::Home); return true;
        case VK_END:      code = events::KeyCode::of(Type::End); return true;
        case VK_PRIOR:    code = events::KeyCode::of(Type::PageUp); return true;
        case VK_NEXT:     code = events::KeyCode::of(Type::PageDown); return true;
        case VK_DELETE:   code = events::KeyCode::of(Type::Delete); return true;
        case VK_INSERT:   code = events::KeyCode::of(Type::Insert); return true;
        case VK_CAPITAL:  code = events::KeyCode::of(Type::CapsLock); return true;
        case VK_SCROLL:   code = events::KeyCode::of(Type::ScrollLock); return true;
        case VK_NUMLOCK:  code = events::KeyCode::of(Type::NumLock); return true;
        case VK_SNAPSHOT: code = events::KeyCode::of(Type::PrintScreen); return true;
        case VK_PAUSE:    code = events::KeyCode::of(Type::Pause); return true;
        case VK_APPS:     code = events::KeyCode::of(Type::Menu); return true;
        default: break;
    }
    if (vk >= VK_F1 && vk <= VK_F24) {
        code = events::KeyCode::f(vk - VK_F1 + 1);
        return true;
    }
    return false;
}

}

WindowsBackend::WindowsBackend() {
    in_ = GetStdHandle(STD_INPUT_HANDLE);
    out_ = GetStdHandle(STD_OUTPUT_HANDLE);
}

WindowsBackend::~WindowsBackend() {
    if (!raw_mode_) return;
    try {
        exit_raw_mode();
    } catch (const BackendError& e) {
        util::Logger::error(std::string("WindowsBackend: Failed to restore console: ") + e.what());
    }
}

void WindowsBackend::enter_raw_mode() {
    if (raw_mode_) return;

    if (!GetConsoleMode(in_, &original_in_mode_)) {
        throw BackendError(ErrorCode::NotATerminal, "GetConsoleMode(input): not a console");
    }
    if (!GetConsoleMode(out_, &original_out_mode_)) {
        throw BackendError(ErrorCode::NotATerminal, "GetConsoleMode(output): not a console");
    }

    DWORD in_mode = original_in_mode_;
    in_mode &= ~(ENABLE_ECHO_INPUT | ENABLE_LINE_INPUT | ENABLE_PROCESSED_INPUT | ENABLE_QUICK_EDIT_MODE);
    in_mode |= ENABLE_WINDOW_INPUT | ENABLE_EXTENDED_FLAGS;
    if (!SetConsoleMode(in_, in_mode)) {
        throw BackendError::from_win32(GetLastError(), "SetConsoleMode(input)");
    }

    DWORD out_mode = original_out_mode_ | ENABLE_VIRTUAL_TERMINAL_PROCESSING | ENABLE_PROCESSED_OUTPUT;
    if (!SetConsoleMode(out_, out_mode)) {
        DWORD err = GetLastError();
        SetConsoleMode(in_, original_in_mode_);
        throw BackendError::from_win32(err, "SetConsoleMode(output)");
    }

    original_output_cp_ = GetConsoleOutputCP();
    SetConsoleOutputCP(CP_UTF8);
    last_size_ = get_size();
    raw_mode_ = true;
    util::Logger::debug("WindowsBackend: Console raw mode enabled");
}

void WindowsBackend::exit_raw_mode() {
    if (!raw_mode_) return;
    raw_mode_ = false;

    if (original_output_cp_ != 0) {
        SetConsoleOutputCP(original_output_cp_);
    }
    bool in_ok = SetConsoleMode(in_, original_in_mode_) != 0;
    DWORD in_err = in_ok ? 0 : GetLastError();
    if (!SetConsoleMode(out_, original_out_mode_)) {
        throw BackendError::from_win32(GetLastError(), "SetConsoleMode(output)");
    }
    if (!in_ok) {
        throw BackendError::from_win32(in_err, "SetConsoleMode(input)");
    }
}

void WindowsBackend::enable_alternate_screen() {
    write_and_flush(ansi::ENTER_ALTERNATE_SCREEN);
}

void WindowsBackend::disable_alternate_screen() {
    write_and_flush(ansi::LEAVE_ALTERNATE_SCREEN);
}

void WindowsBackend::clear_screen() {
    write_and_flush(ansi::CLEAR_SCREEN);
}

void WindowsBackend::write(std::string_view data) {
    if (data.empty()) return;
    pending_output_.append(data);
}

void WindowsBackend::flush() {
    size_t written = 0;
    while (written < pending_output_.size()) {
        DWORD chunk = static_cast<DWORD>(std::min<size_t>(pending_output_.size() - written, 1 << 20));
        DWORD n = 0;
        if (!WriteFile(out_, pending_output_.data() + written, chunk, &n, nullptr)) {
            DWORD err = GetLastError();
            pending_output_.clear();
            throw BackendError::from_win32(err, "WriteFile");
        }
        written += n;
    }
    pending_output_.clear();
}

render::Size WindowsBackend::get_size() {
    CONSOLE_SCREEN_BUFFER_INFO info;
    if (!GetConsoleScreenBufferInfo(out_, &info)) {
        throw BackendError(ErrorCode::NotATerminal, "GetConsoleScreenBufferInfo: not a console");
    }
    return {info.srWindow.Right - info.srWindow.Left + 1,
            info.srWindow.Bottom - info.srWindow.Top + 1};
}

events::Event WindowsBackend::poll_event(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(std::max(timeout_ms, 0));

    while (true) {
        if (!queued_events_.empty()) {
            auto event = std::move(queued_events_.front());
            queued_events_.pop_front();
            return event;
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        DWORD wait = left > 0 ? static_cast<DWORD>(left) : 0;

        DWORD result = WaitForSingleObject(in_, wait);
        if (result == WAIT_TIMEOUT) {
            return events::Event::none();
        }
        if (result != WAIT_OBJECT_0) {
            throw BackendError::from_win32(GetLastError(), "WaitForSingleObject");
        }

        INPUT_RECORD records[32];
        DWORD count = 0;
        if (!ReadConsoleInputW(in_, records, 32, &count)) {
            throw BackendError::from_win32(GetLastError(), "ReadConsoleInputW");
        }
        for (DWORD i = 0; i < count; ++i) {
            events::Event event;
            if (translate(records[i], event)) {
                queued_events_.push_back(std::move(event));
            }
        }
        if (queued_events_.empty() && wait == 0) {
            return events::Event::none();
        }
    }
}

bool WindowsBackend::translate(const INPUT_RECORD& record, events::Event& out) {
    switch (record.EventType) {
        case KEY_EVENT:
            return translate_key(record.Event.KeyEvent, out);
        case MOUSE_EVENT:
            return mouse_enabled_ && translate_mouse(record.Event.MouseEvent, out);
        case WINDOW_BUFFER_SIZE_EVENT: {
            // The record carries the buffer size; the visible window is what we draw into
            auto size = get_size();
            if (size == last_size_) return false;
            last_size_ = size;
            out = events::Event::resize(size.width, size.height);
            return true;
        }
        case FOCUS_EVENT:
            out = events::Event::focus(record.Event.FocusEvent.bSetFocus != 0);
            return true;
        default:
            return false;
    }
}

bool WindowsBackend::translate_key(const KEY_EVENT_RECORD& key, events::Event& out) {
    events::KeyEvent ev;
    if (!key.bKeyDown) {
        if (!report_all_key_events_) return false;
        ev.kind = events::KeyEventKind::Release;
    } else if (key.wRepeatCount > 1 && report_all_key_events_) {
        ev.kind = events::KeyEventKind::Repeat;
    }

    DWORD state = key.dwControlKeyState;
    // AltGr is reported as Ctrl+Alt; treat it as plain text input
    const DWORD altgr = LEFT_CTRL_PRESSED | RIGHT_ALT_PRESSED;
    if ((state & altgr) == altgr) state &= ~altgr;
    ev.modifiers = modifiers_from(state);

    if (virtual_key_code(key.wVirtualKeyCode, ev.code)) {
        if (ev.code.type == events::KeyCode::Type::Tab && ev.modifiers.shift) {
            ev.code = events::KeyCode::of(events::KeyCode::Type::BackTab);
        }
        out = events::Event::key_event(ev);
        return true;
    }

    char32_t ch = key.uChar.UnicodeChar;
    if (ch == 0) return false; // Bare modifier keys
    if (ch >= 0xD800 && ch <= 0xDFFF) return false; // Split surrogates are not reassembled

    // Ctrl+letter arrives as a C0 control character
    if (ch < 0x20 && ev.modifiers.ctrl) {
        ch = ch + 0x60;
    }
    if (!util::is_scalar_value(ch)) return false;

    ev.code = events::KeyCode::from_char(ch);
    out = events::Event::key_event(ev);
    return true;
}

bool WindowsBackend::translate_mouse(const MOUSE_EVENT_RECORD& mouse, events::Event& out) {
    events::MouseEvent ev;
    ev.x = mouse.dwMousePosition.X;
    ev.y = mouse.dwMousePosition.Y;
    ev.modifiers = modifiers_from(mouse.dwControlKeyState);

    auto button_of = [](DWORD buttons) {
        if (buttons & FROM_LEFT_1ST_BUTTON_PRESSED) return events::MouseButton::Left;
        if (buttons & RIGHTMOST_BUTTON_PRESSED) return events::MouseButton::Right;
        if (buttons & FROM_LEFT_2ND_BUTTON_PRESSED) return events::MouseButton::Middle;
        return events::MouseButton::None;
    };

    DWORD buttons = mouse.dwButtonState & 0xFFFF;
    switch (mouse.dwEventFlags) {
        case MOUSE_WHEELED: {
            auto delta = static_cast<short>(HIWORD(mouse.dwButtonState));
            ev.kind = delta > 0 ? events::MouseEventKind::ScrollUp : events::MouseEventKind::ScrollDown;
            break;
        }
        case MOUSE_MOVED:
            ev.button = button_of(buttons);
            ev.kind = buttons ? events::MouseEventKind::Drag : events::MouseEventKind::Moved;
            break;
        case 0:
        case DOUBLE_CLICK: {
            DWORD pressed = buttons & ~last_mouse_buttons_;
            DWORD released = last_mouse_buttons_ & ~buttons;
            if (pressed) {
                ev.kind = events::MouseEventKind::Down;
                ev.button = button_of(pressed);
            } else if (released) {
                ev.kind = events::MouseEventKind::Up;
                ev.button = button_of(released);
            } else {
                return false;
            }
            break;
        }
        default:
            return false;
    }

    last_mouse_buttons_ = buttons;
    out = events::Event::mouse_event(ev);
    return true;
}

void WindowsBackend::hide_cursor() {
    write_and_flush(ansi::HIDE_CURSOR);
}

void WindowsBackend::show_cursor() {
    write_and_flush(ansi::SHOW_CURSOR);
}

void WindowsBackend::set_cursor(int x, int y) {
    write_and_flush(ansi::move_cursor(x, y));
}

void WindowsBackend::enable_keyboard_protocol(const KeyboardProtocolOptions& options) {
    // Console input records always carry full key information; kitty mode
    // only widens what gets reported.
    report_all_key_events_ = options.mode == KeyboardProtocolMode::Kitty;
}

void WindowsBackend::disable_keyboard_protocol() {
    report_all_key_events_ = false;
}

void WindowsBackend::enable_mouse() {
    DWORD mode = 0;
    if (!GetConsoleMode(in_, &mode)) {
        throw BackendError::from_win32(GetLastError(), "GetConsoleMode(input)");
    }
    if (!SetConsoleMode(in_, (mode | ENABLE_MOUSE_INPUT | ENABLE_EXTENDED_FLAGS) & ~ENABLE_QUICK_EDIT_MODE)) {
        throw BackendError::from_win32(GetLastError(), "SetConsoleMode(input)");
    }
    mouse_enabled_ = true;
}

void WindowsBackend::disable_mouse() {
    DWORD mode = 0;
    if (!GetConsoleMode(in_, &mode)) {
        throw BackendError::from_win32(GetLastError(), "GetConsoleMode(input)");
    }
    if (!SetConsoleMode(in_, mode & ~ENABLE_MOUSE_INPUT)) {
        throw BackendError::from_win32(GetLastError(), "SetConsoleMode(input)");
    }
    mouse_enabled_ = false;
}

std::string WindowsBackend::read_response(int timeout_ms) {
    // Console input records do not carry terminal replies
    (void)timeout_ms;
    return {};
}

void WindowsBackend::write_and_flush(std::string_view data) {
    write(data);
    flush();
}

}  // namespace tessera::backend

#endif
