#pragma once

#include <cstdint>
#include <string>

// Escape sequences shared by the ANSI transport, the console transport
// (virtual-terminal processing) and the frame encoder.
namespace tessera::backend::ansi {

inline constexpr const char* CSI = "\033[";
inline constexpr const char* ST = "\033\\";

inline constexpr const char* ENTER_ALTERNATE_SCREEN = "\033[?1049h";
inline constexpr const char* LEAVE_ALTERNATE_SCREEN = "\033[?1049l";
inline constexpr const char* CLEAR_SCREEN = "\033[2J\033[H";
inline constexpr const char* HIDE_CURSOR = "\033[?25l";
inline constexpr const char* SHOW_CURSOR = "\033[?25h";
inline constexpr const char* SGR_RESET = "\033[0m";

// Normal tracking, button-event (drag) tracking, SGR extended coordinates
inline constexpr const char* ENABLE_MOUSE = "\033[?1000h\033[?1002h\033[?1006h";
inline constexpr const char* DISABLE_MOUSE = "\033[?1006l\033[?1002l\033[?1000l";

inline constexpr const char* ENABLE_BRACKETED_PASTE = "\033[?2004h";
inline constexpr const char* DISABLE_BRACKETED_PASTE = "\033[?2004l";
inline constexpr const char* ENABLE_FOCUS_EVENTS = "\033[?1004h";
inline constexpr const char* DISABLE_FOCUS_EVENTS = "\033[?1004l";

inline constexpr const char* QUERY_KEYBOARD_FLAGS = "\033[?u";
inline constexpr const char* POP_KEYBOARD_FLAGS = "\033[<u";
inline constexpr const char* RESET_KEYBOARD_FLAGS = "\033[=0;1u";

// Zero-based coordinates in, one-based sequence out
inline std::string move_cursor(int x, int y) {
    return std::string(CSI) + std::to_string(y + 1) + ";" + std::to_string(x + 1) + "H";
}

inline std::string push_keyboard_flags(uint32_t flags) {
    return std::string(CSI) + ">" + std::to_string(flags) + "u";
}

inline std::string set_keyboard_flags(uint32_t flags) {
    return std::string(CSI) + "=" + std::to_string(flags) + ";1u";
}

}  // namespace tessera::backend::ansi
