#pragma once

#include "backend/BackendError.hpp"
#include "events/Event.hpp"
#include "render/Rect.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace tessera::backend {

enum class KeyboardProtocolMode {
    Legacy,
    Kitty
};

// Kitty progressive enhancement flags (CSI > flags u)
namespace keyboard_flags {
    inline constexpr uint32_t DisambiguateEscapeCodes = 0b1;
    inline constexpr uint32_t ReportEventTypes = 0b10;
    inline constexpr uint32_t ReportAlternateKeys = 0b100;
    inline constexpr uint32_t ReportAllKeysAsEscapeCodes = 0b1000;
    inline constexpr uint32_t ReportAssociatedText = 0b10000;
}

struct KeyboardProtocolOptions {
    KeyboardProtocolMode mode = KeyboardProtocolMode::Legacy;
    uint32_t flags = 0;
    bool use_push_pop = true;   // push/pop the terminal's flag stack instead of overwriting it
    bool detect_support = false; // probe with CSI ? u before enabling
    int timeout_ms = 50;         // probe timeout
};

/**
 * Terminal transport. The session controller talks to the terminal only
 * through this interface; every failing operation throws BackendError.
 */
class Backend {
public:
    virtual ~Backend() = default;

    // Character-at-a-time, unprocessed input. exit_raw_mode() without a
    // successful enter_raw_mode() is a no-op.
    virtual void enter_raw_mode() = 0;
    virtual void exit_raw_mode() = 0;

    virtual void enable_alternate_screen() = 0;
    virtual void disable_alternate_screen() = 0;
    virtual void clear_screen() = 0;

    // Zero-length writes are accepted and do nothing
    virtual void write(std::string_view data) = 0;
    virtual void flush() = 0;

    // Terminal size in cells. Throws BackendError(NotATerminal) when output
    // is not an interactive device.
    virtual render::Size get_size() = 0;

    // Blocks up to timeout_ms for one input event; Event::none() on timeout
    virtual events::Event poll_event(int timeout_ms) = 0;

    virtual void hide_cursor() = 0;
    virtual void show_cursor() = 0;
    virtual void set_cursor(int x, int y) = 0;

    virtual void enable_keyboard_protocol(const KeyboardProtocolOptions& options) = 0;
    virtual void disable_keyboard_protocol() = 0;

    virtual void enable_mouse() = 0;
    virtual void disable_mouse() = 0;

    // The graphics reply (ESC _ G ... ESC \\) the terminal sends back within
    // timeout_ms, or an empty string. Other input is kept for poll_event().
    virtual std::string read_response(int timeout_ms) = 0;
};

}  // namespace tessera::backend
