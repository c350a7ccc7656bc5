#pragma once

#include "events/Event.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tessera::backend {

/**
 * Incremental decoder for terminal input bytes.
 *
 * Bytes are appended with feed(); next() yields one complete event at a time
 * and leaves incomplete sequences buffered until more bytes arrive. Replies
 * to capability queries (Kitty keyboard flags, Kitty graphics APC) are taken
 * out of the stream and kept aside so they never surface as key presses.
 */
class InputParser {
public:
    void feed(std::string_view bytes);

    std::optional<events::Event> next();

    // Treat the buffered bytes as complete: a lone ESC becomes the Esc key.
    std::optional<events::Event> flush_pending();

    bool has_pending() const { return !buffer_.empty(); }

    std::optional<uint32_t> take_keyboard_flags_reply();
    std::optional<std::string> take_graphics_reply();

private:
    enum class Status { Incomplete, Skipped, Produced };

    struct Parsed {
        Status status = Status::Incomplete;
        size_t consumed = 0;
        events::Event event;
        std::optional<uint32_t> keyboard_flags;
        std::optional<std::string> graphics_reply;
    };

    void absorb_replies(Parsed& parsed);

    Parsed parse_one(bool force) const;
    Parsed parse_escape(bool force) const;
    Parsed parse_csi() const;
    Parsed parse_ss3() const;
    Parsed parse_apc() const;
    Parsed parse_text(size_t offset, bool alt) const;

    std::string buffer_;
    std::optional<uint32_t> keyboard_flags_reply_;
    std::optional<std::string> graphics_reply_;
};

}  // namespace tessera::backend
