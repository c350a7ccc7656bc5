#pragma once

#include "backend/Backend.hpp"
#include "backend/InputParser.hpp"
#include <deque>
#include <string>

#ifndef _WIN32
#include <csignal>
#include <termios.h>
#include <unistd.h>
#endif

namespace tessera::backend {

#ifndef _WIN32

/**
 * POSIX terminal transport.
 *
 * Raw mode through termios, size through TIOCGWINSZ, resize notification
 * through SIGWINCH. Output is accumulated by write() and delivered by flush().
 */
class AnsiBackend : public Backend {
public:
    explicit AnsiBackend(int in_fd = STDIN_FILENO, int out_fd = STDOUT_FILENO);
    ~AnsiBackend() override;

    AnsiBackend(const AnsiBackend&) = delete;
    AnsiBackend& operator=(const AnsiBackend&) = delete;

    void enter_raw_mode() override;
    void exit_raw_mode() override;

    void enable_alternate_screen() override;
    void disable_alternate_screen() override;
    void clear_screen() override;

    void write(std::string_view data) override;
    void flush() override;

    render::Size get_size() override;
    events::Event poll_event(int timeout_ms) override;

    void hide_cursor() override;
    void show_cursor() override;
    void set_cursor(int x, int y) override;

    void enable_keyboard_protocol(const KeyboardProtocolOptions& options) override;
    void disable_keyboard_protocol() override;

    void enable_mouse() override;
    void disable_mouse() override;

    std::string read_response(int timeout_ms) override;

    bool in_raw_mode() const { return raw_mode_; }
    bool keyboard_protocol_active() const { return kitty_active_; }

private:
    // Reads whatever is available within wait_ms into the parser.
    // Returns bytes read, 0 on timeout, -1 when interrupted by a signal.
    int read_input(int wait_ms);

    bool detect_keyboard_protocol(int timeout_ms);
    void write_and_flush(std::string_view data);

    int in_fd_;
    int out_fd_;
    bool raw_mode_ = false;
    ::termios original_termios_{};
    struct sigaction previous_sigwinch_{};

    std::string pending_output_;
    InputParser parser_;
    std::deque<events::Event> queued_events_;

    bool kitty_active_ = false;
    bool kitty_push_pop_ = true;
};

#endif

}  // namespace tessera::backend
