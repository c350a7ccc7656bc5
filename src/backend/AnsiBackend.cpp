#include "backend/AnsiBackend.hpp"

#ifndef _WIN32

#include "backend/Ansi.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <sys/ioctl.h>

namespace tessera::backend {

// Only the flag is touched in the handler; the size is read later with ioctl
static volatile std::sig_atomic_t g_resize_pending = 0;

static void sigwinch_handler(int) {
    g_resize_pending = 1;
}

namespace {

// How long a lone ESC waits for the rest of a sequence before it is a key
constexpr int ESCAPE_TIMEOUT_MS = 25;
constexpr size_t READ_CHUNK = 1024;

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

}

AnsiBackend::AnsiBackend(int in_fd, int out_fd)
    : in_fd_(in_fd), out_fd_(out_fd) {}

AnsiBackend::~AnsiBackend() {
    if (!raw_mode_) return;
    try {
        exit_raw_mode();
    } catch (const BackendError& e) {
        util::Logger::error(std::string("AnsiBackend: Failed to restore terminal: ") + e.what());
    }
}

void AnsiBackend::enter_raw_mode() {
    if (raw_mode_) return;

    if (!::isatty(in_fd_)) {
        throw BackendError(ErrorCode::NotATerminal, "enter_raw_mode: input is not a terminal");
    }
    if (::tcgetattr(in_fd_, &original_termios_) != 0) {
        throw BackendError::from_errno(errno, "tcgetattr");
    }

    ::termios raw = original_termios_;
    raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON); // No flow control, no CR->NL
    raw.c_cflag |= CS8;
    raw.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);           // Ctrl+C arrives as a key
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(in_fd_, TCSAFLUSH, &raw) != 0) {
        throw BackendError::from_errno(errno, "tcsetattr");
    }

    struct sigaction action{};
    action.sa_handler = sigwinch_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // No SA_RESTART: poll() must wake up on resize
    if (::sigaction(SIGWINCH, &action, &previous_sigwinch_) != 0) {
        int err = errno;
        ::tcsetattr(in_fd_, TCSAFLUSH, &original_termios_);
        throw BackendError::from_errno(err, "sigaction");
    }

    raw_mode_ = true;
    util::Logger::debug("AnsiBackend: Raw mode enabled");
}

void AnsiBackend::exit_raw_mode() {
    if (!raw_mode_) return;
    raw_mode_ = false;

    ::sigaction(SIGWINCH, &previous_sigwinch_, nullptr);
    if (::tcsetattr(in_fd_, TCSAFLUSH, &original_termios_) != 0) {
        throw BackendError::from_errno(errno, "tcsetattr");
    }
    util::Logger::debug("AnsiBackend: Raw mode restored");
}

void AnsiBackend::enable_alternate_screen() {
    std::string seq = ansi::ENTER_ALTERNATE_SCREEN;
    seq += ansi::ENABLE_BRACKETED_PASTE;
    seq += ansi::ENABLE_FOCUS_EVENTS;
    write_and_flush(seq);
}

void AnsiBackend::disable_alternate_screen() {
    std::string seq = ansi::DISABLE_FOCUS_EVENTS;
    seq += ansi::DISABLE_BRACKETED_PASTE;
    seq += ansi::LEAVE_ALTERNATE_SCREEN;
    write_and_flush(seq);
}

void AnsiBackend::clear_screen() {
    write_and_flush(ansi::CLEAR_SCREEN);
}

void AnsiBackend::write(std::string_view data) {
    if (data.empty()) return;
    pending_output_.append(data);
}

void AnsiBackend::flush() {
    size_t written = 0;
    const size_t total = pending_output_.size();

    while (written < total) {
        ssize_t n = ::write(out_fd_, pending_output_.data() + written, total - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            // Output buffer full: wait until the fd is writable
            struct pollfd pfd = {out_fd_, POLLOUT, 0};
            ::poll(&pfd, 1, 100);
            continue;
        }
        int err = (n == 0) ? EIO : errno;
        pending_output_.clear();
        util::Logger::error("AnsiBackend: write() failed after " + std::to_string(written) +
                            "/" + std::to_string(total) + " bytes: " + std::strerror(err));
        throw BackendError::from_errno(err, "write");
    }
    pending_output_.clear();
}

render::Size AnsiBackend::get_size() {
    if (!::isatty(out_fd_)) {
        throw BackendError(ErrorCode::NotATerminal, "get_size: output is not a terminal");
    }
    struct winsize ws{};
    if (::ioctl(out_fd_, TIOCGWINSZ, &ws) != 0) {
        throw BackendError::from_errno(errno, "ioctl(TIOCGWINSZ)");
    }
    if (ws.ws_col == 0 || ws.ws_row == 0) {
        util::Logger::warn("AnsiBackend: Terminal reported 0x0, assuming 80x24");
        return {80, 24};
    }
    return {static_cast<int>(ws.ws_col), static_cast<int>(ws.ws_row)};
}

int AnsiBackend::read_input(int wait_ms) {
    struct pollfd pfd = {in_fd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, wait_ms);
    if (ready < 0) {
        if (errno == EINTR) return -1;
        throw BackendError::from_errno(errno, "poll");
    }
    if (ready == 0) return 0;

    char buf[READ_CHUNK];
    ssize_t n = ::read(in_fd_, buf, sizeof(buf));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return -1;
        throw BackendError::from_errno(errno, "read");
    }
    if (n == 0) {
        throw BackendError(ErrorCode::IOError, "read: input stream closed");
    }

    parser_.feed(std::string_view(buf, static_cast<size_t>(n)));
    return static_cast<int>(n);
}

events::Event AnsiBackend::poll_event(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(std::max(timeout_ms, 0));

    while (true) {
        if (g_resize_pending) {
            g_resize_pending = 0;
            auto size = get_size();
            return events::Event::resize(size.width, size.height);
        }
        if (!queued_events_.empty()) {
            auto event = std::move(queued_events_.front());
            queued_events_.pop_front();
            return event;
        }
        if (auto event = parser_.next()) {
            return *event;
        }

        int wait = remaining_ms(deadline);
        if (parser_.has_pending()) {
            wait = std::min(wait, ESCAPE_TIMEOUT_MS);
        }

        int n = read_input(wait);
        if (n > 0) continue;

        if (n == 0 && parser_.has_pending()) {
            if (auto event = parser_.flush_pending()) {
                return *event;
            }
        }
        if (n == 0 && remaining_ms(deadline) == 0) {
            return events::Event::none();
        }
        if (n < 0 && !g_resize_pending && remaining_ms(deadline) == 0) {
            return events::Event::none();
        }
    }
}

void AnsiBackend::hide_cursor() {
    write_and_flush(ansi::HIDE_CURSOR);
}

void AnsiBackend::show_cursor() {
    write_and_flush(ansi::SHOW_CURSOR);
}

void AnsiBackend::set_cursor(int x, int y) {
    write_and_flush(ansi::move_cursor(x, y));
}

bool AnsiBackend::detect_keyboard_protocol(int timeout_ms) {
    write_and_flush(ansi::QUERY_KEYBOARD_FLAGS);

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(std::max(timeout_ms, 0));
    while (true) {
        // Keys typed while waiting are kept for poll_event()
        while (auto event = parser_.next()) {
            queued_events_.push_back(std::move(*event));
        }
        if (auto flags = parser_.take_keyboard_flags_reply()) {
            util::Logger::debug("AnsiBackend: Terminal keyboard flags: " + std::to_string(*flags));
            return true;
        }
        int wait = remaining_ms(deadline);
        if (wait == 0) return false;
        read_input(wait);
    }
}

void AnsiBackend::enable_keyboard_protocol(const KeyboardProtocolOptions& options) {
    if (options.mode == KeyboardProtocolMode::Legacy) {
        if (kitty_active_) disable_keyboard_protocol();
        util::Logger::debug("AnsiBackend: Using legacy keyboard encoding");
        return;
    }

    if (options.detect_support && !detect_keyboard_protocol(options.timeout_ms)) {
        util::Logger::info("AnsiBackend: Kitty keyboard protocol not supported, staying on legacy input");
        return;
    }

    if (options.use_push_pop) {
        write_and_flush(ansi::push_keyboard_flags(options.flags));
    } else {
        write_and_flush(ansi::set_keyboard_flags(options.flags));
    }
    kitty_active_ = true;
    kitty_push_pop_ = options.use_push_pop;
    util::Logger::info("AnsiBackend: Kitty keyboard protocol enabled (flags=" +
                       std::to_string(options.flags) + ")");
}

void AnsiBackend::disable_keyboard_protocol() {
    if (!kitty_active_) return;
    kitty_active_ = false;
    write_and_flush(kitty_push_pop_ ? ansi::POP_KEYBOARD_FLAGS : ansi::RESET_KEYBOARD_FLAGS);
}

void AnsiBackend::enable_mouse() {
    write_and_flush(ansi::ENABLE_MOUSE);
}

void AnsiBackend::disable_mouse() {
    write_and_flush(ansi::DISABLE_MOUSE);
}

std::string AnsiBackend::read_response(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(std::max(timeout_ms, 0));
    while (true) {
        // The parser separates the reply from key presses typed meanwhile
        while (auto event = parser_.next()) {
            queued_events_.push_back(std::move(*event));
        }
        if (auto reply = parser_.take_graphics_reply()) {
            return std::move(*reply);
        }
        int wait = remaining_ms(deadline);
        if (wait == 0) return {};
        read_input(wait);
    }
}

void AnsiBackend::write_and_flush(std::string_view data) {
    write(data);
    flush();
}

}  // namespace tessera::backend

#endif
