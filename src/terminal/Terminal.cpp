#include "terminal/Terminal.hpp"
#include "util/Logger.hpp"
#include <stdexcept>

namespace tessera::terminal {

namespace {

// Runs one cleanup step; a failure is logged and does not stop later steps
template <typename Step>
void attempt(const char* what, Step&& step) {
    try {
        step();
    } catch (const std::exception& e) {
        util::Logger::warn(std::string("Terminal: ") + what + " failed during cleanup: " + e.what());
    }
}

}

Terminal::Terminal(std::unique_ptr<backend::Backend> backend)
    : backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("Terminal: backend must not be null");
    }
}

Terminal::~Terminal() {
    shutdown();
}

void Terminal::init() {
    if (state_ == State::Active) return;
    if (state_ == State::Terminated) {
        throw std::logic_error("Terminal: init() after shutdown()");
    }

    auto size = backend_->get_size();
    current_ = render::Buffer(size.width, size.height);
    next_ = render::Buffer(size.width, size.height);

    backend_->enter_raw_mode();
    try {
        backend_->enable_alternate_screen();
        try {
            backend_->clear_screen();
        } catch (const std::exception& e) {
            util::Logger::error(std::string("Terminal: clear_screen failed during init: ") + e.what());
            attempt("disable_alternate_screen", [this] { backend_->disable_alternate_screen(); });
            throw;
        }
    } catch (const std::exception& e) {
        util::Logger::error(std::string("Terminal: init failed: ") + e.what());
        attempt("exit_raw_mode", [this] { backend_->exit_raw_mode(); });
        current_ = render::Buffer(0, 0);
        next_ = render::Buffer(0, 0);
        throw;
    }

    state_ = State::Active;
    util::Logger::info("Terminal: Session started (" + std::to_string(size.width) + "x" +
                       std::to_string(size.height) + ")");
}

void Terminal::shutdown() {
    if (state_ != State::Active) return;

    if (keyboard_protocol_enabled_) {
        attempt("disable_keyboard_protocol", [this] { backend_->disable_keyboard_protocol(); });
        keyboard_protocol_enabled_ = false;
    }
    if (mouse_enabled_) {
        attempt("disable_mouse", [this] { backend_->disable_mouse(); });
        mouse_enabled_ = false;
    }
    attempt("disable_alternate_screen", [this] { backend_->disable_alternate_screen(); });
    attempt("exit_raw_mode", [this] { backend_->exit_raw_mode(); });
    if (cursor_hidden_) {
        attempt("show_cursor", [this] { backend_->show_cursor(); });
        cursor_hidden_ = false;
    }

    current_ = render::Buffer(0, 0);
    next_ = render::Buffer(0, 0);
    state_ = State::Terminated;
    util::Logger::info("Terminal: Session ended");
}

void Terminal::require_active(const char* operation) const {
    if (state_ != State::Active) {
        throw std::logic_error(std::string("Terminal: ") + operation + "() requires an active session");
    }
}

void Terminal::begin_frame(const char* operation) {
    require_active(operation);
    next_.clear();
}

void Terminal::draw(const std::function<void(render::Buffer&)>& render_fn) {
    begin_frame("draw");
    render_fn(next_);
    flush();
}

void Terminal::flush() {
    require_active("flush");

    auto updates = current_.diff(next_);
    if (updates.empty()) return;

    frame_.clear();
    encoder_.encode(updates, frame_);
    backend_->write(frame_);
    backend_->flush();

    current_.copy_from(next_);
}

void Terminal::hide_cursor() {
    backend_->hide_cursor();
    cursor_hidden_ = true;
}

void Terminal::show_cursor() {
    backend_->show_cursor();
    cursor_hidden_ = false;
}

void Terminal::set_cursor(int x, int y) {
    backend_->set_cursor(x, y);
}

void Terminal::enable_mouse() {
    backend_->enable_mouse();
    mouse_enabled_ = true;
}

void Terminal::disable_mouse() {
    backend_->disable_mouse();
    mouse_enabled_ = false;
}

void Terminal::enable_keyboard_protocol(const backend::KeyboardProtocolOptions& options) {
    backend_->enable_keyboard_protocol(options);
    keyboard_protocol_enabled_ = options.mode == backend::KeyboardProtocolMode::Kitty;
}

void Terminal::disable_keyboard_protocol() {
    backend_->disable_keyboard_protocol();
    keyboard_protocol_enabled_ = false;
}

void Terminal::resize(render::Size size) {
    current_.resize(size.width, size.height);
    next_.resize(size.width, size.height);
    util::Logger::debug("Terminal: Resized to " + std::to_string(size.width) + "x" +
                        std::to_string(size.height));
}

render::Size Terminal::get_size() {
    return backend_->get_size();
}

events::Event Terminal::poll_event(int timeout_ms) {
    return backend_->poll_event(timeout_ms);
}

void Terminal::clear() {
    current_.clear();
    next_.clear();
    backend_->clear_screen();
}

}  // namespace tessera::terminal
