#pragma once

#include "backend/Backend.hpp"
#include "render/Buffer.hpp"
#include "terminal/FrameEncoder.hpp"
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace tessera::terminal {

/**
 * Terminal session controller.
 *
 * Owns one backend and a pair of screen buffers: `current` mirrors what is on
 * the physical screen, `next` is what the application draws into. flush()
 * sends only the difference and then makes `next` the new `current`.
 *
 * Lifecycle is Uninitialized -> Active -> Terminated. The destructor shuts an
 * active session down, so the terminal is restored on every exit path.
 */
class Terminal {
public:
    enum class State { Uninitialized, Active, Terminated };

    explicit Terminal(std::unique_ptr<backend::Backend> backend);
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    // Raw mode, alternate screen, cleared screen. Partial setup is undone on failure.
    void init();

    // Restores the terminal. Never throws; cleanup failures are logged.
    void shutdown();

    // Clears the next buffer, lets render_fn fill it, then flushes
    void draw(const std::function<void(render::Buffer&)>& render_fn);

    template <typename Context, typename RenderFn>
    void draw(Context& context, RenderFn&& render_fn) {
        begin_frame("draw");
        std::forward<RenderFn>(render_fn)(context, next_);
        flush();
    }

    // Writes the changed cells. No backend calls when nothing changed.
    void flush();

    void hide_cursor();
    void show_cursor();
    void set_cursor(int x, int y);

    void enable_mouse();
    void disable_mouse();
    void enable_keyboard_protocol(const backend::KeyboardProtocolOptions& options);
    void disable_keyboard_protocol();

    // Resizes both buffers; the caller decides what to redraw
    void resize(render::Size size);

    render::Size get_size();
    events::Event poll_event(int timeout_ms);

    // Blanks both buffers and the physical screen
    void clear();

    backend::Backend& backend() { return *backend_; }

    State state() const { return state_; }
    bool cursor_hidden() const { return cursor_hidden_; }
    render::Size size() const { return {next_.width(), next_.height()}; }
    const render::Buffer& current_buffer() const { return current_; }
    render::Buffer& next_buffer() { return next_; }

private:
    void require_active(const char* operation) const;
    void begin_frame(const char* operation);

    std::unique_ptr<backend::Backend> backend_;
    State state_ = State::Uninitialized;
    render::Buffer current_{0, 0};
    render::Buffer next_{0, 0};
    FrameEncoder encoder_;
    std::string frame_; // Reused between flushes

    bool cursor_hidden_ = false;
    bool mouse_enabled_ = false;
    bool keyboard_protocol_enabled_ = false;
};

}  // namespace tessera::terminal
