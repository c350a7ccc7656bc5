#pragma once

#include "backend/Backend.hpp"

#ifdef _WIN32

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <deque>
#include <string>

namespace tessera::backend {

/**
 * Windows console transport.
 *
 * Output goes through virtual-terminal processing so the same escape
 * sequences as the ANSI transport apply. Input is read as console input
 * records and translated into events.
 */
class WindowsBackend : public Backend {
public:
    WindowsBackend();
    ~WindowsBackend() override;

    WindowsBackend(const WindowsBackend&) = delete;
    WindowsBackend& operator=(const WindowsBackend&) = delete;

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

private:
    bool translate(const INPUT_RECORD& record, events::Event& out);
    bool translate_key(const KEY_EVENT_RECORD& key, events::Event& out);
    bool translate_mouse(const MOUSE_EVENT_RECORD& mouse, events::Event& out);
    void write_and_flush(std::string_view data);

    HANDLE in_ = INVALID_HANDLE_VALUE;
    HANDLE out_ = INVALID_HANDLE_VALUE;
    DWORD original_in_mode_ = 0;
    DWORD original_out_mode_ = 0;
    UINT original_output_cp_ = 0;
    bool raw_mode_ = false;
    bool report_all_key_events_ = false; // kitty mode: repeats and releases too
    bool mouse_enabled_ = false;
    DWORD last_mouse_buttons_ = 0;
    render::Size last_size_;
    std::string pending_output_;
    std::deque<events::Event> queued_events_;
};

}  // namespace tessera::backend

#endif
