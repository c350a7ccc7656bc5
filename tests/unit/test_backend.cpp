#include "../framework/SimpleTest.hpp"
#include "backend/Ansi.hpp"
#include "backend/BackendError.hpp"
#include "backend/NativeBackend.hpp"
#include <cerrno>
#include <initializer_list>
#include <stdexcept>
#include <string>

#ifndef _WIN32
#include "backend/AnsiBackend.hpp"
#include <fcntl.h>
#include <unistd.h>
#else
#include "backend/WindowsBackend.hpp"
#endif

using namespace tessera;
using backend::BackendError;
using backend::ErrorCode;

TEST_CASE(test_errno_mapping) {
    ASSERT_TRUE(BackendError::from_errno(ENOTTY, "op").code() == ErrorCode::NotATerminal);
    ASSERT_TRUE(BackendError::from_errno(EIO, "op").code() == ErrorCode::IOError);
    ASSERT_TRUE(BackendError::from_errno(EPIPE, "op").code() == ErrorCode::BrokenPipe);
    ASSERT_TRUE(BackendError::from_errno(ENOSPC, "op").code() == ErrorCode::NoSpaceLeft);
    ASSERT_TRUE(BackendError::from_errno(EFBIG, "op").code() == ErrorCode::FileTooBig);
    ASSERT_TRUE(BackendError::from_errno(EACCES, "op").code() == ErrorCode::AccessDenied);
    ASSERT_TRUE(BackendError::from_errno(EPERM, "op").code() == ErrorCode::AccessDenied);
    ASSERT_TRUE(BackendError::from_errno(EBUSY, "op").code() == ErrorCode::DeviceBusy);
    ASSERT_TRUE(BackendError::from_errno(EBADF, "op").code() == ErrorCode::InvalidArgument);
    ASSERT_TRUE(BackendError::from_errno(ENOMEM, "op").code() == ErrorCode::SystemResources);
    ASSERT_TRUE(BackendError::from_errno(EAGAIN, "op").code() == ErrorCode::WouldBlock);
    ASSERT_TRUE(BackendError::from_errno(ECONNRESET, "op").code() == ErrorCode::ConnectionReset);
    ASSERT_TRUE(BackendError::from_errno(EDOM, "op").code() == ErrorCode::Unexpected);
}

TEST_CASE(test_errno_message_names_operation) {
    auto err = BackendError::from_errno(EPIPE, "write");
    std::string what = err.what();
    ASSERT_TRUE(what.rfind("write: ", 0) == 0);
    ASSERT_TRUE(what.find("[BrokenPipe]") != std::string::npos);
}

TEST_CASE(test_win32_mapping) {
    ASSERT_TRUE(BackendError::from_win32(5, "op").code() == ErrorCode::AccessDenied);
    ASSERT_TRUE(BackendError::from_win32(6, "op").code() == ErrorCode::NotATerminal);
    ASSERT_TRUE(BackendError::from_win32(8, "op").code() == ErrorCode::SystemResources);
    ASSERT_TRUE(BackendError::from_win32(87, "op").code() == ErrorCode::InvalidArgument);
    ASSERT_TRUE(BackendError::from_win32(109, "op").code() == ErrorCode::BrokenPipe);
    ASSERT_TRUE(BackendError::from_win32(232, "op").code() == ErrorCode::BrokenPipe);
    ASSERT_TRUE(BackendError::from_win32(112, "op").code() == ErrorCode::NoSpaceLeft);
    ASSERT_TRUE(BackendError::from_win32(1295, "op").code() == ErrorCode::DiskQuota);
    ASSERT_TRUE(BackendError::from_win32(170, "op").code() == ErrorCode::DeviceBusy);
    ASSERT_TRUE(BackendError::from_win32(1117, "op").code() == ErrorCode::IOError);
    ASSERT_TRUE(BackendError::from_win32(31, "op").code() == ErrorCode::Unexpected);

    std::string what = BackendError::from_win32(87, "SetConsoleMode").what();
    ASSERT_TRUE(what.find("win32 error 87") != std::string::npos);
}

TEST_CASE(test_ansi_helpers) {
    ASSERT_EQ(backend::ansi::move_cursor(0, 0), "\033[1;1H");
    ASSERT_EQ(backend::ansi::move_cursor(9, 4), "\033[5;10H");
    ASSERT_EQ(backend::ansi::push_keyboard_flags(1), "\033[>1u");
    ASSERT_EQ(backend::ansi::set_keyboard_flags(31), "\033[=31;1u");
}

TEST_CASE(test_native_backend_created) {
    auto native = backend::create_native_backend();
    ASSERT_TRUE(native != nullptr);
}

#ifndef _WIN32

namespace {

// A pair of pipes standing in for the terminal: the test writes to
// `to_input` and reads what the backend wrote from `from_output`
struct PipeTerminal {
    int input[2] = {-1, -1};
    int output[2] = {-1, -1};

    PipeTerminal() {
        if (::pipe(input) != 0 || ::pipe(output) != 0) {
            throw std::runtime_error("pipe() failed");
        }
        ::fcntl(output[0], F_SETFL, ::fcntl(output[0], F_GETFL) | O_NONBLOCK);
    }

    ~PipeTerminal() {
        for (int fd : {input[0], input[1], output[0], output[1]}) {
            if (fd >= 0) ::close(fd);
        }
    }

    void type(const std::string& bytes) {
        if (::write(input[1], bytes.data(), bytes.size()) != static_cast<ssize_t>(bytes.size())) {
            throw std::runtime_error("short write to input pipe");
        }
    }

    void close_input() {
        ::close(input[1]);
        input[1] = -1;
    }

    std::string drain() {
        std::string out;
        char buf[256];
        ssize_t n;
        while ((n = ::read(output[0], buf, sizeof(buf))) > 0) {
            out.append(buf, static_cast<size_t>(n));
        }
        return out;
    }
};

}

TEST_CASE(test_ansi_backend_rejects_non_terminal) {
    PipeTerminal pipes;
    backend::AnsiBackend ansi(pipes.input[0], pipes.output[1]);

    bool thrown = false;
    try {
        ansi.enter_raw_mode();
    } catch (const BackendError& e) {
        thrown = true;
        ASSERT_TRUE(e.code() == ErrorCode::NotATerminal);
    }
    ASSERT_TRUE(thrown);
    ASSERT_FALSE(ansi.in_raw_mode());
    ASSERT_THROWS(ansi.get_size(), BackendError);

    // Nothing to restore
    ansi.exit_raw_mode();
}

TEST_CASE(test_ansi_backend_buffers_until_flush) {
    PipeTerminal pipes;
    backend::AnsiBackend ansi(pipes.input[0], pipes.output[1]);

    ansi.write("abc");
    ansi.write("");
    ansi.write("def");
    ASSERT_EQ(pipes.drain(), "");

    ansi.flush();
    ASSERT_EQ(pipes.drain(), "abcdef");

    ansi.flush();
    ASSERT_EQ(pipes.drain(), "");
}

TEST_CASE(test_ansi_backend_control_sequences) {
    PipeTerminal pipes;
    backend::AnsiBackend ansi(pipes.input[0], pipes.output[1]);

    ansi.hide_cursor();
    ASSERT_EQ(pipes.drain(), "\033[?25l");
    ansi.set_cursor(2, 3);
    ASSERT_EQ(pipes.drain(), "\033[4;3H");
    ansi.enable_mouse();
    ASSERT_EQ(pipes.drain(), "\033[?1000h\033[?1002h\033[?1006h");
    ansi.enable_alternate_screen();
    ASSERT_EQ(pipes.drain(), "\033[?1049h\033[?2004h\033[?1004h");
    ansi.disable_alternate_screen();
    ASSERT_EQ(pipes.drain(), "\033[?1004l\033[?2004l\033[?1049l");
    ansi.clear_screen();
    ASSERT_EQ(pipes.drain(), "\033[2J\033[H");
}

TEST_CASE(test_ansi_backend_poll_event) {
    PipeTerminal pipes;
    backend::AnsiBackend ansi(pipes.input[0], pipes.output[1]);

    ASSERT_TRUE(ansi.poll_event(0).is_none());

    pipes.type("\033[Ak");
    auto up = ansi.poll_event(200);
    ASSERT_TRUE(up.is_key(events::KeyCode::of(events::KeyCode::Type::Up)));
    ASSERT_TRUE(ansi.poll_event(200).is_char(U'k'));
}

TEST_CASE(test_ansi_backend_lone_escape_times_out) {
    PipeTerminal pipes;
    backend::AnsiBackend ansi(pipes.input[0], pipes.output[1]);

    pipes.type("\033");
    auto esc = ansi.poll_event(500);
    ASSERT_TRUE(esc.is_key(events::KeyCode::of(events::KeyCode::Type::Esc)));
}

TEST_CASE(test_ansi_backend_closed_input) {
    PipeTerminal pipes;
    backend::AnsiBackend ansi(pipes.input[0], pipes.output[1]);

    pipes.close_input();
    bool thrown = false;
    try {
        ansi.poll_event(100);
    } catch (const BackendError& e) {
        thrown = true;
        ASSERT_TRUE(e.code() == ErrorCode::IOError);
    }
    ASSERT_TRUE(thrown);
}

TEST_CASE(test_ansi_backend_read_response_keeps_keys) {
    PipeTerminal pipes;
    backend::AnsiBackend ansi(pipes.input[0], pipes.output[1]);

    pipes.type("\033_Gi=31;OK\033\\x");
    std::string response = ansi.read_response(200);
    ASSERT_EQ(response, "\033_Gi=31;OK\033\\");

    // The key that arrived with the reply is still delivered
    ASSERT_TRUE(ansi.poll_event(0).is_char(U'x'));
}

TEST_CASE(test_ansi_backend_read_response_skips_other_input) {
    PipeTerminal pipes;
    backend::AnsiBackend ansi(pipes.input[0], pipes.output[1]);

    // Keys and unrelated reports before the reply are not part of it
    pipes.type("k\033[?62;22c\033_Gi=31;ENOTSUPPORTED:no\033\\");
    ASSERT_EQ(ansi.read_response(200), "\033_Gi=31;ENOTSUPPORTED:no\033\\");
    ASSERT_TRUE(ansi.poll_event(0).is_char(U'k'));
    ASSERT_TRUE(ansi.poll_event(0).is_none());
}

TEST_CASE(test_ansi_backend_read_response_timeout) {
    PipeTerminal pipes;
    backend::AnsiBackend ansi(pipes.input[0], pipes.output[1]);
    ASSERT_EQ(ansi.read_response(20), "");
}

TEST_CASE(test_ansi_backend_kitty_keyboard_push_pop) {
    PipeTerminal pipes;
    backend::AnsiBackend ansi(pipes.input[0], pipes.output[1]);

    backend::KeyboardProtocolOptions options;
    options.mode = backend::KeyboardProtocolMode::Kitty;
    options.flags = backend::keyboard_flags::DisambiguateEscapeCodes |
                    backend::keyboard_flags::ReportEventTypes;
    ansi.enable_keyboard_protocol(options);
    ASSERT_EQ(pipes.drain(), "\033[>3u");
    ASSERT_TRUE(ansi.keyboard_protocol_active());

    ansi.disable_keyboard_protocol();
    ASSERT_EQ(pipes.drain(), "\033[<u");
    ASSERT_FALSE(ansi.keyboard_protocol_active());

    // Already off
    ansi.disable_keyboard_protocol();
    ASSERT_EQ(pipes.drain(), "");
}

TEST_CASE(test_ansi_backend_kitty_keyboard_set_reset) {
    PipeTerminal pipes;
    backend::AnsiBackend ansi(pipes.input[0], pipes.output[1]);

    backend::KeyboardProtocolOptions options;
    options.mode = backend::KeyboardProtocolMode::Kitty;
    options.flags = 1;
    options.use_push_pop = false;
    ansi.enable_keyboard_protocol(options);
    ASSERT_EQ(pipes.drain(), "\033[=1;1u");

    // Switching back to legacy undoes the enhancement
    ansi.enable_keyboard_protocol(backend::KeyboardProtocolOptions{});
    ASSERT_EQ(pipes.drain(), "\033[=0;1u");
    ASSERT_FALSE(ansi.keyboard_protocol_active());
}

TEST_CASE(test_ansi_backend_keyboard_detection) {
    PipeTerminal pipes;
    backend::AnsiBackend ansi(pipes.input[0], pipes.output[1]);

    backend::KeyboardProtocolOptions options;
    options.mode = backend::KeyboardProtocolMode::Kitty;
    options.flags = 1;
    options.detect_support = true;
    options.timeout_ms = 30;

    // No reply: stays on legacy input
    ansi.enable_keyboard_protocol(options);
    ASSERT_EQ(pipes.drain(), "\033[?u");
    ASSERT_FALSE(ansi.keyboard_protocol_active());

    // Reply already waiting, with a key typed ahead of it
    pipes.type("z\033[?0u");
    options.timeout_ms = 200;
    ansi.enable_keyboard_protocol(options);
    ASSERT_EQ(pipes.drain(), "\033[?u\033[>1u");
    ASSERT_TRUE(ansi.keyboard_protocol_active());
    ASSERT_TRUE(ansi.poll_event(0).is_char(U'z'));
}

#else

TEST_CASE(test_windows_backend_restores_code_page) {
    // Only meaningful when attached to a real console
    DWORD mode = 0;
    if (!GetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), &mode)) return;

    UINT before = GetConsoleOutputCP();
    {
        backend::WindowsBackend console;
        console.enter_raw_mode();
        ASSERT_EQ(GetConsoleOutputCP(), static_cast<UINT>(CP_UTF8));
        console.exit_raw_mode();
    }
    ASSERT_EQ(GetConsoleOutputCP(), before);
}

#endif

int main() {
    return tessera::test::TestRunner::instance().run_all();
}
