#pragma once

#include <stdexcept>
#include <string>

namespace tessera::backend {

enum class ErrorCode {
    NotATerminal,
    IOError,
    BrokenPipe,
    NoSpaceLeft,
    DiskQuota,
    FileTooBig,
    AccessDenied,
    DeviceBusy,
    InvalidArgument,
    SystemResources,
    WouldBlock,
    ConnectionReset,
    Unsupported,
    Unexpected
};

const char* error_code_name(ErrorCode code);

/**
 * Transport failure raised by a Backend. Carries a platform-neutral code so
 * callers handle the ANSI and console transports the same way.
 */
class BackendError : public std::runtime_error {
public:
    BackendError(ErrorCode code, const std::string& what);

    ErrorCode code() const { return code_; }

    // Map an errno value from a failed POSIX call
    static BackendError from_errno(int err, const std::string& operation);

    // Map a GetLastError() value from a failed Win32 call
    static BackendError from_win32(unsigned long err, const std::string& operation);

private:
    ErrorCode code_;
};

}  // namespace tessera::backend
