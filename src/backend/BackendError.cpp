#include "backend/BackendError.hpp"
#include <cerrno>
#include <cstring>

namespace tessera::backend {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotATerminal:    return "NotATerminal";
        case ErrorCode::IOError:         return "IOError";
        case ErrorCode::BrokenPipe:      return "BrokenPipe";
        case ErrorCode::NoSpaceLeft:     return "NoSpaceLeft";
        case ErrorCode::DiskQuota:       return "DiskQuota";
        case ErrorCode::FileTooBig:      return "FileTooBig";
        case ErrorCode::AccessDenied:    return "AccessDenied";
        case ErrorCode::DeviceBusy:      return "DeviceBusy";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::SystemResources: return "SystemResources";
        case ErrorCode::WouldBlock:      return "WouldBlock";
        case ErrorCode::ConnectionReset: return "ConnectionReset";
        case ErrorCode::Unsupported:     return "Unsupported";
        case ErrorCode::Unexpected:      return "Unexpected";
    }
    return "Unknown";
}

BackendError::BackendError(ErrorCode code, const std::string& what)
    : std::runtime_error(what), code_(code) {}

BackendError BackendError::from_errno(int err, const std::string& operation) {
    ErrorCode code = ErrorCode::Unexpected;
    switch (err) {
        case ENOTTY:  code = ErrorCode::NotATerminal; break;
        case EIO:     code = ErrorCode::IOError; break;
        case EPIPE:   code = ErrorCode::BrokenPipe; break;
        case ENOSPC:  code = ErrorCode::NoSpaceLeft; break;
#ifdef EDQUOT
        case EDQUOT:  code = ErrorCode::DiskQuota; break;
#endif
        case EFBIG:   code = ErrorCode::FileTooBig; break;
        case EACCES:
        case EPERM:   code = ErrorCode::AccessDenied; break;
        case EBUSY:   code = ErrorCode::DeviceBusy; break;
        case EINVAL:
        case EBADF:   code = ErrorCode::InvalidArgument; break;
        case ENOMEM:
        case EMFILE:
        case ENFILE:  code = ErrorCode::SystemResources; break;
        case EAGAIN:  code = ErrorCode::WouldBlock; break;
        case ECONNRESET: code = ErrorCode::ConnectionReset; break;
        default: break;
    }
    return BackendError(code, operation + ": " + std::strerror(err) +
                              " [" + error_code_name(code) + "]");
}

BackendError BackendError::from_win32(unsigned long err, const std::string& operation) {
    // Values from winerror.h; kept numeric so this file builds on every platform
    ErrorCode code = ErrorCode::Unexpected;
    switch (err) {
        case 5:    code = ErrorCode::AccessDenied; break;    // ERROR_ACCESS_DENIED
        case 6:    code = ErrorCode::NotATerminal; break;    // ERROR_INVALID_HANDLE
        case 8:
        case 14:   code = ErrorCode::SystemResources; break; // ERROR_NOT_ENOUGH_MEMORY, ERROR_OUTOFMEMORY
        case 4:    code = ErrorCode::SystemResources; break; // ERROR_TOO_MANY_OPEN_FILES
        case 87:   code = ErrorCode::InvalidArgument; break; // ERROR_INVALID_PARAMETER
        case 109:
        case 232:  code = ErrorCode::BrokenPipe; break;      // ERROR_BROKEN_PIPE, ERROR_NO_DATA
        case 112:  code = ErrorCode::NoSpaceLeft; break;     // ERROR_DISK_FULL
        case 1295: code = ErrorCode::DiskQuota; break;       // ERROR_DISK_QUOTA_EXCEEDED
        case 170:  code = ErrorCode::DeviceBusy; break;      // ERROR_BUSY
        case 1117: code = ErrorCode::IOError; break;         // ERROR_IO_DEVICE
        default: break;
    }
    return BackendError(code, operation + ": win32 error " + std::to_string(err) +
                              " [" + error_code_name(code) + "]");
}

}  // namespace tessera::backend
