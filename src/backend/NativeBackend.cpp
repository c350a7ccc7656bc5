#include "backend/NativeBackend.hpp"

#ifdef _WIN32
#include "backend/WindowsBackend.hpp"
#else
#include "backend/AnsiBackend.hpp"
#endif

namespace tessera::backend {

std::unique_ptr<Backend> create_native_backend() {
#ifdef _WIN32
    return std::make_unique<WindowsBackend>();
#else
    return std::make_unique<AnsiBackend>();
#endif
}

}  // namespace tessera::backend
