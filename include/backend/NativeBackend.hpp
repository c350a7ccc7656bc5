#pragma once

#include "backend/Backend.hpp"
#include <memory>

namespace tessera::backend {

// Console transport on Windows, ANSI/termios transport everywhere else
std::unique_ptr<Backend> create_native_backend();

}  // namespace tessera::backend
