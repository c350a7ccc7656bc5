#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tessera::graphics {

// Standard alphabet with '=' padding, no line breaks
std::string encode_base64(const uint8_t* data, size_t len);

size_t encoded_base64_size(size_t len);

}  // namespace tessera::graphics
