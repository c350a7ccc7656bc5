#include "graphics/Base64.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <stdexcept>

namespace tessera::graphics {

size_t encoded_base64_size(size_t len) {
    return ((len + 2) / 3) * 4;
}

std::string encode_base64(const uint8_t* data, size_t len) {
    std::string out;
    if (len == 0) return out;

    // EVP_EncodeBlock takes an int length; encode in whole 3-byte groups
    constexpr size_t BLOCK = 3 * 1024 * 1024;
    out.resize(encoded_base64_size(len) + 1); // +1 for the NUL it always writes

    size_t in_offset = 0;
    size_t out_offset = 0;
    while (in_offset < len) {
        size_t chunk = std::min(BLOCK, len - in_offset);
        int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[out_offset]),
                                      data + in_offset, static_cast<int>(chunk));
        if (written < 0) {
            throw std::runtime_error("encode_base64: EVP_EncodeBlock failed");
        }
        in_offset += chunk;
        out_offset += static_cast<size_t>(written);
    }
    out.resize(out_offset);
    return out;
}

}  // namespace tessera::graphics
