#include "graphics/Image.hpp"
#include <array>
#include <cstring>

namespace tessera::graphics {

namespace {

constexpr std::array<uint8_t, 8> PNG_SIGNATURE = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

uint32_t read_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

}

uint32_t Image::stride() const {
    switch (format_) {
        case ImageFormat::Rgba: return 4;
        case ImageFormat::Rgb:  return 3;
        case ImageFormat::Png:  return 0;
    }
    return 0;
}

Image Image::from_raw(std::vector<uint8_t> data, uint32_t width, uint32_t height,
                      ImageFormat format, uint32_t stride) {
    if (width == 0 || height == 0) {
        throw ImageError("Image: dimensions must be non-zero");
    }
    const uint64_t expected = static_cast<uint64_t>(width) * height * stride;
    if (expected > MAX_PAYLOAD_BYTES) {
        throw ImageError("Image: " + std::to_string(expected) + " bytes exceeds the payload limit");
    }
    if (data.size() != expected) {
        throw ImageError("Image: expected " + std::to_string(expected) + " bytes for " +
                         std::to_string(width) + "x" + std::to_string(height) + ", got " +
                         std::to_string(data.size()));
    }
    return Image(std::move(data), width, height, format);
}

Image Image::from_rgba(std::vector<uint8_t> data, uint32_t width, uint32_t height) {
    return from_raw(std::move(data), width, height, ImageFormat::Rgba, 4);
}

Image Image::from_rgb(std::vector<uint8_t> data, uint32_t width, uint32_t height) {
    return from_raw(std::move(data), width, height, ImageFormat::Rgb, 3);
}

Image Image::from_png(std::vector<uint8_t> data) {
    if (data.size() > MAX_PAYLOAD_BYTES) {
        throw ImageError("Image: PNG payload exceeds the payload limit");
    }
    // Signature (8) + IHDR length (4) + "IHDR" (4) + width (4) + height (4)
    if (data.size() < 24 || std::memcmp(data.data(), PNG_SIGNATURE.data(), PNG_SIGNATURE.size()) != 0) {
        throw ImageError("Image: data is not a PNG stream");
    }
    if (std::memcmp(data.data() + 12, "IHDR", 4) != 0) {
        throw ImageError("Image: PNG stream has no IHDR chunk");
    }
    uint32_t width = read_be32(data.data() + 16);
    uint32_t height = read_be32(data.data() + 20);
    if (width == 0 || height == 0) {
        throw ImageError("Image: PNG reports zero dimensions");
    }
    return Image(std::move(data), width, height, ImageFormat::Png);
}

Image make_solid_image(uint32_t width, uint32_t height, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    const uint64_t bytes = static_cast<uint64_t>(width) * height * 4;
    if (bytes > Image::MAX_PAYLOAD_BYTES) {
        throw ImageError("Image: solid image too large");
    }
    std::vector<uint8_t> data(static_cast<size_t>(bytes));
    for (size_t i = 0; i < data.size(); i += 4) {
        data[i] = r;
        data[i + 1] = g;
        data[i + 2] = b;
        data[i + 3] = a;
    }
    return Image::from_rgba(std::move(data), width, height);
}

Image make_test_pattern() {
    constexpr uint32_t size = 8;
    std::vector<uint8_t> data(size * size * 4);
    for (uint32_t y = 0; y < size; ++y) {
        for (uint32_t x = 0; x < size; ++x) {
            size_t offset = (y * size + x) * 4;
            uint8_t value = ((x + y) % 2 == 0) ? 255 : 0;
            data[offset] = value;
            data[offset + 1] = value;
            data[offset + 2] = value;
            data[offset + 3] = 255;
        }
    }
    return Image::from_rgba(std::move(data), size, size);
}

}  // namespace tessera::graphics
