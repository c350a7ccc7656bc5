#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tessera::graphics {

// Pixel format codes as sent in the `f=` key
enum class ImageFormat : uint8_t {
    Rgba = 32,
    Rgb = 24,
    Png = 100
};

class ImageError : public std::runtime_error {
public:
    explicit ImageError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Pixel payload for the graphics codec. Raw formats are validated against
 * their dimensions at construction; PNG data must carry the PNG signature and
 * an IHDR chunk, from which width and height are read.
 */
class Image {
public:
    static constexpr size_t MAX_PAYLOAD_BYTES = 64 * 1024 * 1024;

    static Image from_rgba(std::vector<uint8_t> data, uint32_t width, uint32_t height);
    static Image from_rgb(std::vector<uint8_t> data, uint32_t width, uint32_t height);
    static Image from_png(std::vector<uint8_t> data);

    const std::vector<uint8_t>& data() const { return data_; }
    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    ImageFormat format() const { return format_; }

    // Bytes per pixel; 0 for PNG
    uint32_t stride() const;

private:
    Image(std::vector<uint8_t> data, uint32_t width, uint32_t height, ImageFormat format)
        : data_(std::move(data)), width_(width), height_(height), format_(format) {}

    static Image from_raw(std::vector<uint8_t> data, uint32_t width, uint32_t height,
                          ImageFormat format, uint32_t stride);

    std::vector<uint8_t> data_;
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    ImageFormat format_ = ImageFormat::Rgba;
};

struct Placement {
    std::optional<uint16_t> x;       // Source rectangle offset
    std::optional<uint16_t> y;
    std::optional<uint16_t> width;   // Columns to span
    std::optional<uint16_t> height;  // Rows to span
    int32_t z_index = 0;
    std::optional<uint32_t> image_id;
    std::optional<uint32_t> placement_id;
    bool move_cursor = false;
};

Image make_solid_image(uint32_t width, uint32_t height,
                       uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255);

// 8x8 black and white checkerboard, RGBA, white at (0,0)
Image make_test_pattern();

}  // namespace tessera::graphics
