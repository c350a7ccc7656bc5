#pragma once

#include "graphics/Image.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tessera::graphics {

enum class DeleteTarget {
    All,
    ById,
    ByPlacement,
    AtCursor,
    InRange
};

// Result of a support probe
struct Capability {
    bool supported = false;
    bool responded = false;  // the terminal answered at all
    std::string error_message;
};

/**
 * Kitty graphics protocol encoder.
 *
 * Every call rebuilds and returns a reference to an internal output string;
 * the reference stays valid until the next call. Payloads are base64 encoded
 * once and split into chunks of at most MAX_CHUNK_SIZE bytes. Only the first
 * chunk carries the control keys.
 */
class KittyGraphics {
public:
    static constexpr size_t MAX_CHUNK_SIZE = 4096;

    // Transmit and display (a=T). Assigns the next free id when the placement has none.
    const std::string& draw_image(const Image& image, const Placement& placement);

    // Transmit only (a=t), for a later place_image()
    const std::string& transmit_image(const Image& image, uint32_t image_id);

    const std::string& place_image(uint32_t image_id, const Placement& placement);

    // `id` is the image id for ById and the placement id for ByPlacement
    const std::string& delete_images(DeleteTarget target, std::optional<uint32_t> id = std::nullopt);

    // 1x1 RGB probe with image id 31
    const std::string& query_support();

    static Capability parse_query_response(std::string_view response);

    uint32_t next_image_id() const { return next_image_id_; }
    uint32_t last_image_id() const { return last_image_id_; }

private:
    struct ControlKeys {
        char action = 'T';
        ImageFormat format = ImageFormat::Rgba;
        std::optional<uint32_t> width;        // s
        std::optional<uint32_t> height;       // v
        std::optional<uint32_t> image_id;     // i
        std::optional<uint32_t> placement_id; // p
        std::optional<uint16_t> x;
        std::optional<uint16_t> y;
        std::optional<uint16_t> columns;      // c
        std::optional<uint16_t> rows;         // r
        std::optional<int32_t> z_index;       // z
        bool no_cursor_move = false;          // C=1
    };

    void write_chunked(const std::vector<uint8_t>& data, const ControlKeys& keys);
    void append_placement_keys(const Placement& placement);

    std::string output_;
    uint32_t next_image_id_ = 1;
    uint32_t last_image_id_ = 0;
};

}  // namespace tessera::graphics
