#pragma once

#include "backend/Backend.hpp"
#include "graphics/Image.hpp"
#include "graphics/KittyGraphics.hpp"
#include "render/Buffer.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tessera::graphics {

enum class GraphicsMode {
    Kitty,   // Kitty graphics protocol
    Sixel,   // Detected only; images fall back to the buffer
    Block,   // Half-block characters
    Ascii
};

const char* graphics_mode_name(GraphicsMode mode);
std::optional<GraphicsMode> parse_graphics_mode(std::string_view name);

/**
 * Picks an image path for the session and renders through it: Kitty escape
 * sequences when the terminal supports them, otherwise half-block cells
 * drawn into the frame buffer.
 *
 * TESSERA_IMAGE_PROTOCOL (kitty|sixel|block|ascii) overrides detection.
 */
class Graphics {
public:
    using EnvLookup = std::function<const char*(const char*)>;

    Graphics();
    explicit Graphics(EnvLookup env);

    // Environment heuristics only; Block when nothing matches
    GraphicsMode detect();

    // Sends the Kitty probe and trusts the reply over the environment
    GraphicsMode detect_with_query(backend::Backend& backend, int timeout_ms);

    std::optional<GraphicsMode> environment_override() const;

    void set_mode(GraphicsMode mode);
    GraphicsMode mode() const { return mode_; }
    bool detected() const { return detected_; }

    bool supports_images() const;

    // Escape sequence in Kitty mode; nullopt when the caller should fall back
    std::optional<std::string> draw_image(const Image& image, const Placement& placement);

    // One '▀' per cell: foreground is the upper pixel, background the lower
    void render_image_to_buffer(const Image& image, render::Buffer& buffer,
                                const render::Rect& area) const;

    std::string query_sequence();

    // Delete-all sequence in Kitty mode
    std::optional<std::string> clear_images();

    KittyGraphics* kitty() { return kitty_ ? &*kitty_ : nullptr; }

private:
    std::optional<GraphicsMode> detect_from_environment() const;
    static void render_placeholder(render::Buffer& buffer, const render::Rect& area,
                                   std::string_view text);

    EnvLookup env_;
    GraphicsMode mode_ = GraphicsMode::Block;
    bool detected_ = false;
    std::optional<KittyGraphics> kitty_;
};

}  // namespace tessera::graphics
