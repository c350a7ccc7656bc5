#include "graphics/Graphics.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <utility>

namespace tessera::graphics {

namespace {

style::Color sample_pixel(const std::vector<uint8_t>& data, uint32_t width, uint32_t stride,
                          size_t x, size_t y) {
    size_t idx = (y * width + x) * stride;
    if (idx + 2 >= data.size()) {
        return style::Color::named(style::NamedColor::Black);
    }
    return style::Color::rgb(data[idx], data[idx + 1], data[idx + 2]);
}

}

const char* graphics_mode_name(GraphicsMode mode) {
    switch (mode) {
        case GraphicsMode::Kitty: return "kitty";
        case GraphicsMode::Sixel: return "sixel";
        case GraphicsMode::Block: return "block";
        case GraphicsMode::Ascii: return "ascii";
    }
    return "unknown";
}

std::optional<GraphicsMode> parse_graphics_mode(std::string_view name) {
    if (name == "kitty") return GraphicsMode::Kitty;
    if (name == "sixel") return GraphicsMode::Sixel;
    if (name == "block") return GraphicsMode::Block;
    if (name == "ascii") return GraphicsMode::Ascii;
    return std::nullopt;
}

Graphics::Graphics() : Graphics([](const char* name) { return std::getenv(name); }) {}

Graphics::Graphics(EnvLookup env) : env_(std::move(env)) {}

std::optional<GraphicsMode> Graphics::environment_override() const {
    const char* forced = env_("TESSERA_IMAGE_PROTOCOL");
    if (!forced || !*forced) return std::nullopt;

    auto mode = parse_graphics_mode(forced);
    if (!mode) {
        util::Logger::warn(std::string("Graphics: Ignoring unknown TESSERA_IMAGE_PROTOCOL '") + forced + "'");
    }
    return mode;
}

std::optional<GraphicsMode> Graphics::detect_from_environment() const {
    if (const char* term = env_("TERM")) {
        if (std::string_view(term).find("kitty") != std::string_view::npos) {
            util::Logger::info("Graphics: Kitty terminal detected via TERM");
            return GraphicsMode::Kitty;
        }
    }
    if (const char* program = env_("TERM_PROGRAM")) {
        std::string_view prog(program);
        // WezTerm and Ghostty implement the Kitty graphics protocol too
        if (prog == "kitty" || prog == "WezTerm" || prog == "ghostty") {
            util::Logger::info(std::string("Graphics: Kitty graphics via TERM_PROGRAM=") + program);
            return GraphicsMode::Kitty;
        }
    }
    if (env_("KITTY_WINDOW_ID")) {
        util::Logger::info("Graphics: Kitty terminal detected via KITTY_WINDOW_ID");
        return GraphicsMode::Kitty;
    }
    if (env_("KONSOLE_VERSION")) {
        util::Logger::info("Graphics: Konsole detected, Sixel capable");
        return GraphicsMode::Sixel;
    }
    return std::nullopt;
}

GraphicsMode Graphics::detect() {
    if (auto forced = environment_override()) {
        util::Logger::info(std::string("Graphics: Forced ") + graphics_mode_name(*forced) +
                           " via TESSERA_IMAGE_PROTOCOL");
        set_mode(*forced);
        return mode_;
    }

    set_mode(detect_from_environment().value_or(GraphicsMode::Block));
    return mode_;
}

GraphicsMode Graphics::detect_with_query(backend::Backend& backend, int timeout_ms) {
    if (auto forced = environment_override()) {
        set_mode(*forced);
        return mode_;
    }

    util::Logger::debug("Graphics: Querying Kitty graphics support");
    backend.write(query_sequence());
    backend.flush();
    auto cap = KittyGraphics::parse_query_response(backend.read_response(timeout_ms));

    if (cap.supported) {
        util::Logger::info("Graphics: Terminal confirmed Kitty graphics support");
        set_mode(GraphicsMode::Kitty);
        return mode_;
    }

    if (cap.responded) {
        util::Logger::info("Graphics: Kitty graphics rejected: " +
                           (cap.error_message.empty() ? std::string("no reason given") : cap.error_message));
    } else {
        util::Logger::info("Graphics: No reply to Kitty graphics query within " +
                           std::to_string(timeout_ms) + "ms");
    }

    // The probe outranks the environment for Kitty; Sixel can still come from it
    auto env_mode = detect_from_environment();
    if (env_mode == GraphicsMode::Sixel) {
        set_mode(GraphicsMode::Sixel);
    } else {
        set_mode(GraphicsMode::Block);
    }
    return mode_;
}

void Graphics::set_mode(GraphicsMode mode) {
    mode_ = mode;
    detected_ = true;
    if (mode == GraphicsMode::Kitty && !kitty_) {
        kitty_.emplace();
    }
    util::Logger::debug(std::string("Graphics: Mode set to ") + graphics_mode_name(mode));
}

bool Graphics::supports_images() const {
    return mode_ == GraphicsMode::Kitty || mode_ == GraphicsMode::Sixel;
}

std::optional<std::string> Graphics::draw_image(const Image& image, const Placement& placement) {
    if (mode_ != GraphicsMode::Kitty || !kitty_) {
        return std::nullopt;
    }
    return kitty_->draw_image(image, placement);
}

void Graphics::render_placeholder(render::Buffer& buffer, const render::Rect& area, std::string_view text) {
    if (area.width <= 0 || area.height <= 0) return;

    int text_len = std::min(static_cast<int>(text.size()), area.width);
    int start_x = area.x + (area.width - text_len) / 2;
    int start_y = area.y + area.height / 2;
    buffer.set_string_truncated(start_x, start_y, text, text_len,
                                style::Style::with_fg(style::Color::named(style::NamedColor::BrightBlack)));
}

void Graphics::render_image_to_buffer(const Image& image, render::Buffer& buffer,
                                      const render::Rect& area) const {
    if (image.format() == ImageFormat::Png) {
        // No PNG decoder: show where the image would be
        render_placeholder(buffer, area, "[PNG Image]");
        return;
    }
    if (area.width <= 0 || area.height <= 0) return;

    const uint32_t img_w = image.width();
    const uint32_t img_h = image.height();
    const uint32_t stride = image.stride();

    const float scale_x = static_cast<float>(img_w) / static_cast<float>(area.width);
    const float scale_y = static_cast<float>(img_h) / static_cast<float>(area.height * 2);

    for (int cy = 0; cy < area.height && area.y + cy < buffer.height(); ++cy) {
        for (int cx = 0; cx < area.width && area.x + cx < buffer.width(); ++cx) {
            auto img_x = static_cast<size_t>(static_cast<float>(cx) * scale_x);
            auto top_y = static_cast<size_t>(static_cast<float>(cy * 2) * scale_y);
            auto bottom_y = static_cast<size_t>(static_cast<float>(cy * 2 + 1) * scale_y);

            render::Cell* cell = buffer.get(area.x + cx, area.y + cy);
            if (!cell) continue;
            cell->ch = U'\u2580'; // Upper half block
            cell->fg = sample_pixel(image.data(), img_w, stride, img_x, top_y);
            cell->bg = sample_pixel(image.data(), img_w, stride, img_x, bottom_y);
        }
    }
}

std::string Graphics::query_sequence() {
    if (kitty_) return kitty_->query_support();
    KittyGraphics probe;
    return probe.query_support();
}

std::optional<std::string> Graphics::clear_images() {
    if (!kitty_) return std::nullopt;
    return kitty_->delete_images(DeleteTarget::All);
}

}  // namespace tessera::graphics
