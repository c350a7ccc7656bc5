#include "backend/NativeBackend.hpp"
#include "config/Config.hpp"
#include "graphics/Graphics.hpp"
#include "terminal/Terminal.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#include <csignal>
#include <deque>
#include <iostream>
#include <memory>
#include <string>

namespace {

// Set from the handler, checked by the main loop between polls
volatile std::sig_atomic_t g_shutdown = 0;

void signal_handler(int) {
    g_shutdown = 1;
}

struct DemoState {
    std::deque<std::string> log;
    int frames = 0;
    int mouse_x = -1;
    int mouse_y = -1;
    tessera::graphics::Image pattern = tessera::graphics::make_test_pattern();
    bool kitty_image = false;
};

std::string describe(const tessera::events::Event& event) {
    using tessera::events::Event;
    using tessera::events::KeyCode;
    switch (event.type) {
        case Event::Type::Key: {
            std::string text = "key ";
            if (event.key.modifiers.ctrl) text += "ctrl+";
            if (event.key.modifiers.alt) text += "alt+";
            if (event.key.modifiers.shift) text += "shift+";
            if (event.key.code.type == KeyCode::Type::Char) {
                std::string utf8;
                if (tessera::util::append_utf8(utf8, static_cast<char32_t>(event.key.code.value))) {
                    text += "'" + utf8 + "'";
                }
            } else if (event.key.code.type == KeyCode::Type::F) {
                text += "F" + std::to_string(event.key.code.value);
            } else {
                text += "code " + std::to_string(static_cast<int>(event.key.code.type));
            }
            return text;
        }
        case Event::Type::Mouse:
            return "mouse " + std::to_string(static_cast<int>(event.mouse.kind)) + " at " +
                   std::to_string(event.mouse.x) + "," + std::to_string(event.mouse.y);
        case Event::Type::Resize:
            return "resize " + std::to_string(event.width) + "x" + std::to_string(event.height);
        case Event::Type::FocusGained:
            return "focus gained";
        case Event::Type::FocusLost:
            return "focus lost";
        case Event::Type::Paste:
            return "paste (" + std::to_string(event.text.size()) + " bytes)";
        case Event::Type::None:
            break;
    }
    return "none";
}

void render_frame(DemoState& state, tessera::render::Buffer& buf,
                  const tessera::graphics::Graphics& graphics) {
    using namespace tessera;
    ++state.frames;

    auto area = buf.area();
    if (area.empty()) return;

    auto title_style = style::Style::with_fg(style::Color::named(style::NamedColor::BrightCyan))
                           .add_modifier(style::Modifier::Bold);
    buf.set_string(1, 0, "tessera demo", title_style);
    buf.set_string_truncated(16, 0, "q: quit  c: clear  mode: " +
                                        std::string(graphics::graphics_mode_name(graphics.mode())),
                             area.width - 16, style::Style::with_fg(style::Color::indexed(244)));

    auto body = area.split_vertical(1).bottom;
    auto columns = body.split_horizontal(body.width / 2);

    int row = columns.left.y;
    for (const auto& line : state.log) {
        if (row >= columns.left.bottom()) break;
        buf.set_string_truncated(columns.left.x + 1, row++, line, columns.left.width - 2);
    }

    // Image panel: half blocks unless the terminal draws the real image
    auto panel = columns.right.inner(1);
    if (!state.kitty_image) {
        graphics.render_image_to_buffer(state.pattern, buf, panel.intersection(render::Rect{panel.x, panel.y, 16, 8}));
    }

    std::string status = "frame " + std::to_string(state.frames);
    if (state.mouse_x >= 0) {
        status += "  mouse " + std::to_string(state.mouse_x) + "," + std::to_string(state.mouse_y);
    }
    buf.set_string_truncated(1, area.bottom() - 1, status, area.width - 2,
                             style::Style::with_bg(style::Color::rgb(40, 40, 60)));
}

}

int main() {
    using namespace tessera;

    util::Logger::init();
    auto cfg = config::ConfigLoader::load_config();
    if (!cfg.logging.file.empty()) {
        util::Logger::init(cfg.logging.file);
    }
    util::Logger::Level level;
    if (util::Logger::parse_level(cfg.logging.level, level)) {
        util::Logger::set_level(level);
    }
    util::Logger::info("tessera-demo starting");

    try {
        terminal::Terminal term(backend::create_native_backend());
        term.init();

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        term.hide_cursor();
        if (cfg.terminal.mouse) {
            term.enable_mouse();
        }
        term.enable_keyboard_protocol(cfg.terminal.keyboard_options());

        graphics::Graphics gfx;
        auto configured = graphics::parse_graphics_mode(cfg.graphics.protocol);
        if (auto forced = gfx.environment_override()) {
            gfx.set_mode(*forced);
        } else if (configured) {
            gfx.set_mode(*configured);
        } else if (cfg.graphics.query_on_startup) {
            gfx.detect_with_query(term.backend(), cfg.graphics.query_timeout_ms);
        } else {
            gfx.detect();
        }

        DemoState state;
        state.kitty_image = gfx.mode() == graphics::GraphicsMode::Kitty;
        bool image_sent = false;

        while (!g_shutdown) {
            term.draw(state, [&gfx](DemoState& s, render::Buffer& buf) { render_frame(s, buf, gfx); });

            if (state.kitty_image && !image_sent) {
                auto size = term.size();
                int panel_x = size.width / 2 + 1;
                term.set_cursor(panel_x, 2);
                graphics::Placement placement;
                placement.width = 16;
                placement.height = 8;
                if (auto seq = gfx.draw_image(state.pattern, placement)) {
                    term.backend().write(*seq);
                    term.backend().flush();
                }
                image_sent = true;
            }

            auto event = term.poll_event(cfg.terminal.poll_timeout_ms);
            if (event.is_none()) continue;

            state.log.push_front(describe(event));
            if (state.log.size() > 200) state.log.pop_back();

            if (event.is_char(U'q') || (event.type == events::Event::Type::Key &&
                                        event.key.modifiers.ctrl && event.key.is_char(U'c'))) {
                break;
            }
            if (event.is_char(U'c')) {
                state.log.clear();
                if (auto seq = gfx.clear_images()) {
                    term.backend().write(*seq);
                }
                term.clear();
                image_sent = false;
            }
            if (event.type == events::Event::Type::Mouse) {
                state.mouse_x = event.mouse.x;
                state.mouse_y = event.mouse.y;
            }
            if (event.is_resize()) {
                term.resize({event.width, event.height});
                term.clear();
                image_sent = false;
            }
        }

        if (auto seq = gfx.clear_images()) {
            term.backend().write(*seq);
            term.backend().flush();
        }
        term.shutdown();
        util::Logger::info("tessera-demo shutdown");
        return 0;
    } catch (const std::exception& e) {
        // Terminal's destructor has already restored the screen
        util::Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
