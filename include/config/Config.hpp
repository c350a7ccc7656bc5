#pragma once

#include "backend/Backend.hpp"
#include <cstdint>
#include <filesystem>
#include <string>

namespace tessera::config {

struct TerminalConfig {
    bool mouse = false;
    std::string keyboard_protocol = "legacy"; // legacy | kitty
    uint32_t keyboard_flags = 1;
    bool keyboard_push_pop = true;
    bool keyboard_detect = false;
    int keyboard_timeout_ms = 50;
    int poll_timeout_ms = 100;

    backend::KeyboardProtocolOptions keyboard_options() const;
};

struct GraphicsConfig {
    std::string protocol = "auto"; // auto | kitty | sixel | block | ascii
    bool query_on_startup = false;
    int query_timeout_ms = 100;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file; // empty: util::Platform::get_log_file()
};

struct Config {
    TerminalConfig terminal;
    GraphicsConfig graphics;
    LoggingConfig logging;
};

/**
 * Reads config.toml: `[section]` headers, `key = value` lines, `#` comments,
 * double-quoted strings. Unknown keys are ignored and bad values keep their
 * defaults, each with a warning in the log.
 */
class ConfigLoader {
public:
    // Defaults when the file does not exist
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static Config load_from_string(const std::string& text);

    // Returns false (and logs) when the file cannot be written
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();
};

}  // namespace tessera::config
