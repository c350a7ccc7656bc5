#include "config/Config.hpp"
#include "graphics/Graphics.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace tessera::config {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

// Drops a trailing `# comment` that is not inside a quoted string
std::string strip_comment(const std::string& line) {
    bool in_quotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') in_quotes = !in_quotes;
        else if (line[i] == '#' && !in_quotes) return line.substr(0, i);
    }
    return line;
}

void warn_bad_value(const std::string& section, const std::string& key, const std::string& value) {
    util::Logger::warn("Config: Invalid value '" + value + "' for [" + section + "] " + key +
                       ", keeping default");
}

void parse_int(const std::string& section, const std::string& key, const std::string& value, int& out) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size() || parsed < 0) {
            warn_bad_value(section, key, value);
            return;
        }
        out = parsed;
    } catch (const std::exception&) {
        warn_bad_value(section, key, value);
    }
}

void parse_bool(const std::string& section, const std::string& key, const std::string& value, bool& out) {
    if (value == "true") out = true;
    else if (value == "false") out = false;
    else warn_bad_value(section, key, value);
}

void apply(Config& cfg, const std::string& section, const std::string& key, const std::string& value) {
    if (section == "terminal") {
        auto& t = cfg.terminal;
        if (key == "mouse") parse_bool(section, key, value, t.mouse);
        else if (key == "keyboard_protocol") {
            if (value == "legacy" || value == "kitty") t.keyboard_protocol = value;
            else warn_bad_value(section, key, value);
        }
        else if (key == "keyboard_flags") {
            int flags = static_cast<int>(t.keyboard_flags);
            parse_int(section, key, value, flags);
            t.keyboard_flags = static_cast<uint32_t>(flags);
        }
        else if (key == "keyboard_push_pop") parse_bool(section, key, value, t.keyboard_push_pop);
        else if (key == "keyboard_detect") parse_bool(section, key, value, t.keyboard_detect);
        else if (key == "keyboard_timeout_ms") parse_int(section, key, value, t.keyboard_timeout_ms);
        else if (key == "poll_timeout_ms") parse_int(section, key, value, t.poll_timeout_ms);
        else util::Logger::debug("Config: Unknown key [terminal] " + key);
    }
    else if (section == "graphics") {
        auto& g = cfg.graphics;
        if (key == "protocol") {
            if (value == "auto" || graphics::parse_graphics_mode(value)) g.protocol = value;
            else warn_bad_value(section, key, value);
        }
        else if (key == "query_on_startup") parse_bool(section, key, value, g.query_on_startup);
        else if (key == "query_timeout_ms") parse_int(section, key, value, g.query_timeout_ms);
        else util::Logger::debug("Config: Unknown key [graphics] " + key);
    }
    else if (section == "logging") {
        if (key == "level") {
            util::Logger::Level level;
            if (util::Logger::parse_level(value, level)) cfg.logging.level = value;
            else warn_bad_value(section, key, value);
        }
        else if (key == "file") cfg.logging.file = value;
        else util::Logger::debug("Config: Unknown key [logging] " + key);
    }
    else {
        util::Logger::debug("Config: Ignoring key in unknown section [" + section + "]");
    }
}

}

backend::KeyboardProtocolOptions TerminalConfig::keyboard_options() const {
    backend::KeyboardProtocolOptions options;
    options.mode = keyboard_protocol == "kitty" ? backend::KeyboardProtocolMode::Kitty
                                                : backend::KeyboardProtocolMode::Legacy;
    options.flags = keyboard_flags;
    options.use_push_pop = keyboard_push_pop;
    options.detect_support = keyboard_detect;
    options.timeout_ms = keyboard_timeout_ms;
    return options;
}

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    std::error_code ec;
    if (std::filesystem::exists(config_file, ec)) {
        return load_from_file(config_file);
    }
    util::Logger::info("Config: No config file at " + config_file.string() + ", using defaults");
    return Config{};
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot open " + path.string() + ", using defaults");
        return Config{};
    }
    std::stringstream contents;
    contents << file.rdbuf();
    return load_from_string(contents.str());
}

Config ConfigLoader::load_from_string(const std::string& text) {
    Config cfg;
    std::istringstream input(text);
    std::string line, current_section;

    while (std::getline(input, line)) {
        line = trim(strip_comment(line));
        if (line.empty()) continue;

        // Section header
        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::warn("Config: Ignoring malformed line: " + line);
            continue;
        }
        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        apply(cfg, current_section, key, value);
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            util::Logger::error("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: Cannot write " + path.string());
        return false;
    }

    auto flag = [](bool b) { return b ? "true" : "false"; };

    file << "# tessera configuration\n\n";

    file << "[terminal]\n";
    file << "# Report mouse clicks, drags and scrolling\n";
    file << "mouse = " << flag(cfg.terminal.mouse) << "\n\n";
    file << "# Keyboard encoding: \"legacy\" or \"kitty\"\n";
    file << "keyboard_protocol = \"" << cfg.terminal.keyboard_protocol << "\"\n";
    file << "# Kitty progressive enhancement flags (1 = disambiguate escape codes)\n";
    file << "keyboard_flags = " << cfg.terminal.keyboard_flags << "\n";
    file << "keyboard_push_pop = " << flag(cfg.terminal.keyboard_push_pop) << "\n";
    file << "# Ask the terminal before enabling the kitty protocol\n";
    file << "keyboard_detect = " << flag(cfg.terminal.keyboard_detect) << "\n";
    file << "keyboard_timeout_ms = " << cfg.terminal.keyboard_timeout_ms << "\n\n";
    file << "# Input wait per frame\n";
    file << "poll_timeout_ms = " << cfg.terminal.poll_timeout_ms << "\n\n";

    file << "[graphics]\n";
    file << "# Image protocol: \"auto\", \"kitty\", \"sixel\", \"block\", \"ascii\"\n";
    file << "protocol = \"" << cfg.graphics.protocol << "\"\n";
    file << "query_on_startup = " << flag(cfg.graphics.query_on_startup) << "\n";
    file << "query_timeout_ms = " << cfg.graphics.query_timeout_ms << "\n\n";

    file << "[logging]\n";
    file << "# \"debug\", \"info\", \"warn\", \"error\"\n";
    file << "level = \"" << cfg.logging.level << "\"\n";
    if (!cfg.logging.file.empty()) {
        file << "file = \"" << cfg.logging.file << "\"\n";
    } else {
        file << "# file = \"" << util::Platform::get_log_file().string() << "\"\n";
    }

    return static_cast<bool>(file);
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_file();
}

}  // namespace tessera::config
