#include "../framework/SimpleTest.hpp"
#include "config/Config.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace tessera;
using config::ConfigLoader;

namespace {

std::filesystem::path scratch_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("tessera_test_" + name);
    std::filesystem::remove_all(dir);
    return dir;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}

TEST_CASE(test_defaults) {
    config::Config cfg;
    ASSERT_FALSE(cfg.terminal.mouse);
    ASSERT_EQ(cfg.terminal.keyboard_protocol, "legacy");
    ASSERT_EQ(cfg.terminal.poll_timeout_ms, 100);
    ASSERT_EQ(cfg.graphics.protocol, "auto");
    ASSERT_FALSE(cfg.graphics.query_on_startup);
    ASSERT_EQ(cfg.logging.level, "info");
    ASSERT_TRUE(cfg.logging.file.empty());

    auto options = cfg.terminal.keyboard_options();
    ASSERT_TRUE(options.mode == backend::KeyboardProtocolMode::Legacy);
    ASSERT_EQ(options.flags, 1u);
    ASSERT_TRUE(options.use_push_pop);
}

TEST_CASE(test_load_from_string) {
    auto cfg = ConfigLoader::load_from_string(
        "# comment line\n"
        "[terminal]\n"
        "mouse = true\n"
        "keyboard_protocol = \"kitty\"   # inline comment\n"
        "keyboard_flags = 3\n"
        "keyboard_push_pop = false\n"
        "keyboard_detect = true\n"
        "keyboard_timeout_ms = 75\n"
        "poll_timeout_ms = 16\n"
        "\n"
        "[graphics]\n"
        "protocol = \"block\"\n"
        "query_on_startup = true\n"
        "query_timeout_ms = 250\n"
        "\n"
        "  [ logging ]  \n"
        "level = \"debug\"\n"
        "file = \"/tmp/my#log.txt\"\n");

    ASSERT_TRUE(cfg.terminal.mouse);
    ASSERT_EQ(cfg.terminal.keyboard_protocol, "kitty");
    ASSERT_EQ(cfg.terminal.keyboard_flags, 3u);
    ASSERT_FALSE(cfg.terminal.keyboard_push_pop);
    ASSERT_TRUE(cfg.terminal.keyboard_detect);
    ASSERT_EQ(cfg.terminal.keyboard_timeout_ms, 75);
    ASSERT_EQ(cfg.terminal.poll_timeout_ms, 16);
    ASSERT_EQ(cfg.graphics.protocol, "block");
    ASSERT_TRUE(cfg.graphics.query_on_startup);
    ASSERT_EQ(cfg.graphics.query_timeout_ms, 250);
    ASSERT_EQ(cfg.logging.level, "debug");
    ASSERT_EQ(cfg.logging.file, "/tmp/my#log.txt");

    auto options = cfg.terminal.keyboard_options();
    ASSERT_TRUE(options.mode == backend::KeyboardProtocolMode::Kitty);
    ASSERT_EQ(options.flags, 3u);
    ASSERT_FALSE(options.use_push_pop);
    ASSERT_TRUE(options.detect_support);
    ASSERT_EQ(options.timeout_ms, 75);
}

TEST_CASE(test_bad_values_keep_defaults) {
    auto cfg = ConfigLoader::load_from_string(
        "[terminal]\n"
        "mouse = yes\n"
        "keyboard_protocol = \"csi-u\"\n"
        "poll_timeout_ms = -5\n"
        "keyboard_timeout_ms = 12ms\n"
        "keyboard_flags = lots\n"
        "not a key value line\n"
        "[graphics]\n"
        "protocol = \"iterm\"\n"
        "[logging]\n"
        "level = \"verbose\"\n");

    config::Config defaults;
    ASSERT_EQ(cfg.terminal.mouse, defaults.terminal.mouse);
    ASSERT_EQ(cfg.terminal.keyboard_protocol, defaults.terminal.keyboard_protocol);
    ASSERT_EQ(cfg.terminal.poll_timeout_ms, defaults.terminal.poll_timeout_ms);
    ASSERT_EQ(cfg.terminal.keyboard_timeout_ms, defaults.terminal.keyboard_timeout_ms);
    ASSERT_EQ(cfg.terminal.keyboard_flags, defaults.terminal.keyboard_flags);
    ASSERT_EQ(cfg.graphics.protocol, defaults.graphics.protocol);
    ASSERT_EQ(cfg.logging.level, defaults.logging.level);
}

TEST_CASE(test_unknown_keys_and_sections_ignored) {
    auto cfg = ConfigLoader::load_from_string(
        "orphan = 1\n"
        "[audio]\n"
        "volume = 11\n"
        "[terminal]\n"
        "colour = \"blue\"\n"
        "mouse = true\n");
    ASSERT_TRUE(cfg.terminal.mouse);
}

TEST_CASE(test_missing_file_gives_defaults) {
    auto dir = scratch_dir("missing");
    auto cfg = ConfigLoader::load_from_file(dir / "nope.toml");
    ASSERT_EQ(cfg.graphics.protocol, "auto");
    ASSERT_FALSE(cfg.terminal.mouse);
}

TEST_CASE(test_save_and_reload) {
    auto dir = scratch_dir("save");
    auto path = dir / "nested" / "config.toml";

    config::Config cfg;
    cfg.terminal.mouse = true;
    cfg.terminal.keyboard_protocol = "kitty";
    cfg.terminal.keyboard_flags = 31;
    cfg.terminal.poll_timeout_ms = 33;
    cfg.graphics.protocol = "sixel";
    cfg.graphics.query_timeout_ms = 500;
    cfg.logging.level = "warn";
    cfg.logging.file = (dir / "tessera.log").string();

    ASSERT_TRUE(ConfigLoader::save_config(cfg, path));
    ASSERT_TRUE(std::filesystem::exists(path));

    auto loaded = ConfigLoader::load_from_file(path);
    ASSERT_TRUE(loaded.terminal.mouse);
    ASSERT_EQ(loaded.terminal.keyboard_protocol, "kitty");
    ASSERT_EQ(loaded.terminal.keyboard_flags, 31u);
    ASSERT_EQ(loaded.terminal.poll_timeout_ms, 33);
    ASSERT_EQ(loaded.graphics.protocol, "sixel");
    ASSERT_EQ(loaded.graphics.query_timeout_ms, 500);
    ASSERT_EQ(loaded.logging.level, "warn");
    ASSERT_EQ(loaded.logging.file, cfg.logging.file);

    std::filesystem::remove_all(dir);
}

TEST_CASE(test_save_defaults_roundtrip) {
    auto dir = scratch_dir("defaults");
    auto path = dir / "config.toml";
    ASSERT_TRUE(ConfigLoader::save_config(config::Config{}, path));

    auto loaded = ConfigLoader::load_from_file(path);
    ASSERT_TRUE(loaded.logging.file.empty());
    ASSERT_EQ(loaded.graphics.protocol, "auto");
    ASSERT_EQ(loaded.terminal.keyboard_protocol, "legacy");

    std::filesystem::remove_all(dir);
}

TEST_CASE(test_logger_levels) {
    util::Logger::Level level = util::Logger::Level::Info;
    ASSERT_TRUE(util::Logger::parse_level("debug", level));
    ASSERT_TRUE(level == util::Logger::Level::Debug);
    ASSERT_TRUE(util::Logger::parse_level("error", level));
    ASSERT_TRUE(level == util::Logger::Level::Error);
    ASSERT_FALSE(util::Logger::parse_level("loud", level));
    ASSERT_TRUE(level == util::Logger::Level::Error);
}

TEST_CASE(test_logger_filters_below_level) {
    auto dir = scratch_dir("logger");
    std::filesystem::create_directories(dir);
    auto path = dir / "log.txt";

    util::Logger::init(path.string());
    util::Logger::set_level(util::Logger::Level::Warn);
    util::Logger::info("hidden message");
    util::Logger::warn("shown warning");
    util::Logger::error("shown error");
    util::Logger::set_level(util::Logger::Level::Info);
    // Reopen elsewhere so the file is closed before reading
    util::Logger::init((dir / "other.txt").string());

    std::string contents = read_file(path);
    ASSERT_TRUE(contents.find("hidden message") == std::string::npos);
    ASSERT_TRUE(contents.find("shown warning") != std::string::npos);
    ASSERT_TRUE(contents.find("shown error") != std::string::npos);

    std::filesystem::remove_all(dir);
}

#ifndef _WIN32
TEST_CASE(test_platform_paths) {
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg_test", 1);
    ASSERT_EQ(util::Platform::get_config_directory(), std::filesystem::path("/tmp/xdg_test/tessera"));
    ASSERT_EQ(util::Platform::get_config_file(), std::filesystem::path("/tmp/xdg_test/tessera/config.toml"));
    ASSERT_EQ(ConfigLoader::get_config_file(), util::Platform::get_config_file());

    ::unsetenv("XDG_CONFIG_HOME");
    ::setenv("HOME", "/home/someone", 1);
    ASSERT_EQ(util::Platform::get_config_directory(), std::filesystem::path("/home/someone/.config/tessera"));

    ::setenv("TESSERA_LOG_FILE", "/tmp/custom.log", 1);
    ASSERT_EQ(util::Platform::get_log_file(), std::filesystem::path("/tmp/custom.log"));
    ::unsetenv("TESSERA_LOG_FILE");
    ASSERT_EQ(util::Platform::get_log_file(), std::filesystem::path("/tmp/tessera_debug.log"));
    ASSERT_FALSE(util::Platform::is_windows());
}
#endif

int main() {
    return tessera::test::TestRunner::instance().run_all();
}
