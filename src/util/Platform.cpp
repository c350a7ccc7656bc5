#include "util/Platform.hpp"
#include <cstdlib>

namespace tessera::util {

// No logging here: the logger asks for its own file path through this class.

std::filesystem::path Platform::get_config_directory() {
    auto xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::filesystem::path(xdg) / "tessera";
    }
    auto home = std::getenv("HOME");
    if (home && *home) {
        return std::filesystem::path(home) / ".config" / "tessera";
    }
    return ".config/tessera";
}

std::filesystem::path Platform::get_config_file() {
    return get_config_directory() / "config.toml";
}

std::filesystem::path Platform::get_log_file() {
    auto env = std::getenv("TESSERA_LOG_FILE");
    if (env && *env) {
        return env;
    }
#ifdef _WIN32
    return std::filesystem::temp_directory_path() / "tessera_debug.log";
#else
    return "/tmp/tessera_debug.log";
#endif
}

bool Platform::is_windows() {
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

}  // namespace tessera::util
