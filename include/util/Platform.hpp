#pragma once

#include <filesystem>

namespace tessera::util {

class Platform {
public:
    // $XDG_CONFIG_HOME/tessera, else ~/.config/tessera
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_config_file();

    // $TESSERA_LOG_FILE, else /tmp/tessera_debug.log
    static std::filesystem::path get_log_file();

    static bool is_windows();
};

}  // namespace tessera::util
