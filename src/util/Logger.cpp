#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <atomic>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <string_view>

namespace tessera::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Keep file open for performance
static std::atomic<Logger::Level> min_level{Logger::Level::Info};

void Logger::init() {
    init(Platform::get_log_file().string());
}

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    // Close existing file if open
    if (log_file.is_open()) {
        log_file.close();
    }
    log_file.open(path, std::ios::trunc);
}

void Logger::set_level(Level level) {
    min_level.store(level);
}

Logger::Level Logger::level() {
    return min_level.load();
}

bool Logger::parse_level(const std::string& name, Level& out) {
    if (name == "debug") { out = Level::Debug; return true; }
    if (name == "info")  { out = Level::Info;  return true; }
    if (name == "warn")  { out = Level::Warn;  return true; }
    if (name == "error") { out = Level::Error; return true; }
    return false;
}

void Logger::log(Level level, const std::string& message) {
    if (level < min_level.load()) return;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_file.is_open()) {
        // Fallback: open if not initialized
        log_file.open(Platform::get_log_file(), std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &now);
#else
    localtime_r(&now, &tm);
#endif

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    log_file << std::put_time(&tm, "[%H:%M:%S] ") << level_str << message << '\n';
    log_file.flush();  // Ensure writes are visible immediately
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace tessera::util
