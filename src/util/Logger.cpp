#include "util/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <format>
#include <atomic>
#include <system_error>

namespace listui::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Kept open for the lifetime of the process
static std::atomic<Logger::Level> min_level{Logger::Level::Info};

std::filesystem::path Logger::default_path() {
    return std::filesystem::temp_directory_path() / "listui.log";
}

void Logger::init(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    log_file.open(path, std::ios::trunc);
}

void Logger::set_level(Level level) {
    min_level.store(level);
}

Logger::Level Logger::level_from_string(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    return Level::Info;
}

void Logger::log(Level level, const std::string& message) {
    if (level < min_level.load()) return;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_file.is_open()) {
        log_file.open(default_path(), std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    log_file << std::put_time(&tm, "[%H:%M:%S] ");
    log_file << std::format("{}{}\n", level_str, message);
    log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace listui::util
