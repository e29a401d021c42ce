#pragma once

#include <filesystem>
#include <string>

namespace listui::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Opens (truncates) the log file. Messages logged before init() go to the default path.
    static void init(const std::filesystem::path& path);
    static void set_level(Level level);
    static Level level_from_string(const std::string& name);
    static std::filesystem::path default_path();

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace listui::util
