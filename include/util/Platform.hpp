#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace listui::util {

class Platform {
public:
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_cache_directory();
    static std::filesystem::path get_data_directory();

    // Expands a leading "~/" to $HOME.
    static std::filesystem::path expand_home(const std::string& path);

    static bool is_audio_file(const std::filesystem::path& path);
    static std::string get_audio_format(const std::filesystem::path& path);

    // Resolves an executable name against $PATH. Names containing '/' are checked as given.
    static std::optional<std::filesystem::path> find_executable(const std::string& name);
};

}  // namespace listui::util
