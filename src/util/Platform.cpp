#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <algorithm>
#include <unistd.h>

namespace listui::util {

namespace {

std::filesystem::path home_relative(const char* xdg_var, const std::filesystem::path& fallback_suffix) {
    if (auto xdg = std::getenv(xdg_var); xdg && *xdg) {
        return std::filesystem::path(xdg) / "listui";
    }
    if (auto home = std::getenv("HOME")) {
        return std::filesystem::path(home) / fallback_suffix / "listui";
    }
    Logger::warn(std::string("Platform: HOME env var not set, using fallback: ") +
                 (fallback_suffix / "listui").string());
    return fallback_suffix / "listui";
}

}  // namespace

std::filesystem::path Platform::get_config_directory() {
    return home_relative("XDG_CONFIG_HOME", ".config");
}

std::filesystem::path Platform::get_cache_directory() {
    return home_relative("XDG_CACHE_HOME", ".cache");
}

std::filesystem::path Platform::get_data_directory() {
    return home_relative("XDG_DATA_HOME", std::filesystem::path(".local") / "share");
}

std::filesystem::path Platform::expand_home(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        if (auto home = std::getenv("HOME")) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

bool Platform::is_audio_file(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);

    static const std::string extensions[] = {".mp3", ".flac", ".ogg", ".wav"};

    for (const auto& e : extensions) {
        if (ext == e) return true;
    }
    return false;
}

std::string Platform::get_audio_format(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext;
}

std::optional<std::filesystem::path> Platform::find_executable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) return std::filesystem::path(name);
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return std::nullopt;

    std::string paths(path_env);
    size_t start = 0;
    while (start <= paths.size()) {
        size_t end = paths.find(':', start);
        if (end == std::string::npos) end = paths.size();
        std::string dir = paths.substr(start, end - start);
        if (dir.empty()) dir = ".";

        auto candidate = std::filesystem::path(dir) / name;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            Logger::debug("Platform: Found " + name + " at " + candidate.string());
            return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

}  // namespace listui::util
