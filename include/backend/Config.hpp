#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace listui::backend {

struct Config {
    // Playback settings
    int default_volume = 50;
    bool shuffle = false;
    std::string repeat = "off";
    int seek_seconds = 15;
    int volume_step = 10;
    bool advance_on_failure = true;

    // Download settings
    std::filesystem::path download_directory;
    int max_downloads = 3;
    std::string downloader = "yt-dlp";
    std::string decoder = "ffmpeg";

    // Remote metadata
    std::string youtube_api_key;
    std::vector<std::string> invidious_instances;
    int request_timeout = 20;  // seconds

    // Paths
    std::filesystem::path database;

    // Logging
    std::string log_level = "info";
    std::filesystem::path log_file;

    // Keybinds: action -> key
    std::unordered_map<std::string, std::string> keybinds;
};

class ConfigLoader {
public:
    // Reads ~/.config/listui/config.toml, writing the defaults out when it does not exist.
    // YT_API_KEY in the environment overrides remote.youtube_api_key.
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static Config parse(const std::string& text);
    static void save_config(const Config& cfg, const std::filesystem::path& path);
    static Config create_default_config();

    static std::filesystem::path get_config_file();
};

}  // namespace listui::backend
