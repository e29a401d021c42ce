#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace listui::backend {

namespace {

const std::vector<std::string> kDefaultInstances = {
    "https://vid.puffyan.us",
    "https://y.com.sb",
    "https://invidious.nerdvpn.de",
    "https://invidious.tiekoetter.com",
    "https://inv.bp.projectsegfau.lt",
};

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

void parse_int(const std::string& key, const std::string& value, int& out, int min, int max) {
    int parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        listui::util::Logger::warn("Config: Ignoring non-numeric value for " + key + ": " + value);
        return;
    }
    out = std::clamp(parsed, min, max);
}

void parse_bool(const std::string& key, const std::string& value, bool& out) {
    if (value == "true") out = true;
    else if (value == "false") out = false;
    else listui::util::Logger::warn("Config: Ignoring non-boolean value for " + key + ": " + value);
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        while (!item.empty() && item.back() == '/') item.pop_back();
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

std::string keybind_or(const Config& cfg, const std::string& action, const std::string& fallback) {
    auto it = cfg.keybinds.find(action);
    return it != cfg.keybinds.end() ? it->second : fallback;
}

}  // namespace

Config ConfigLoader::load_config() {
    listui::util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    Config cfg;
    if (std::filesystem::exists(config_file)) {
        cfg = load_from_file(config_file);
    } else {
        cfg = create_default_config();
        save_config(cfg, config_file);
    }

    if (const char* key = std::getenv("YT_API_KEY"); key && *key) {
        cfg.youtube_api_key = key;
    }
    return cfg;
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    listui::util::Logger::debug("Config: Loading from " + path.string());

    std::ifstream file(path);
    if (!file) {
        listui::util::Logger::warn("Config: Cannot read " + path.string() + ", using defaults");
        return create_default_config();
    }
    std::stringstream contents;
    contents << file.rdbuf();
    return parse(contents.str());
}

Config ConfigLoader::parse(const std::string& text) {
    Config cfg = create_default_config();

    std::istringstream input(text);
    std::string line, current_section;
    while (std::getline(input, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            continue;
        }

        // Key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "playback") {
            if (key == "default_volume") parse_int(key, value, cfg.default_volume, 0, 100);
            else if (key == "shuffle") parse_bool(key, value, cfg.shuffle);
            else if (key == "repeat") cfg.repeat = value;
            else if (key == "seek_seconds") parse_int(key, value, cfg.seek_seconds, 1, 600);
            else if (key == "volume_step") parse_int(key, value, cfg.volume_step, 1, 100);
            else if (key == "advance_on_failure") parse_bool(key, value, cfg.advance_on_failure);
        }
        else if (current_section == "download") {
            if (key == "directory") cfg.download_directory = listui::util::Platform::expand_home(value);
            else if (key == "max_downloads") parse_int(key, value, cfg.max_downloads, 1, 16);
            else if (key == "downloader") cfg.downloader = value;
            else if (key == "decoder") cfg.decoder = value;
        }
        else if (current_section == "remote") {
            if (key == "youtube_api_key") cfg.youtube_api_key = value;
            else if (key == "invidious_instances") cfg.invidious_instances = split_list(value);
            else if (key == "request_timeout") parse_int(key, value, cfg.request_timeout, 1, 300);
        }
        else if (current_section == "paths") {
            if (key == "database") cfg.database = listui::util::Platform::expand_home(value);
        }
        else if (current_section == "logging") {
            if (key == "level") cfg.log_level = value;
            else if (key == "file") cfg.log_file = listui::util::Platform::expand_home(value);
        }
        else if (current_section == "keybinds") {
            cfg.keybinds[key] = value;
        }
    }

    if (cfg.repeat != "off" && cfg.repeat != "all" && cfg.repeat != "one") {
        listui::util::Logger::warn("Config: Unknown repeat mode '" + cfg.repeat + "', using off");
        cfg.repeat = "off";
    }

    return cfg;
}

void ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    listui::util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        listui::util::Logger::warn("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
        return;
    }

    std::ofstream file(path);
    if (!file) {
        listui::util::Logger::warn("Config: Cannot write " + path.string());
        return;
    }

    file << "# listui config\n\n";

    file << "[playback]\n";
    file << "# Default volume level (0-100)\n";
    file << "default_volume = " << cfg.default_volume << "\n";
    file << "# Shuffle playlists when they are opened\n";
    file << "shuffle = " << (cfg.shuffle ? "true" : "false") << "\n";
    file << "# Repeat mode: \"off\", \"all\", \"one\"\n";
    file << "repeat = \"" << cfg.repeat << "\"\n";
    file << "# Step for left/right seeking, in seconds\n";
    file << "seek_seconds = " << cfg.seek_seconds << "\n";
    file << "volume_step = " << cfg.volume_step << "\n";
    file << "# Move on to the next song when one cannot be downloaded or played\n";
    file << "advance_on_failure = " << (cfg.advance_on_failure ? "true" : "false") << "\n\n";

    file << "[download]\n";
    file << "directory = \"" << cfg.download_directory.string() << "\"\n";
    file << "# Downloads running at the same time\n";
    file << "max_downloads = " << cfg.max_downloads << "\n";
    file << "downloader = \"" << cfg.downloader << "\"\n";
    file << "decoder = \"" << cfg.decoder << "\"\n\n";

    file << "[remote]\n";
    file << "# YouTube Data API key; when empty the Invidious instances are used\n";
    file << "youtube_api_key = \"" << cfg.youtube_api_key << "\"\n";
    file << "invidious_instances = \"";
    for (size_t i = 0; i < cfg.invidious_instances.size(); ++i) {
        if (i) file << ",";
        file << cfg.invidious_instances[i];
    }
    file << "\"\n";
    file << "# HTTP timeout in seconds\n";
    file << "request_timeout = " << cfg.request_timeout << "\n\n";

    file << "[paths]\n";
    file << "database = \"" << cfg.database.string() << "\"\n\n";

    file << "[logging]\n";
    file << "# debug, info, warn, error\n";
    file << "level = \"" << cfg.log_level << "\"\n";
    file << "file = \"" << cfg.log_file.string() << "\"\n\n";

    file << "[keybinds]\n";
    file << "pause = \"" << keybind_or(cfg, "pause", "p") << "\"\n";
    file << "next = \"" << keybind_or(cfg, "next", "n") << "\"\n";
    file << "prev = \"" << keybind_or(cfg, "prev", "b") << "\"\n";
    file << "shuffle = \"" << keybind_or(cfg, "shuffle", "r") << "\"\n";
    file << "repeat = \"" << keybind_or(cfg, "repeat", "R") << "\"\n";
    file << "follow = \"" << keybind_or(cfg, "follow", "f") << "\"\n";
    file << "search = \"" << keybind_or(cfg, "search", "s") << "\"\n";
    file << "volume_up = \"" << keybind_or(cfg, "volume_up", "+") << "\"\n";
    file << "volume_down = \"" << keybind_or(cfg, "volume_down", "-") << "\"\n";
    file << "refresh = \"" << keybind_or(cfg, "refresh", "u") << "\"\n";
    file << "delete = \"" << keybind_or(cfg, "delete", "d") << "\"\n";
    file << "help = \"" << keybind_or(cfg, "help", "h") << "\"\n";
    file << "back = \"" << keybind_or(cfg, "back", "q") << "\"\n";
}

std::filesystem::path ConfigLoader::get_config_file() {
    return listui::util::Platform::get_config_directory() / "config.toml";
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    cfg.download_directory = listui::util::Platform::get_cache_directory() / "tracks";
    cfg.database = listui::util::Platform::get_data_directory() / "listui.db";
    cfg.log_file = listui::util::Platform::get_cache_directory() / "listui.log";
    cfg.invidious_instances = kDefaultInstances;
    return cfg;
}

}  // namespace listui::backend
