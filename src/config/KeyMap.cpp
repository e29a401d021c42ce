#include "config/KeyMap.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace listui::config {

namespace {

const std::vector<std::pair<std::string, std::string>> kDefaults = {
    {"pause", "p"},
    {"next", "n"},
    {"prev", "b"},
    {"shuffle", "r"},
    {"repeat", "R"},
    {"follow", "f"},
    {"search", "s"},
    {"volume_up", "+"},
    {"volume_down", "-"},
    {"refresh", "u"},
    {"delete", "d"},
    {"help", "h"},
    {"back", "q"},
};

}  // namespace

KeyMap::KeyMap() {
    load_default_keybinds();
}

KeyMap::KeyMap(const std::unordered_map<std::string, std::string>& overrides) {
    load_default_keybinds();
    for (const auto& [action, key] : overrides) {
        const auto& known = actions();
        if (std::find(known.begin(), known.end(), action) == known.end()) {
            listui::util::Logger::warn("KeyMap: Unknown action '" + action + "' in keybinds");
            continue;
        }
        if (key.empty()) {
            listui::util::Logger::warn("KeyMap: Empty key for '" + action + "', keeping default");
            continue;
        }
        add_binding(action, key);
    }
}

void KeyMap::load_default_keybinds() {
    bindings_.clear();
    keys_.clear();
    for (const auto& [action, key] : kDefaults) {
        add_binding(action, key);
    }
}

void KeyMap::add_binding(const std::string& action, const std::string& key) {
    if (auto old = keys_.find(action); old != keys_.end()) {
        auto it = bindings_.find(old->second);
        if (it != bindings_.end() && it->second == action) bindings_.erase(it);
    }
    if (auto taken = bindings_.find(key); taken != bindings_.end() && taken->second != action) {
        listui::util::Logger::warn("KeyMap: '" + key + "' moves from " + taken->second + " to " + action);
        keys_.erase(taken->second);
    }
    bindings_[key] = action;
    keys_[action] = key;
}

std::string KeyMap::lookup_action(const std::string& key) const {
    auto it = bindings_.find(key);
    if (it != bindings_.end()) {
        return it->second;
    }
    return "";
}

std::string KeyMap::key_for(const std::string& action) const {
    auto it = keys_.find(action);
    return it != keys_.end() ? it->second : std::string();
}

const std::vector<std::string>& KeyMap::actions() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto& entry : kDefaults) out.push_back(entry.first);
        return out;
    }();
    return names;
}

}  // namespace listui::config
