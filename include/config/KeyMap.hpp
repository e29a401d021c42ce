#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace listui::config {

// Maps key names (as produced by ui::Terminal) to shell actions.
// Arrows, Enter, Esc, Backspace and the digit keys are fixed and not listed here.
class KeyMap {
public:
    KeyMap();
    // Defaults, then `overrides` (action -> key) from the [keybinds] config section.
    explicit KeyMap(const std::unordered_map<std::string, std::string>& overrides);

    void load_default_keybinds();
    // Binds `action` to `key`, dropping the action's previous key.
    void add_binding(const std::string& action, const std::string& key);

    // Empty string when the key is unbound.
    std::string lookup_action(const std::string& key) const;
    std::string key_for(const std::string& action) const;

    static const std::vector<std::string>& actions();

private:
    std::unordered_map<std::string, std::string> bindings_;  // key -> action
    std::unordered_map<std::string, std::string> keys_;      // action -> key
};

}  // namespace listui::config
