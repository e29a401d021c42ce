#pragma once

#include <string>

namespace listui::ui {

struct InputEvent {
    enum class Type {
        None,
        KeyPress,
        Resize
    };

    Type type = Type::None;
    int key = 0;           // char code, 0 for named keys
    std::string key_name;  // "up", "down", "left", "right", "enter", "escape", "backspace", "tab" or the character

    bool is_key(const std::string& name_to_check) const {
        return type == Type::KeyPress && key_name == name_to_check;
    }

    // Text typed by the user. UTF-8 characters arrive whole in key_name.
    bool is_printable() const {
        return type == Type::KeyPress && key >= 32 && key != 127;
    }
};

}  // namespace listui::ui
