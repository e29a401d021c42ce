#pragma once

#include <cstdint>
#include <string>

namespace listui::ui {

enum class Color : uint8_t {
    Default = 0,
    Black = 1,
    Red = 2,
    Green = 3,
    Yellow = 4,
    Blue = 5,
    Magenta = 6,
    Cyan = 7,
    White = 8,

    // Bright variants
    BrightBlack = 9,
    BrightRed = 10,
    BrightGreen = 11,
    BrightYellow = 12,
    BrightBlue = 13,
    BrightMagenta = 14,
    BrightCyan = 15,
    BrightWhite = 16
};

enum class Attribute : uint8_t {
    None = 0,
    Bold = 1 << 0,
    Dim = 1 << 1,
    Underline = 1 << 2,
    Reverse = 1 << 3
};

inline Attribute operator|(Attribute a, Attribute b) {
    return static_cast<Attribute>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline bool has_attribute(Attribute set, Attribute check) {
    return (static_cast<uint8_t>(set) & static_cast<uint8_t>(check)) != 0;
}

struct Style {
    Color fg = Color::Default;
    Color bg = Color::Default;
    Attribute attr = Attribute::None;

    bool operator==(const Style& other) const = default;
};

// SGR sequence selecting `style` from a reset state. Empty for the default style.
std::string to_sgr(const Style& style);

// Styles shared by the widgets
namespace styles {
inline constexpr Style kTitle{Color::BrightWhite, Color::Default, Attribute::Bold};
inline constexpr Style kFocusTitle{Color::BrightYellow, Color::Default, Attribute::Bold};
inline constexpr Style kSelected{Color::BrightYellow, Color::Default, Attribute::Bold};
inline constexpr Style kPlaying{Color::BrightGreen, Color::Default, Attribute::Bold};
inline constexpr Style kDim{Color::Default, Color::Default, Attribute::Dim};
inline constexpr Style kError{Color::BrightWhite, Color::Red, Attribute::Bold};
inline constexpr Style kAccent{Color::Cyan, Color::Default, Attribute::None};
}  // namespace styles

}  // namespace listui::ui
