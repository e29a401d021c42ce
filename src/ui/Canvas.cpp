#include "ui/Canvas.hpp"
#include <algorithm>
#include <wchar.h>

namespace listui::ui {

namespace {

size_t utf8_char_len(unsigned char c) {
    if ((c & 0x80) == 0) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;  // Invalid or continuation byte
}

// Decodes one UTF-8 character. Returns 0 on malformed input.
int utf8_to_wchar(const char* s, size_t len, wchar_t* out) {
    if (len == 0 || !s) return 0;
    unsigned char c = s[0];

    if ((c & 0x80) == 0) {
        *out = c;
        return 1;
    } else if ((c & 0xE0) == 0xC0 && len >= 2) {
        *out = ((c & 0x1F) << 6) | (s[1] & 0x3F);
        return 2;
    } else if ((c & 0xF0) == 0xE0 && len >= 3) {
        *out = ((c & 0x0F) << 12) | ((s[1] & 0x3F) << 6) | (s[2] & 0x3F);
        return 3;
    } else if ((c & 0xF8) == 0xF0 && len >= 4) {
        *out = ((c & 0x07) << 18) | ((s[1] & 0x3F) << 12) | ((s[2] & 0x3F) << 6) | (s[3] & 0x3F);
        return 4;
    }
    return 0;
}

int color_code(Color color, int base) {
    int index = static_cast<int>(color) - 1;
    return index < 8 ? base + index : base + 60 + (index - 8);
}

}  // namespace

std::string to_sgr(const Style& style) {
    std::string codes;
    auto add = [&codes](int code) {
        if (!codes.empty()) codes += ';';
        codes += std::to_string(code);
    };

    if (has_attribute(style.attr, Attribute::Bold)) add(1);
    if (has_attribute(style.attr, Attribute::Dim)) add(2);
    if (has_attribute(style.attr, Attribute::Underline)) add(4);
    if (has_attribute(style.attr, Attribute::Reverse)) add(7);
    if (style.fg != Color::Default) add(color_code(style.fg, 30));
    if (style.bg != Color::Default) add(color_code(style.bg, 40));

    if (codes.empty()) return {};
    return "\033[" + codes + "m";
}

Canvas::Canvas(int width, int height) : width_(width), height_(height) {
    buffer_.resize(static_cast<size_t>(width) * height);
}

Cell& Canvas::at(int x, int y) {
    if (!is_in_bounds(x, y)) {
        static Cell dummy;
        dummy = Cell{};
        return dummy;
    }
    return buffer_[y * width_ + x];
}

const Cell& Canvas::at(int x, int y) const {
    if (!is_in_bounds(x, y)) {
        static const Cell dummy;
        return dummy;
    }
    return buffer_[y * width_ + x];
}

void Canvas::clear(const Cell& fill_cell) {
    std::fill(buffer_.begin(), buffer_.end(), fill_cell);
}

void Canvas::put(int x, int y, const std::string& grapheme, Style style) {
    if (is_in_bounds(x, y)) {
        buffer_[y * width_ + x] = Cell{grapheme, style};
    }
}

void Canvas::resize(int width, int height) {
    if (width_ == width && height_ == height) return;
    width_ = width;
    height_ = height;
    buffer_.clear();
    buffer_.resize(static_cast<size_t>(width) * height);
}

int Canvas::draw_text(int x, int y, std::string_view text, Style style, int limit_x) {
    if (y < 0 || y >= height_) return x;
    if (limit_x < 0 || limit_x > width_) limit_x = width_;

    int current_x = x;
    size_t i = 0;
    while (i < text.size() && current_x < limit_x) {
        size_t len = utf8_char_len(static_cast<unsigned char>(text[i]));
        if (i + len > text.size()) break;  // Incomplete character

        wchar_t wc = 0;
        int char_width = 1;
        if (utf8_to_wchar(text.data() + i, len, &wc) > 0) {
            int w = wcwidth(wc);
            if (w == 0) {
                // Combining mark: attach to the previous cell
                if (current_x > x && is_in_bounds(current_x - 1, y)) {
                    buffer_[y * width_ + current_x - 1].content.append(text.substr(i, len));
                }
                i += len;
                continue;
            }
            if (w > 0) char_width = w;
        }

        // A wide character that does not fit is dropped
        if (current_x + char_width > limit_x) break;

        put(current_x, y, std::string(text.substr(i, len)), style);
        if (char_width == 2) {
            put(current_x + 1, y, "", style);
        }

        current_x += char_width;
        i += len;
    }
    return current_x;
}

void Canvas::draw_rect(const LayoutRect& rect, Style style) {
    if (rect.width < 2 || rect.height < 2) return;
    const int right = rect.x + rect.width - 1;
    const int bottom = rect.y + rect.height - 1;

    put(rect.x, rect.y, "╭", style);
    put(right, rect.y, "╮", style);
    put(rect.x, bottom, "╰", style);
    put(right, bottom, "╯", style);

    hline(rect.x + 1, rect.y, rect.width - 2, "─", style);
    hline(rect.x + 1, bottom, rect.width - 2, "─", style);

    for (int i = rect.y + 1; i < bottom; ++i) {
        put(rect.x, i, "│", style);
        put(right, i, "│", style);
    }
}

void Canvas::fill_rect(const LayoutRect& rect, const Cell& cell) {
    for (int cy = rect.y; cy < rect.y + rect.height; ++cy) {
        for (int cx = rect.x; cx < rect.x + rect.width; ++cx) {
            if (is_in_bounds(cx, cy)) {
                buffer_[cy * width_ + cx] = cell;
            }
        }
    }
}

void Canvas::hline(int x, int y, int width, const std::string& grapheme, Style style) {
    for (int i = 0; i < width; ++i) {
        put(x + i, y, grapheme, style);
    }
}

}  // namespace listui::ui
