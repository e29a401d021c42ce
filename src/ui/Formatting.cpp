#include "ui/Formatting.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <wchar.h>

namespace listui::ui {

namespace {

// Decodes the character at s[i]. Sets `len` to its byte length and returns its column width.
int next_char(const std::string& s, size_t i, size_t& len) {
    unsigned char c = s[i];
    wchar_t wc = c;
    if ((c & 0x80) == 0) {
        len = 1;
    } else if ((c & 0xE0) == 0xC0 && i + 1 < s.size()) {
        len = 2;
        wc = ((c & 0x1F) << 6) | (s[i + 1] & 0x3F);
    } else if ((c & 0xF0) == 0xE0 && i + 2 < s.size()) {
        len = 3;
        wc = ((c & 0x0F) << 12) | ((s[i + 1] & 0x3F) << 6) | (s[i + 2] & 0x3F);
    } else if ((c & 0xF8) == 0xF0 && i + 3 < s.size()) {
        len = 4;
        wc = ((c & 0x07) << 18) | ((s[i + 1] & 0x3F) << 12) | ((s[i + 2] & 0x3F) << 6) | (s[i + 3] & 0x3F);
    } else {
        len = 1;  // Invalid, counts as one column
        return 1;
    }
    if (c < 0x80) return 1;
    int w = wcwidth(wc);
    return w < 0 ? 1 : w;
}

}  // namespace

int display_cols(const std::string& s) {
    int cols = 0;
    for (size_t i = 0; i < s.size();) {
        size_t len = 1;
        cols += next_char(s, i, len);
        i += len;
    }
    return cols;
}

std::string take_cols(const std::string& s, int width) {
    if (width <= 0) return "";

    std::string out;
    out.reserve(s.size());
    int seen = 0;
    for (size_t i = 0; i < s.size();) {
        size_t len = 1;
        int w = next_char(s, i, len);
        if (seen + w > width) break;
        out.append(s, i, len);
        seen += w;
        i += len;
    }
    return out;
}

std::string trunc_pad(const std::string& s, int width) {
    if (width <= 0) return "";

    int cols = display_cols(s);
    if (cols == width) return s;

    if (cols < width) {
        return s + std::string(width - cols, ' ');
    }

    if (width <= 1) {
        return trunc_pad(take_cols(s, width), width);
    }

    // A wide character cut at the edge leaves one column to pad
    return trunc_pad(take_cols(s, width - 1) + "…", width);
}

std::string lr_align(int width, const std::string& left, const std::string& right) {
    if (width <= 0) return "";

    int rvis = display_cols(right);
    if (rvis >= width) return trunc_pad(right, width);

    int left_max = width - rvis - 1;  // At least one space between
    std::string l = left_max > 0 ? trunc_pad(left, left_max) : std::string();
    int space = width - display_cols(l) - rvis;
    return l + std::string(std::max(space, 0), ' ') + right;
}

std::string format_time(std::int64_t ms) {
    std::int64_t total_seconds = std::max<std::int64_t>(ms, 0) / 1000;
    std::int64_t hours = total_seconds / 3600;
    std::int64_t minutes = (total_seconds % 3600) / 60;
    std::int64_t seconds = total_seconds % 60;

    if (hours > 0) {
        return std::format("{}:{:02}:{:02}", hours, minutes, seconds);
    }
    return std::format("{}:{:02}", minutes, seconds);
}

std::string time_label(std::int64_t position_ms, std::int64_t duration_ms) {
    if (duration_ms <= 0) return format_time(position_ms);
    return format_time(std::min(position_ms, duration_ms)) + " / " + format_time(duration_ms);
}

std::string progress_bar(double fraction, int width) {
    static const char* const kEighths[] = {"", "▏", "▎", "▍", "▌", "▋", "▊", "▉"};
    if (width <= 0) return "";
    if (!std::isfinite(fraction)) fraction = 0.0;
    fraction = std::clamp(fraction, 0.0, 1.0);

    int total_eighths = static_cast<int>(std::lround(fraction * width * 8));
    int full = total_eighths / 8;
    int partial = total_eighths % 8;

    std::string bar;
    for (int i = 0; i < full; ++i) bar += "█";
    int used = full;
    if (partial > 0 && used < width) {
        bar += kEighths[partial];
        ++used;
    }
    bar += std::string(width - used, ' ');
    return bar;
}

}  // namespace listui::ui
