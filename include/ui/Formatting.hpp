#pragma once

#include <cstdint>
#include <string>

namespace listui::ui {

/**
 * Display width of a UTF-8 string in terminal columns.
 * Wide (CJK, emoji) characters count as two columns, combining marks as zero.
 */
int display_cols(const std::string& s);

/**
 * Longest prefix of `s` that fits in `width` columns.
 */
std::string take_cols(const std::string& s, int width);

/**
 * Truncate with an ellipsis if too long, pad with spaces if too short.
 * Result is exactly `width` display columns.
 */
std::string trunc_pad(const std::string& s, int width);

/**
 * Left text and right text separated by spaces to fill `width`.
 * The left side is truncated first.
 */
std::string lr_align(int width, const std::string& left, const std::string& right);

// "m:ss", or "h:mm:ss" from one hour on. Negative values print as 0:00.
std::string format_time(std::int64_t ms);

// "1:02 / 3:45". The duration part is omitted when unknown (<= 0).
std::string time_label(std::int64_t position_ms, std::int64_t duration_ms);

// A bar of `width` cells filled to `fraction` (clamped to 0..1) using eighth blocks.
std::string progress_bar(double fraction, int width);

}  // namespace listui::ui
