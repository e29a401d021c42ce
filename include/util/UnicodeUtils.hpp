#pragma once

#include <string>

namespace listui::util {

/// Normalize text for Unicode-aware case-insensitive search.
/// Transliterates diacritics to ASCII equivalents (Björk → bjork, José → jose)
/// and lowercases the result.
std::string normalize_for_search(const std::string& text);

/// True when every whitespace-separated word of `query` occurs in `text`,
/// compared after normalize_for_search(). An empty query matches everything.
bool matches_search(const std::string& text, const std::string& query);

/// Case-insensitive comparison using ICU case folding (like strcmp).
int case_insensitive_compare(const std::string& a, const std::string& b);

}  // namespace listui::util
