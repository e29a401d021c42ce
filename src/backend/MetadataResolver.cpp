#include "backend/MetadataResolver.hpp"
#include <algorithm>
#include <regex>

namespace listui::backend {

std::optional<std::string> extract_playlist_id(const std::string& url_or_id) {
    static const std::regex url_pattern(
        R"(^https?://(?:www\.|m\.|music\.)?(?:youtube\.com|youtu\.be)/.+\?(?:.+&)*list=((?:PL|OL|UU|FL|RD)[A-Za-z0-9_-]+)(?:&.*)?$)");
    static const std::regex id_pattern(R"(^(?:PL|OL|UU|FL|RD)[A-Za-z0-9_-]{10,}$)");

    std::smatch match;
    if (std::regex_match(url_or_id, match, url_pattern)) {
        return match[1].str();
    }
    if (std::regex_match(url_or_id, id_pattern)) {
        return url_or_id;
    }
    return std::nullopt;
}

bool is_unavailable_title(const std::string& title) {
    static const std::string titles[] = {
        "[Deleted video]", "[Private video]", "Deleted video", "Private video",
    };
    return std::find(std::begin(titles), std::end(titles), title) != std::end(titles);
}

}  // namespace listui::backend
