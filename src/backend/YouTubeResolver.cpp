#include "backend/YouTubeResolver.hpp"
#include "util/Logger.hpp"
#include <nlohmann/json.hpp>
#include <format>

using nlohmann::json;

namespace listui::backend {

namespace {

constexpr const char* kApiBase = "https://www.googleapis.com/youtube/v3";
constexpr int kMaxPages = 200;

}  // namespace

YouTubeResolver::YouTubeResolver(HttpTransport& http, std::string api_key)
    : http_(http), api_key_(std::move(api_key)) {}

std::string YouTubeResolver::get_json(const std::string& url) {
    auto response = http_.get(url);
    if (!response) {
        throw MetadataUnavailable("YouTube API unreachable");
    }
    if (response->status == 403) {
        throw MetadataUnavailable("YouTube API rejected the key (HTTP 403)");
    }
    if (response->status != 200) {
        throw MetadataUnavailable("YouTube API returned HTTP " + std::to_string(response->status));
    }
    return std::move(response->body);
}

std::optional<YouTubeResolver::ItemsPage> YouTubeResolver::parse_items(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    if (!j.contains("items") || !j["items"].is_array()) return std::nullopt;

    ItemsPage page;
    page.next_page_token = j.value("nextPageToken", "");

    for (const auto& item : j["items"]) {
        if (!item.is_object() || !item.contains("snippet")) continue;
        const auto& snippet = item["snippet"];
        if (!snippet.is_object()) continue;

        std::string title = snippet.value("title", "");
        if (is_unavailable_title(title)) continue;

        if (!snippet.contains("resourceId") || !snippet["resourceId"].is_object()) continue;
        std::string video_id = snippet["resourceId"].value("videoId", "");
        if (video_id.empty()) continue;

        page.tracks.push_back({std::move(title), std::move(video_id)});
    }
    return page;
}

model::RemotePlaylist YouTubeResolver::resolve_remote_playlist(const std::string& url_or_id,
                                                               const ProgressCallback& on_progress) {
    try {
        return fetch_playlist(url_or_id, on_progress);
    } catch (const json::exception& e) {
        throw MetadataUnavailable(std::string("YouTube API returned unexpected data: ") + e.what());
    }
}

model::RemotePlaylist YouTubeResolver::fetch_playlist(const std::string& url_or_id,
                                                      const ProgressCallback& on_progress) {
    auto playlist_id = extract_playlist_id(url_or_id);
    if (!playlist_id) {
        throw MetadataUnavailable("Not a YouTube playlist: " + url_or_id);
    }

    const std::string key = HttpClient::escape(api_key_);
    const std::string id = HttpClient::escape(*playlist_id);
    if (on_progress) on_progress({"YouTube API", 0});

    auto meta = json::parse(get_json(std::format("{}/playlists?part=snippet&key={}&id={}", kApiBase, key, id)),
                            nullptr, false);
    if (meta.is_discarded() || !meta.contains("items") || !meta["items"].is_array()) {
        throw MetadataUnavailable("YouTube API returned malformed playlist metadata");
    }
    if (meta["items"].size() != 1) {
        throw MetadataUnavailable("Playlist " + *playlist_id + " not found");
    }

    model::RemotePlaylist playlist;
    const auto& item = meta["items"][0];
    playlist.remote_id = item.value("id", *playlist_id);
    if (item.contains("snippet") && item["snippet"].is_object()) {
        playlist.title = item["snippet"].value("title", "");
    }

    std::string page_token;
    for (int page_no = 0; page_no < kMaxPages; ++page_no) {
        auto url = std::format("{}/playlistItems?maxResults=50&part=snippet&key={}&playlistId={}", kApiBase, key, id);
        if (!page_token.empty()) url += "&pageToken=" + HttpClient::escape(page_token);

        auto page = parse_items(get_json(url));
        if (!page) {
            throw MetadataUnavailable("YouTube API returned a malformed playlistItems page");
        }
        for (auto& track : page->tracks) playlist.tracks.push_back(std::move(track));
        if (on_progress) on_progress({"YouTube API", playlist.tracks.size()});

        if (page->next_page_token.empty()) break;
        page_token = std::move(page->next_page_token);
    }

    listui::util::Logger::info("YouTubeResolver: Got " + std::to_string(playlist.tracks.size()) +
                               " videos for " + playlist.remote_id);
    return playlist;
}

}  // namespace listui::backend
