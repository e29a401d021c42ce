#include "backend/InvidiousResolver.hpp"
#include "util/Logger.hpp"
#include <nlohmann/json.hpp>
#include <format>

using nlohmann::json;

namespace listui::backend {

namespace {

// Invidious repeats a page forever past the end on some versions
constexpr int kMaxPages = 200;

}  // namespace

InvidiousResolver::InvidiousResolver(HttpTransport& http, std::vector<std::string> instances)
    : http_(http), instances_(std::move(instances)) {}

std::optional<InvidiousResolver::Page> InvidiousResolver::parse_page(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    if (!j.contains("videos") || !j["videos"].is_array()) return std::nullopt;

    Page page;
    page.title = j.value("title", "");
    page.playlist_id = j.value("playlistId", "");

    for (const auto& v : j["videos"]) {
        if (!v.is_object()) continue;
        Video video;
        video.title = v.value("title", "");
        video.video_id = v.value("videoId", "");
        video.index = v.value("index", 0);
        if (video.video_id.empty()) continue;
        page.videos.push_back(std::move(video));
    }
    return page;
}

model::RemotePlaylist InvidiousResolver::fetch_from(const std::string& instance, const std::string& playlist_id,
                                                    const ProgressCallback& on_progress) {
    model::RemotePlaylist playlist;
    playlist.remote_id = playlist_id;
    int last_index = -1;

    for (int page_no = 1; page_no <= kMaxPages; ++page_no) {
        auto url = std::format("{}/api/v1/playlists/{}?page={}", instance, playlist_id, page_no);
        auto response = http_.get(url);
        if (!response) {
            throw std::runtime_error("unreachable");
        }
        if (response->status == 404) {
            throw std::runtime_error("playlist " + playlist_id + " not found");
        }
        if (response->status != 200) {
            throw std::runtime_error("HTTP " + std::to_string(response->status));
        }

        auto page = parse_page(response->body);
        if (!page) {
            throw std::runtime_error("failed to parse api response");
        }

        if (!page->title.empty()) playlist.title = page->title;
        if (!page->playlist_id.empty()) playlist.remote_id = page->playlist_id;

        if (page->videos.empty()) break;

        // Pages overlap; only indexes past the last one seen are new
        for (auto& video : page->videos) {
            if (video.index <= last_index) continue;
            last_index = video.index;
            if (is_unavailable_title(video.title)) continue;
            playlist.tracks.push_back({std::move(video.title), std::move(video.video_id)});
        }

        if (on_progress) on_progress({instance, playlist.tracks.size()});
    }

    return playlist;
}

model::RemotePlaylist InvidiousResolver::resolve_remote_playlist(const std::string& url_or_id,
                                                                 const ProgressCallback& on_progress) {
    auto playlist_id = extract_playlist_id(url_or_id);
    if (!playlist_id) {
        throw MetadataUnavailable("Not a YouTube playlist: " + url_or_id);
    }

    std::string last_error = "no Invidious instances configured";
    for (const auto& instance : instances_) {
        listui::util::Logger::info("InvidiousResolver: Fetching " + *playlist_id + " from " + instance);
        if (on_progress) on_progress({instance, 0});

        try {
            auto playlist = fetch_from(instance, *playlist_id, on_progress);
            listui::util::Logger::info("InvidiousResolver: Got " + std::to_string(playlist.tracks.size()) +
                                       " videos from " + instance);
            return playlist;
        } catch (const std::runtime_error& e) {
            last_error = instance + ": " + e.what();
            listui::util::Logger::warn("InvidiousResolver: Could not fetch playlist from " + last_error);
        } catch (const json::exception& e) {
            last_error = instance + ": " + e.what();
            listui::util::Logger::warn("InvidiousResolver: Could not fetch playlist from " + last_error);
        }
    }

    throw MetadataUnavailable("Could not fetch playlist " + *playlist_id + " (" + last_error + ")");
}

}  // namespace listui::backend
