#pragma once

#include "backend/HttpClient.hpp"
#include "backend/MetadataResolver.hpp"
#include <string>
#include <vector>

namespace listui::backend {

// Resolves playlists through the public Invidious API, trying each instance in turn.
class InvidiousResolver : public MetadataResolver {
public:
    struct Video {
        std::string title;
        std::string video_id;
        int index = 0;
    };

    struct Page {
        std::string title;
        std::string playlist_id;
        std::vector<Video> videos;
    };

    InvidiousResolver(HttpTransport& http, std::vector<std::string> instances);

    model::RemotePlaylist resolve_remote_playlist(const std::string& url_or_id,
                                                  const ProgressCallback& on_progress) override;

    // Parses one /api/v1/playlists page. Returns nullopt for malformed JSON.
    static std::optional<Page> parse_page(const std::string& body);

private:
    // Throws std::runtime_error describing why this instance failed.
    model::RemotePlaylist fetch_from(const std::string& instance, const std::string& playlist_id,
                                     const ProgressCallback& on_progress);

    HttpTransport& http_;
    std::vector<std::string> instances_;
};

}  // namespace listui::backend
