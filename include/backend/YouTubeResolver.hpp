#pragma once

#include "backend/HttpClient.hpp"
#include "backend/MetadataResolver.hpp"
#include <string>

namespace listui::backend {

// YouTube Data API v3. Needs an API key.
class YouTubeResolver : public MetadataResolver {
public:
    YouTubeResolver(HttpTransport& http, std::string api_key);

    model::RemotePlaylist resolve_remote_playlist(const std::string& url_or_id,
                                                  const ProgressCallback& on_progress) override;

    struct ItemsPage {
        std::vector<model::TrackDescriptor> tracks;
        std::string next_page_token;
    };

    // Parses a playlistItems response, dropping deleted/private entries.
    static std::optional<ItemsPage> parse_items(const std::string& body);

private:
    model::RemotePlaylist fetch_playlist(const std::string& url_or_id, const ProgressCallback& on_progress);
    std::string get_json(const std::string& url);

    HttpTransport& http_;
    std::string api_key_;
};

}  // namespace listui::backend
