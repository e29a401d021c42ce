#pragma once

#include "model/Library.hpp"
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace listui::backend {

// Every backing API instance was unreachable or returned unusable data.
class MetadataUnavailable : public std::runtime_error {
public:
    explicit MetadataUnavailable(const std::string& message) : std::runtime_error(message) {}
};

struct ResolveProgress {
    std::string source;    // Instance or API currently queried
    size_t fetched = 0;    // Descriptors collected so far
};

class MetadataResolver {
public:
    using ProgressCallback = std::function<void(const ResolveProgress&)>;

    virtual ~MetadataResolver() = default;

    // Accepts a playlist URL or a bare playlist id. Throws MetadataUnavailable.
    // `on_progress` is called from the resolving thread after every page.
    virtual model::RemotePlaylist resolve_remote_playlist(const std::string& url_or_id,
                                                          const ProgressCallback& on_progress) = 0;
};

// Extracts the playlist id from a youtube.com / youtu.be URL with a list=PL... parameter,
// or accepts a bare id. Returns nullopt for anything else.
std::optional<std::string> extract_playlist_id(const std::string& url_or_id);

// Titles the remote APIs use for entries that can no longer be played.
bool is_unavailable_title(const std::string& title);

}  // namespace listui::backend
