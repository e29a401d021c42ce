#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace listui::model {

using PlaylistId = std::int64_t;
using TrackId = std::int64_t;

// Playlists opened straight from a directory are never stored and carry this id.
inline constexpr PlaylistId kEphemeralPlaylist = 0;

enum class SourceKind { Local, Remote };

struct Track {
    TrackId id = 0;
    std::string title;
    std::optional<std::string> remote_id;  // Present iff the track comes from a remote playlist
    PlaylistId playlist_id = 0;
    std::optional<std::filesystem::path> local_path;  // Set once resolved; fixed for local tracks

    bool is_remote() const { return remote_id.has_value(); }
    bool operator==(const Track&) const = default;
};

struct Playlist {
    PlaylistId id = 0;
    std::string title;
    SourceKind source = SourceKind::Local;
    std::optional<std::string> remote_id;
    std::optional<TrackId> last_track_id;
    size_t track_count = 0;
    std::vector<Track> tracks;  // Empty in listings, filled when loaded for playback

    bool is_remote() const { return source == SourceKind::Remote; }
};

// A not-yet-downloaded remote track.
struct TrackDescriptor {
    std::string title;
    std::string remote_id;

    bool operator==(const TrackDescriptor&) const = default;
};

struct RemotePlaylist {
    std::string title;
    std::string remote_id;
    std::vector<TrackDescriptor> tracks;
};

}  // namespace listui::model
