#pragma once

#include "model/Library.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace listui::backend {

// Unrecoverable storage failure. The application exits with a diagnostic.
class StoreError : public std::runtime_error {
public:
    enum class Kind { Corrupt, Io, Constraint };

    StoreError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// Persistent catalog of playlists and tracks. Foreground thread only.
class TrackStore {
public:
    virtual ~TrackStore() = default;

    // Playlists without their tracks (track_count is filled in).
    virtual std::vector<model::Playlist> list_playlists() = 0;
    // Playlist with its tracks, or nullopt.
    virtual std::optional<model::Playlist> get_playlist(model::PlaylistId id) = 0;
    virtual std::optional<model::Playlist> find_playlist_by_remote_id(const std::string& remote_id) = 0;
    virtual std::vector<model::Track> get_tracks(model::PlaylistId playlist_id) = 0;

    // Inserts when track.id == 0, updates otherwise. Returns the stored row.
    virtual model::Track upsert_track(const model::Track& track) = 0;
    virtual void set_track_path(model::TrackId id, const std::optional<std::filesystem::path>& path) = 0;

    // Inserts the playlist or refreshes it when its remote id is already stored.
    virtual model::Playlist save_remote_playlist(const model::RemotePlaylist& remote) = 0;
    // Replaces the track list. Tracks whose remote id survives keep their id and cached path.
    virtual std::vector<model::Track> replace_tracks(model::PlaylistId playlist_id,
                                                     const std::vector<model::TrackDescriptor>& tracks) = 0;

    virtual void set_last_track(model::PlaylistId playlist_id, std::optional<model::TrackId> track_id) = 0;
    // Removes the playlist and all of its tracks.
    virtual void delete_playlist(model::PlaylistId id) = 0;
};

}  // namespace listui::backend
