#pragma once

#include "backend/TrackStore.hpp"
#include <filesystem>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace listui::backend {

class SqliteTrackStore : public TrackStore {
public:
    // Opens (creating if needed) the database and migrates the schema.
    // Pass ":memory:" for a private in-memory store.
    explicit SqliteTrackStore(const std::string& path);
    ~SqliteTrackStore() override;

    SqliteTrackStore(const SqliteTrackStore&) = delete;
    SqliteTrackStore& operator=(const SqliteTrackStore&) = delete;

    std::vector<model::Playlist> list_playlists() override;
    std::optional<model::Playlist> get_playlist(model::PlaylistId id) override;
    std::optional<model::Playlist> find_playlist_by_remote_id(const std::string& remote_id) override;
    std::vector<model::Track> get_tracks(model::PlaylistId playlist_id) override;

    model::Track upsert_track(const model::Track& track) override;
    void set_track_path(model::TrackId id, const std::optional<std::filesystem::path>& path) override;

    model::Playlist save_remote_playlist(const model::RemotePlaylist& remote) override;
    std::vector<model::Track> replace_tracks(model::PlaylistId playlist_id,
                                             const std::vector<model::TrackDescriptor>& tracks) override;

    void set_last_track(model::PlaylistId playlist_id, std::optional<model::TrackId> track_id) override;
    void delete_playlist(model::PlaylistId id) override;

    int schema_version();

private:
    class Statement;
    class Transaction;

    void migrate();
    void exec(const std::string& sql);
    [[noreturn]] void fail(const std::string& what, int rc);

    model::Playlist insert_playlist(const model::RemotePlaylist& remote);

    sqlite3* db_ = nullptr;
};

}  // namespace listui::backend
