#include "backend/SqliteTrackStore.hpp"
#include "util/Logger.hpp"
#include <sqlite3.h>
#include <unordered_map>

namespace listui::backend {

namespace {

constexpr int kSchemaVersion = 1;

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS playlist (
    id            INTEGER PRIMARY KEY AUTOINCREMENT,
    title         TEXT    NOT NULL,
    source        INTEGER NOT NULL DEFAULT 1,
    remote_id     TEXT    UNIQUE,
    last_track_id INTEGER
);
CREATE TABLE IF NOT EXISTS track (
    id          INTEGER PRIMARY KEY AUTOINCREMENT,
    title       TEXT    NOT NULL,
    remote_id   TEXT,
    playlist_id INTEGER NOT NULL REFERENCES playlist(id) ON DELETE CASCADE,
    position    INTEGER NOT NULL DEFAULT 0,
    local_path  TEXT
);
CREATE INDEX IF NOT EXISTS track_playlist_position ON track(playlist_id, position);
)SQL";

[[noreturn]] void throw_sqlite(sqlite3* db, const std::string& what, int rc) {
    std::string message = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    listui::util::Logger::error("SqliteTrackStore: " + message);

    switch (rc & 0xff) {
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            throw StoreError(StoreError::Kind::Corrupt, message);
        case SQLITE_CONSTRAINT:
            throw StoreError(StoreError::Kind::Constraint, message);
        default:
            throw StoreError(StoreError::Kind::Io, message);
    }
}

}  // namespace

// Prepared statement with positional binds (1-based, as in SQLite).
class SqliteTrackStore::Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) throw_sqlite(db_, "prepare", rc);
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, std::int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
        return *this;
    }
    Statement& bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
        return *this;
    }
    Statement& bind(int index, const std::optional<std::string>& value) {
        if (value) return bind(index, *value);
        check(sqlite3_bind_null(stmt_, index));
        return *this;
    }
    Statement& bind(int index, const std::optional<std::int64_t>& value) {
        if (value) return bind(index, *value);
        check(sqlite3_bind_null(stmt_, index));
        return *this;
    }

    // True while rows are available.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw_sqlite(db_, "step", rc);
    }

    void run() {
        while (step()) {}
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    std::int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    std::string text(int col) const {
        auto p = sqlite3_column_text(stmt_, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    }
    std::optional<std::string> opt_text(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
        return text(col);
    }
    std::optional<std::int64_t> opt_int64(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
        return int64(col);
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) throw_sqlite(db_, "bind", rc);
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

class SqliteTrackStore::Transaction {
public:
    explicit Transaction(SqliteTrackStore& store) : store_(store) {
        store_.exec("BEGIN IMMEDIATE");
    }
    ~Transaction() {
        if (!committed_) {
            char* err = nullptr;
            if (sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
                listui::util::Logger::error(std::string("SqliteTrackStore: rollback failed: ") +
                                            (err ? err : "unknown"));
            }
            sqlite3_free(err);
        }
    }
    void commit() {
        store_.exec("COMMIT");
        committed_ = true;
    }

private:
    SqliteTrackStore& store_;
    bool committed_ = false;
};

namespace {

model::Track read_track(const auto& stmt) {
    model::Track t;
    t.id = stmt.int64(0);
    t.title = stmt.text(1);
    t.remote_id = stmt.opt_text(2);
    t.playlist_id = stmt.int64(3);
    if (auto path = stmt.opt_text(4)) {
        t.local_path = std::filesystem::path(*path);
    }
    return t;
}

model::Playlist read_playlist(const auto& stmt) {
    model::Playlist p;
    p.id = stmt.int64(0);
    p.title = stmt.text(1);
    p.source = stmt.int64(2) == 0 ? model::SourceKind::Local : model::SourceKind::Remote;
    p.remote_id = stmt.opt_text(3);
    p.last_track_id = stmt.opt_int64(4);
    p.track_count = static_cast<size_t>(stmt.int64(5));
    return p;
}

constexpr const char* kSelectPlaylist =
    "SELECT p.id, p.title, p.source, p.remote_id, p.last_track_id, "
    "(SELECT COUNT(*) FROM track t WHERE t.playlist_id = p.id) FROM playlist p ";

}  // namespace

SqliteTrackStore::SqliteTrackStore(const std::string& path) {
    if (path != ":memory:") {
        std::error_code ec;
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StoreError(StoreError::Kind::Io, "cannot create " + parent.string() + ": " + ec.message());
        }
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = "open " + path + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError(StoreError::Kind::Io, message);
    }
    sqlite3_busy_timeout(db_, 2000);

    listui::util::Logger::info("SqliteTrackStore: Opened " + path);
    migrate();
}

SqliteTrackStore::~SqliteTrackStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteTrackStore::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        fail("exec (" + message + ")", rc);
    }
}

void SqliteTrackStore::fail(const std::string& what, int rc) {
    throw_sqlite(db_, what, rc);
}

int SqliteTrackStore::schema_version() {
    Statement stmt(db_, "PRAGMA user_version");
    return stmt.step() ? static_cast<int>(stmt.int64(0)) : 0;
}

void SqliteTrackStore::migrate() {
    exec("PRAGMA foreign_keys = ON");

    // A damaged file fails here rather than in the middle of a session
    {
        Statement check(db_, "PRAGMA quick_check");
        if (check.step() && check.text(0) != "ok") {
            throw StoreError(StoreError::Kind::Corrupt, "database integrity check failed: " + check.text(0));
        }
    }

    int version = schema_version();
    if (version > kSchemaVersion) {
        throw StoreError(StoreError::Kind::Corrupt,
                         "database schema version " + std::to_string(version) + " is newer than supported");
    }
    if (version < kSchemaVersion) {
        listui::util::Logger::info("SqliteTrackStore: Migrating schema " + std::to_string(version) +
                                   " -> " + std::to_string(kSchemaVersion));
        Transaction tx(*this);
        exec(kSchema);
        exec("PRAGMA user_version = " + std::to_string(kSchemaVersion));
        tx.commit();
    }
}

std::vector<model::Playlist> SqliteTrackStore::list_playlists() {
    std::vector<model::Playlist> out;
    Statement stmt(db_, (std::string(kSelectPlaylist) + "ORDER BY p.id").c_str());
    while (stmt.step()) {
        out.push_back(read_playlist(stmt));
    }
    return out;
}

std::optional<model::Playlist> SqliteTrackStore::get_playlist(model::PlaylistId id) {
    std::optional<model::Playlist> playlist;
    {
        Statement stmt(db_, (std::string(kSelectPlaylist) + "WHERE p.id = ?1").c_str());
        stmt.bind(1, static_cast<std::int64_t>(id));
        if (stmt.step()) playlist = read_playlist(stmt);
    }
    if (playlist) {
        playlist->tracks = get_tracks(id);
    }
    return playlist;
}

std::optional<model::Playlist> SqliteTrackStore::find_playlist_by_remote_id(const std::string& remote_id) {
    std::optional<model::PlaylistId> id;
    {
        Statement stmt(db_, "SELECT id FROM playlist WHERE remote_id = ?1");
        stmt.bind(1, remote_id);
        if (stmt.step()) id = stmt.int64(0);
    }
    if (!id) return std::nullopt;
    return get_playlist(*id);
}

std::vector<model::Track> SqliteTrackStore::get_tracks(model::PlaylistId playlist_id) {
    std::vector<model::Track> out;
    Statement stmt(db_,
        "SELECT id, title, remote_id, playlist_id, local_path FROM track "
        "WHERE playlist_id = ?1 ORDER BY position, id");
    stmt.bind(1, static_cast<std::int64_t>(playlist_id));
    while (stmt.step()) {
        out.push_back(read_track(stmt));
    }
    return out;
}

model::Track SqliteTrackStore::upsert_track(const model::Track& track) {
    std::optional<std::string> path;
    if (track.local_path) path = track.local_path->string();

    model::Track stored = track;
    if (track.id == 0) {
        Statement stmt(db_,
            "INSERT INTO track (title, remote_id, playlist_id, position, local_path) "
            "VALUES (?1, ?2, ?3, (SELECT COALESCE(MAX(position), -1) + 1 FROM track WHERE playlist_id = ?3), ?4)");
        stmt.bind(1, track.title).bind(2, track.remote_id)
            .bind(3, static_cast<std::int64_t>(track.playlist_id)).bind(4, path);
        stmt.run();
        stored.id = sqlite3_last_insert_rowid(db_);
    } else {
        Statement stmt(db_, "UPDATE track SET title = ?1, remote_id = ?2, local_path = ?3 WHERE id = ?4");
        stmt.bind(1, track.title).bind(2, track.remote_id).bind(3, path)
            .bind(4, static_cast<std::int64_t>(track.id));
        stmt.run();
    }
    return stored;
}

void SqliteTrackStore::set_track_path(model::TrackId id, const std::optional<std::filesystem::path>& path) {
    std::optional<std::string> value;
    if (path) value = path->string();

    Statement stmt(db_, "UPDATE track SET local_path = ?1 WHERE id = ?2");
    stmt.bind(1, value).bind(2, static_cast<std::int64_t>(id));
    stmt.run();
}

model::Playlist SqliteTrackStore::insert_playlist(const model::RemotePlaylist& remote) {
    Transaction tx(*this);

    Statement insert(db_, "INSERT INTO playlist (title, source, remote_id) VALUES (?1, 1, ?2)");
    insert.bind(1, remote.title).bind(2, remote.remote_id);
    insert.run();
    model::PlaylistId id = sqlite3_last_insert_rowid(db_);

    Statement add(db_,
        "INSERT INTO track (title, remote_id, playlist_id, position) VALUES (?1, ?2, ?3, ?4)");
    for (size_t i = 0; i < remote.tracks.size(); ++i) {
        add.reset();
        add.bind(1, remote.tracks[i].title).bind(2, remote.tracks[i].remote_id)
           .bind(3, static_cast<std::int64_t>(id)).bind(4, static_cast<std::int64_t>(i));
        add.run();
    }

    tx.commit();
    listui::util::Logger::info("SqliteTrackStore: Saved playlist '" + remote.title + "' with " +
                               std::to_string(remote.tracks.size()) + " tracks");
    return *get_playlist(id);
}

model::Playlist SqliteTrackStore::save_remote_playlist(const model::RemotePlaylist& remote) {
    auto existing = find_playlist_by_remote_id(remote.remote_id);
    if (!existing) {
        return insert_playlist(remote);
    }

    {
        Statement stmt(db_, "UPDATE playlist SET title = ?1 WHERE id = ?2");
        stmt.bind(1, remote.title).bind(2, static_cast<std::int64_t>(existing->id));
        stmt.run();
    }
    replace_tracks(existing->id, remote.tracks);
    return *get_playlist(existing->id);
}

std::vector<model::Track> SqliteTrackStore::replace_tracks(model::PlaylistId playlist_id,
                                                           const std::vector<model::TrackDescriptor>& tracks) {
    // remote id -> existing rows, in stored order; a repeated video keeps its repeats
    std::unordered_map<std::string, std::vector<model::TrackId>> existing;
    std::vector<model::TrackId> all_ids;
    for (const auto& t : get_tracks(playlist_id)) {
        all_ids.push_back(t.id);
        if (t.remote_id) existing[*t.remote_id].push_back(t.id);
    }

    Transaction tx(*this);

    std::unordered_map<model::TrackId, bool> kept;
    Statement update(db_, "UPDATE track SET title = ?1, position = ?2 WHERE id = ?3");
    Statement insert(db_,
        "INSERT INTO track (title, remote_id, playlist_id, position) VALUES (?1, ?2, ?3, ?4)");

    for (size_t i = 0; i < tracks.size(); ++i) {
        const auto& desc = tracks[i];
        auto it = existing.find(desc.remote_id);
        if (it != existing.end() && !it->second.empty()) {
            model::TrackId id = it->second.front();
            it->second.erase(it->second.begin());
            kept[id] = true;
            update.reset();
            update.bind(1, desc.title).bind(2, static_cast<std::int64_t>(i)).bind(3, static_cast<std::int64_t>(id));
            update.run();
        } else {
            insert.reset();
            insert.bind(1, desc.title).bind(2, desc.remote_id)
                  .bind(3, static_cast<std::int64_t>(playlist_id)).bind(4, static_cast<std::int64_t>(i));
            insert.run();
        }
    }

    Statement remove(db_, "DELETE FROM track WHERE id = ?1");
    size_t removed = 0;
    for (auto id : all_ids) {
        if (kept.count(id)) continue;
        remove.reset();
        remove.bind(1, static_cast<std::int64_t>(id));
        remove.run();
        ++removed;
    }

    {
        Statement clear_last(db_,
            "UPDATE playlist SET last_track_id = NULL WHERE id = ?1 AND last_track_id NOT IN "
            "(SELECT id FROM track WHERE playlist_id = ?1)");
        clear_last.bind(1, static_cast<std::int64_t>(playlist_id));
        clear_last.run();
    }

    tx.commit();
    listui::util::Logger::info("SqliteTrackStore: Playlist " + std::to_string(playlist_id) + " refreshed, " +
                               std::to_string(tracks.size()) + " tracks, " + std::to_string(removed) + " removed");
    return get_tracks(playlist_id);
}

void SqliteTrackStore::set_last_track(model::PlaylistId playlist_id, std::optional<model::TrackId> track_id) {
    std::optional<std::int64_t> value;
    if (track_id) value = *track_id;

    Statement stmt(db_, "UPDATE playlist SET last_track_id = ?1 WHERE id = ?2");
    stmt.bind(1, value).bind(2, static_cast<std::int64_t>(playlist_id));
    stmt.run();
}

void SqliteTrackStore::delete_playlist(model::PlaylistId id) {
    Statement stmt(db_, "DELETE FROM playlist WHERE id = ?1");
    stmt.bind(1, static_cast<std::int64_t>(id));
    stmt.run();
    listui::util::Logger::info("SqliteTrackStore: Deleted playlist " + std::to_string(id));
}

}  // namespace listui::backend
