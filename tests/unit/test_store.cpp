#include "../framework/SimpleTest.hpp"
#include "backend/SqliteTrackStore.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace listui::backend;
using namespace listui::model;

namespace {

RemotePlaylist sample_remote() {
    RemotePlaylist remote;
    remote.title = "Road Trip";
    remote.remote_id = "PLroadtrip0001";
    remote.tracks = {{"Song A", "vidA"}, {"Song B", "vidB"}, {"Song C", "vidC"}};
    return remote;
}

std::filesystem::path temp_db(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() /
                ("listui_" + name + "_" + std::to_string(getpid()) + ".db");
    std::filesystem::remove(path);
    return path;
}

}  // namespace

TEST_CASE(test_save_and_load_playlist) {
    SqliteTrackStore store(":memory:");
    auto saved = store.save_remote_playlist(sample_remote());

    ASSERT_TRUE(saved.id > 0);
    ASSERT_EQ(saved.title, "Road Trip");
    ASSERT_TRUE(saved.is_remote());
    ASSERT_EQ(saved.track_count, 3u);
    ASSERT_EQ(saved.tracks.size(), 3u);
    ASSERT_EQ(saved.tracks[0].title, "Song A");
    ASSERT_TRUE(saved.tracks[2].remote_id == std::string("vidC"));
    ASSERT_FALSE(saved.tracks[0].local_path.has_value());

    auto listed = store.list_playlists();
    ASSERT_EQ(listed.size(), 1u);
    ASSERT_EQ(listed[0].track_count, 3u);
    ASSERT_TRUE(listed[0].tracks.empty());

    auto found = store.find_playlist_by_remote_id("PLroadtrip0001");
    ASSERT_TRUE(found.has_value());
    ASSERT_EQ(found->id, saved.id);
    ASSERT_FALSE(store.find_playlist_by_remote_id("PLnothing").has_value());
    ASSERT_FALSE(store.get_playlist(saved.id + 100).has_value());
}

TEST_CASE(test_set_track_path_persists) {
    SqliteTrackStore store(":memory:");
    auto saved = store.save_remote_playlist(sample_remote());
    auto id = saved.tracks[1].id;

    store.set_track_path(id, std::filesystem::path("/cache/vidB.mp3"));
    auto tracks = store.get_tracks(saved.id);
    ASSERT_TRUE(tracks[1].local_path == std::filesystem::path("/cache/vidB.mp3"));

    store.set_track_path(id, std::nullopt);
    ASSERT_FALSE(store.get_tracks(saved.id)[1].local_path.has_value());
}

TEST_CASE(test_refresh_keeps_surviving_tracks) {
    SqliteTrackStore store(":memory:");
    auto saved = store.save_remote_playlist(sample_remote());
    auto id_a = saved.tracks[0].id;
    auto id_b = saved.tracks[1].id;
    store.set_track_path(id_a, std::filesystem::path("/cache/vidA.mp3"));
    store.set_last_track(saved.id, saved.tracks[2].id);

    auto refreshed = sample_remote();
    refreshed.title = "Road Trip 2";
    refreshed.tracks = {{"Song D", "vidD"}, {"Song A (remaster)", "vidA"}, {"Song B", "vidB"}};
    auto updated = store.save_remote_playlist(refreshed);

    ASSERT_EQ(updated.id, saved.id);
    ASSERT_EQ(updated.title, "Road Trip 2");
    ASSERT_EQ(updated.tracks.size(), 3u);
    ASSERT_EQ(updated.tracks[0].title, "Song D");
    ASSERT_EQ(updated.tracks[1].id, id_a);
    ASSERT_EQ(updated.tracks[1].title, "Song A (remaster)");
    ASSERT_TRUE(updated.tracks[1].local_path == std::filesystem::path("/cache/vidA.mp3"));
    ASSERT_EQ(updated.tracks[2].id, id_b);
    // Last track was C, which is gone
    ASSERT_FALSE(updated.last_track_id.has_value());
    ASSERT_EQ(store.list_playlists().size(), 1u);
}

TEST_CASE(test_set_last_track) {
    SqliteTrackStore store(":memory:");
    auto saved = store.save_remote_playlist(sample_remote());
    store.set_last_track(saved.id, saved.tracks[1].id);
    ASSERT_TRUE(store.get_playlist(saved.id)->last_track_id == saved.tracks[1].id);
    store.set_last_track(saved.id, std::nullopt);
    ASSERT_FALSE(store.get_playlist(saved.id)->last_track_id.has_value());
}

TEST_CASE(test_delete_cascades_to_tracks) {
    SqliteTrackStore store(":memory:");
    auto first = store.save_remote_playlist(sample_remote());
    auto other = sample_remote();
    other.remote_id = "PLother000001";
    auto second = store.save_remote_playlist(other);

    store.delete_playlist(first.id);
    ASSERT_FALSE(store.get_playlist(first.id).has_value());
    ASSERT_TRUE(store.get_tracks(first.id).empty());
    ASSERT_EQ(store.get_tracks(second.id).size(), 3u);
    ASSERT_EQ(store.list_playlists().size(), 1u);
}

TEST_CASE(test_upsert_track) {
    SqliteTrackStore store(":memory:");
    auto saved = store.save_remote_playlist(sample_remote());

    Track extra;
    extra.title = "Bonus";
    extra.remote_id = "vidX";
    extra.playlist_id = saved.id;
    auto inserted = store.upsert_track(extra);
    ASSERT_TRUE(inserted.id > 0);

    auto tracks = store.get_tracks(saved.id);
    ASSERT_EQ(tracks.size(), 4u);
    ASSERT_EQ(tracks.back().title, "Bonus");

    inserted.title = "Bonus Track";
    store.upsert_track(inserted);
    ASSERT_EQ(store.get_tracks(saved.id).back().title, "Bonus Track");
}

TEST_CASE(test_schema_migration_is_idempotent) {
    auto path = temp_db("schema");
    {
        SqliteTrackStore store(path.string());
        ASSERT_EQ(store.schema_version(), 1);
        store.save_remote_playlist(sample_remote());
    }
    {
        SqliteTrackStore store(path.string());
        ASSERT_EQ(store.schema_version(), 1);
        ASSERT_EQ(store.list_playlists().size(), 1u);
    }
    std::filesystem::remove(path);
}

TEST_CASE(test_corrupt_file_is_reported) {
    auto path = temp_db("corrupt");
    {
        std::ofstream out(path);
        for (int i = 0; i < 256; ++i) out << "this is not an sqlite database\n";
    }

    bool thrown = false;
    try {
        SqliteTrackStore store(path.string());
    } catch (const StoreError& e) {
        thrown = true;
        ASSERT_TRUE(e.kind() == StoreError::Kind::Corrupt);
    }
    ASSERT_TRUE(thrown);
    std::filesystem::remove(path);
}

int main(int argc, char** argv) {
    return listui::test::TestRunner::instance().run_main(argc, argv);
}
