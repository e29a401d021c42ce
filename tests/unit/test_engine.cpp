#include "../framework/SimpleTest.hpp"
#include "backend/SqliteTrackStore.hpp"
#include "core/PlaybackEngine.hpp"
#include "core/ShuffleSequencer.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <unistd.h>
#include <vector>

using namespace listui;
using model::SlotState;
using model::PlaybackState;
using core::CommandResult;

namespace {

class FakeSink : public audio::AudioSink {
public:
    void set_listener(Listener listener) override { listener_ = std::move(listener); }
    void load(const std::filesystem::path& path, std::uint64_t ticket) override { loads.push_back({path, ticket}); }
    void pause() override { ++pauses; }
    void resume() override { ++resumes; }
    void stop() override { ++stops; }
    void seek(std::int64_t position_ms) override { seeks.push_back(position_ms); }
    void set_volume(int percent) override { volume = percent; }

    void emit(audio::SinkEvent::Type type, std::int64_t position_ms = 0, std::int64_t duration_ms = 0,
              const std::string& message = "") {
        audio::SinkEvent event;
        event.type = type;
        event.ticket = loads.empty() ? 0 : loads.back().second;
        event.position_ms = position_ms;
        event.duration_ms = duration_ms;
        event.message = message;
        if (listener_) listener_(event);
    }

    std::vector<std::pair<std::filesystem::path, std::uint64_t>> loads;
    std::vector<std::int64_t> seeks;
    int pauses = 0;
    int resumes = 0;
    int stops = 0;
    int volume = -1;

private:
    Listener listener_;
};

// Records requests; the test decides when and how each one settles.
class FakeFetcher : public fetch::Fetcher {
public:
    struct Call {
        model::TrackDescriptor track;
        model::FetchToken token;
        ProgressCallback on_progress;
        CompletionCallback on_complete;
        std::shared_ptr<fetch::FetchControl> control;
    };

    fetch::FetchHandle fetch(const model::TrackDescriptor& track, model::FetchToken token,
                             ProgressCallback on_progress, CompletionCallback on_complete) override {
        auto control = std::make_shared<fetch::FetchControl>();
        calls.push_back({track, token, std::move(on_progress), std::move(on_complete), control});
        return fetch::FetchHandle(control);
    }

    void progress(size_t i, double fraction) { calls.at(i).on_progress(fraction); }

    void resolve(size_t i, const std::filesystem::path& path) {
        settle(i, {fetch::FetchOutcome::Resolved, path, "", calls.at(i).token});
    }

    void fail(size_t i, const std::string& reason) {
        settle(i, {fetch::FetchOutcome::Failed, {}, reason, calls.at(i).token});
    }

    void settle_cancelled(size_t i) {
        settle(i, {fetch::FetchOutcome::Cancelled, {}, "download cancelled", calls.at(i).token});
    }

    std::vector<Call> calls;

private:
    void settle(size_t i, const fetch::FetchResult& result) {
        auto& call = calls.at(i);
        call.control->complete(result);
        call.on_complete(result);
    }
};

std::filesystem::path scratch_dir() {
    static const auto dir = [] {
        auto d = std::filesystem::temp_directory_path() / ("listui_engine_" + std::to_string(getpid()));
        std::filesystem::create_directories(d);
        return d;
    }();
    return dir;
}

// A cached download on disk.
std::filesystem::path cached_file(const std::string& name) {
    auto path = scratch_dir() / (name + ".mp3");
    std::ofstream(path) << "ID3";
    return path;
}

model::RemotePlaylist remote(const std::string& remote_id, const std::vector<std::string>& videos) {
    model::RemotePlaylist pl;
    pl.title = "List " + remote_id;
    pl.remote_id = remote_id;
    for (const auto& v : videos) pl.tracks.push_back({"Title " + v, v});
    return pl;
}

model::Playlist local(size_t n) {
    model::Playlist pl;
    pl.id = model::kEphemeralPlaylist;
    pl.title = "Music";
    for (size_t i = 0; i < n; ++i) {
        model::Track t;
        t.id = static_cast<model::TrackId>(i + 1);
        t.title = "Track " + std::to_string(i + 1);
        t.local_path = std::filesystem::path("/music/" + std::to_string(i + 1) + ".flac");
        pl.tracks.push_back(t);
    }
    pl.track_count = n;
    return pl;
}

struct Rig {
    explicit Rig(core::EngineOptions options = {}, bool with_fetcher = true)
        : store(":memory:"),
          engine(store, with_fetcher ? &fetcher : nullptr, sink, bus, std::move(options)) {
        using Type = events::Event::Type;
        for (auto type : {Type::SessionOpened, Type::SessionClosed, Type::OrderChanged, Type::TransportChanged,
                          Type::Progress, Type::TrackReady, Type::TrackFailed, Type::DownloadSettled,
                          Type::PositionChanged, Type::VolumeChanged, Type::ModeChanged, Type::RemoteUnavailable}) {
            bus.subscribe(type, [this](const events::Event& e) { events.push_back(e); });
        }
    }

    size_t count(events::Event::Type type) const {
        return static_cast<size_t>(std::count_if(events.begin(), events.end(),
                                                 [type](const events::Event& e) { return e.type == type; }));
    }

    backend::SqliteTrackStore store;
    FakeFetcher fetcher;
    FakeSink sink;
    events::EventBus bus;
    std::vector<events::Event> events;
    core::PlaybackEngine engine;
};

}  // namespace

TEST_CASE(test_skip_during_download_keeps_late_file) {
    Rig rig;
    auto pl = rig.store.save_remote_playlist(remote("PLskip", {"vidA", "vidB", "vidC"}));
    auto a = pl.tracks[0].id;
    auto b = pl.tracks[1].id;

    ASSERT_TRUE(rig.engine.open(pl.id) == CommandResult::Ok);
    ASSERT_TRUE(rig.engine.play() == CommandResult::Ok);
    ASSERT_EQ(rig.fetcher.calls.size(), 1u);
    ASSERT_EQ(rig.fetcher.calls[0].track.remote_id, "vidA");
    ASSERT_TRUE(rig.engine.slot_state(a) == SlotState::Fetching);

    ASSERT_TRUE(rig.engine.skip_next() == CommandResult::Ok);
    ASSERT_EQ(rig.fetcher.calls.size(), 2u);
    ASSERT_EQ(rig.fetcher.calls[1].track.remote_id, "vidB");
    ASSERT_TRUE(rig.engine.slot_state(a) == SlotState::Unresolved);
    ASSERT_TRUE(rig.engine.download(a)->state == model::DownloadState::Cancelled);
    // Skipping never kills the process
    ASSERT_FALSE(rig.fetcher.calls[0].control->cancel_requested());

    auto file_a = cached_file("vidA");
    rig.fetcher.resolve(0, file_a);
    rig.engine.pump();

    ASSERT_TRUE(rig.sink.loads.empty());
    ASSERT_TRUE(rig.engine.current_track_id() == b);
    ASSERT_TRUE(rig.store.get_tracks(pl.id)[0].local_path == file_a);
    ASSERT_TRUE(rig.engine.slot_state(a) == SlotState::Resolved);
    ASSERT_FALSE(rig.engine.download(a).has_value());

    auto file_b = cached_file("vidB");
    rig.fetcher.resolve(1, file_b);
    rig.engine.pump();

    ASSERT_EQ(rig.sink.loads.size(), 1u);
    ASSERT_TRUE(rig.sink.loads[0].first == file_b);
    ASSERT_TRUE(rig.engine.state() == PlaybackState::Playing);
    ASSERT_TRUE(rig.store.get_playlist(pl.id)->last_track_id == b);

    // Back to A: the late file is played without a new download
    ASSERT_TRUE(rig.engine.skip_prev() == CommandResult::Ok);
    ASSERT_EQ(rig.fetcher.calls.size(), 2u);
    ASSERT_EQ(rig.sink.loads.size(), 2u);
    ASSERT_TRUE(rig.sink.loads[1].first == file_a);
}

TEST_CASE(test_double_skip_in_shuffled_order) {
    core::EngineOptions options;
    options.shuffle = true;
    options.seed_source = [] { return std::uint64_t{42}; };
    Rig rig(options);
    auto pl = rig.store.save_remote_playlist(remote("PLabc", {"vidA", "vidB", "vidC"}));

    rig.engine.open(pl.id);
    std::vector<model::TrackId> ids;
    for (const auto& t : pl.tracks) ids.push_back(t.id);
    const auto order = core::ShuffleSequencer::generate(ids, 42).track_ids;
    ASSERT_TRUE(rig.engine.order().track_ids == order);

    rig.engine.play();
    rig.engine.skip_next();
    ASSERT_TRUE(rig.engine.current_track_id() == order[1]);
    ASSERT_EQ(rig.fetcher.calls.size(), 2u);

    // Skip again while the second track is still downloading
    rig.engine.skip_next();
    ASSERT_TRUE(rig.engine.current_track_id() == order[2]);
    ASSERT_TRUE(rig.engine.download(order[1])->state == model::DownloadState::Cancelled);
    ASSERT_EQ(rig.fetcher.calls.size(), 3u);

    auto late = cached_file(rig.fetcher.calls[1].track.remote_id);
    rig.fetcher.resolve(1, late);
    rig.engine.pump();

    ASSERT_TRUE(rig.sink.loads.empty());
    ASSERT_TRUE(rig.engine.current_track_id() == order[2]);
    bool persisted = false;
    for (const auto& t : rig.store.get_tracks(pl.id)) {
        if (t.id == order[1]) persisted = t.local_path == late;
    }
    ASSERT_TRUE(persisted);

    auto current = cached_file(rig.fetcher.calls[2].track.remote_id);
    rig.fetcher.resolve(2, current);
    rig.engine.pump();
    ASSERT_EQ(rig.sink.loads.size(), 1u);
    ASSERT_TRUE(rig.sink.loads[0].first == current);
}

TEST_CASE(test_play_on_failed_track_fetches_again) {
    core::EngineOptions options;
    options.advance_on_failure = false;
    Rig rig(options);
    auto pl = rig.store.save_remote_playlist(remote("PLretry", {"vidA"}));
    auto a = pl.tracks[0].id;

    rig.engine.open(pl.id);
    rig.engine.play();
    rig.fetcher.fail(0, "timed out");
    rig.engine.pump();
    ASSERT_TRUE(rig.engine.slot_state(a) == SlotState::Failed);

    rig.engine.play();
    ASSERT_EQ(rig.fetcher.calls.size(), 2u);
    ASSERT_TRUE(rig.engine.slot_state(a) == SlotState::Fetching);

    rig.fetcher.resolve(1, cached_file("retryA"));
    rig.engine.pump();
    ASSERT_EQ(rig.sink.loads.size(), 1u);
    ASSERT_TRUE(rig.engine.failure_reason(a).empty());
}

TEST_CASE(test_reopen_after_teardown_waits_for_killed_process) {
    Rig rig;
    auto pl = rig.store.save_remote_playlist(remote("PLreopen", {"vidA"}));

    rig.engine.open(pl.id);
    rig.engine.play();
    rig.engine.close();
    ASSERT_TRUE(rig.fetcher.calls[0].control->cancel_requested());

    // Reopened before the killed process exited: no second writer for the same file
    rig.engine.open(pl.id);
    rig.engine.play();
    ASSERT_EQ(rig.fetcher.calls.size(), 1u);

    rig.fetcher.settle_cancelled(0);
    rig.engine.pump();
    ASSERT_EQ(rig.fetcher.calls.size(), 2u);

    rig.fetcher.resolve(1, cached_file("reopenA"));
    rig.engine.pump();
    ASSERT_EQ(rig.sink.loads.size(), 1u);
}

TEST_CASE(test_skip_while_waiting_for_killed_process_clears_fetching) {
    Rig rig;
    auto pl = rig.store.save_remote_playlist(remote("PLwait", {"vidA", "vidB"}));
    auto a = pl.tracks[0].id;

    rig.engine.open(pl.id);
    rig.engine.play();
    rig.engine.close();
    rig.engine.open(pl.id);
    rig.engine.play();
    ASSERT_TRUE(rig.engine.slot_state(a) == SlotState::Fetching);

    rig.engine.skip_next();
    ASSERT_TRUE(rig.engine.slot_state(a) == SlotState::Unresolved);
    ASSERT_EQ(rig.fetcher.calls.size(), 2u);
    ASSERT_EQ(rig.fetcher.calls[1].track.remote_id, "vidB");

    rig.fetcher.settle_cancelled(0);
    rig.engine.pump();
    ASSERT_TRUE(rig.engine.slot_state(a) == SlotState::Unresolved);
    ASSERT_FALSE(rig.engine.download(a).has_value());
    // The old process settling does not start a download nobody asked for
    ASSERT_EQ(rig.fetcher.calls.size(), 2u);
}

TEST_CASE(test_same_video_twice_in_playlist) {
    Rig rig;
    auto pl = rig.store.save_remote_playlist(remote("PLdup", {"vidX", "vidX"}));
    ASSERT_EQ(pl.tracks.size(), 2u);
    auto first = pl.tracks[0].id;
    auto second = pl.tracks[1].id;
    ASSERT_NE(first, second);

    rig.engine.open(pl.id);
    rig.engine.play();
    rig.engine.skip_next();
    ASSERT_EQ(rig.fetcher.calls.size(), 2u);
    ASSERT_EQ(rig.fetcher.calls[0].track.remote_id, "vidX");
    ASSERT_EQ(rig.fetcher.calls[1].track.remote_id, "vidX");
    ASSERT_TRUE(rig.engine.download(first).has_value());
    ASSERT_TRUE(rig.engine.download(second).has_value());

    auto file = cached_file("vidX");
    rig.fetcher.resolve(0, file);
    rig.fetcher.resolve(1, file);
    rig.engine.pump();

    ASSERT_EQ(rig.sink.loads.size(), 1u);
    ASSERT_TRUE(rig.sink.loads[0].first == file);
    ASSERT_TRUE(rig.engine.current_track_id() == second);
    ASSERT_TRUE(rig.engine.slot_state(first) == SlotState::Resolved);
    ASSERT_TRUE(rig.engine.slot_state(second) == SlotState::Resolved);
    for (const auto& t : rig.store.get_tracks(pl.id)) {
        ASSERT_TRUE(t.local_path == file);
    }
}

TEST_CASE(test_returning_to_track_attaches_to_running_download) {
    Rig rig;
    auto pl = rig.store.save_remote_playlist(remote("PLback", {"vidA", "vidB"}));
    auto a = pl.tracks[0].id;

    rig.engine.open(pl.id);
    rig.engine.play();
    rig.fetcher.progress(0, 0.4);
    rig.engine.pump();
    ASSERT_NEAR(rig.engine.download(a)->progress, 0.4, 1e-9);

    rig.engine.skip_next();
    rig.engine.skip_prev();
    ASSERT_EQ(rig.fetcher.calls.size(), 2u);
    ASSERT_TRUE(rig.engine.slot_state(a) == SlotState::Fetching);
    ASSERT_TRUE(rig.engine.download(a)->state == model::DownloadState::InProgress);

    // Progress below what was already reported does not move the gauge back
    rig.fetcher.progress(0, 0.2);
    rig.engine.pump();
    ASSERT_NEAR(rig.engine.download(a)->progress, 0.4, 1e-9);

    auto file_a = cached_file("vidA");
    rig.fetcher.resolve(0, file_a);
    rig.engine.pump();
    ASSERT_EQ(rig.sink.loads.size(), 1u);
    ASSERT_TRUE(rig.sink.loads[0].first == file_a);
}

TEST_CASE(test_open_other_playlist_while_download_completes) {
    Rig rig;
    auto q = rig.store.save_remote_playlist(remote("PLqueue", {"q1"}));
    auto p = rig.store.save_remote_playlist(remote("PLother", {"p1", "p2"}));

    rig.engine.open(q.id);
    rig.engine.play();
    ASSERT_EQ(rig.fetcher.calls.size(), 1u);

    rig.engine.open(p.id);
    ASSERT_TRUE(rig.fetcher.calls[0].control->cancel_requested());
    ASSERT_TRUE(rig.engine.playlist_id() == p.id);

    // The process finished before it saw the kill; its file is still cached
    auto file_q = cached_file("q1");
    rig.fetcher.resolve(0, file_q);
    rig.engine.pump();

    ASSERT_TRUE(rig.sink.loads.empty());
    ASSERT_TRUE(rig.store.get_tracks(q.id)[0].local_path == file_q);
    ASSERT_TRUE(rig.engine.playlist_id() == p.id);
    ASSERT_TRUE(rig.engine.state() == PlaybackState::Stopped);
    ASSERT_EQ(rig.engine.active_downloads(), 0u);
}

TEST_CASE(test_resolved_track_never_fetched) {
    Rig rig;
    auto pl = rig.store.save_remote_playlist(remote("PLcached", {"vidA", "vidB"}));
    auto file_a = cached_file("cachedA");
    rig.store.set_track_path(pl.tracks[0].id, file_a);

    rig.engine.open(pl.id);
    rig.engine.ensure_current_resolved();
    rig.engine.ensure_current_resolved();
    ASSERT_TRUE(rig.fetcher.calls.empty());
    ASSERT_TRUE(rig.engine.slot_state(pl.tracks[0].id) == SlotState::Resolved);

    rig.engine.play();
    ASSERT_TRUE(rig.fetcher.calls.empty());
    ASSERT_EQ(rig.sink.loads.size(), 1u);
    ASSERT_TRUE(rig.sink.loads[0].first == file_a);
}

TEST_CASE(test_ensure_twice_dispatches_once) {
    Rig rig;
    auto pl = rig.store.save_remote_playlist(remote("PLonce", {"vidA"}));
    rig.engine.open(pl.id);
    rig.engine.ensure_current_resolved();
    rig.engine.ensure_current_resolved();
    ASSERT_EQ(rig.fetcher.calls.size(), 1u);
    ASSERT_EQ(rig.engine.active_downloads(), 1u);
}

TEST_CASE(test_vanished_cache_file_is_downloaded_again) {
    Rig rig;
    auto pl = rig.store.save_remote_playlist(remote("PLgone", {"vidA"}));
    rig.store.set_track_path(pl.tracks[0].id, scratch_dir() / "does-not-exist.mp3");

    rig.engine.open(pl.id);
    rig.engine.play();
    ASSERT_EQ(rig.fetcher.calls.size(), 1u);
    ASSERT_FALSE(rig.store.get_tracks(pl.id)[0].local_path.has_value());
}

TEST_CASE(test_download_failure_advances) {
    Rig rig;
    auto pl = rig.store.save_remote_playlist(remote("PLfail", {"vidA", "vidB", "vidC"}));
    auto a = pl.tracks[0].id;

    rig.engine.open(pl.id);
    rig.engine.play();
    rig.fetcher.fail(0, "HTTP Error 403: Forbidden");
    rig.engine.pump();

    ASSERT_TRUE(rig.engine.slot_state(a) == SlotState::Failed);
    ASSERT_EQ(rig.engine.failure_reason(a), "HTTP Error 403: Forbidden");
    ASSERT_EQ(rig.count(events::Event::Type::TrackFailed), 1u);
    ASSERT_EQ(rig.engine.cursor(), 1u);
    ASSERT_EQ(rig.fetcher.calls.size(), 2u);
    ASSERT_EQ(rig.fetcher.calls[1].track.remote_id, "vidB");
}

TEST_CASE(test_every_track_failing_stops) {
    Rig rig;
    auto pl = rig.store.save_remote_playlist(remote("PLallbad", {"vidA", "vidB"}));

    rig.engine.open(pl.id);
    rig.engine.play();
    rig.fetcher.fail(0, "gone");
    rig.engine.pump();
    rig.fetcher.fail(1, "gone too");
    rig.engine.pump();

    ASSERT_EQ(rig.fetcher.calls.size(), 2u);
    ASSERT_TRUE(rig.engine.state() == PlaybackState::Stopped);
    ASSERT_EQ(rig.count(events::Event::Type::TrackFailed), 2u);
}

TEST_CASE(test_failure_without_advance_stops) {
    core::EngineOptions options;
    options.advance_on_failure = false;
    Rig rig(options);
    auto pl = rig.store.save_remote_playlist(remote("PLstay", {"vidA", "vidB"}));

    rig.engine.open(pl.id);
    rig.engine.play();
    rig.fetcher.fail(0, "nope");
    rig.engine.pump();

    ASSERT_EQ(rig.engine.cursor(), 0u);
    ASSERT_EQ(rig.fetcher.calls.size(), 1u);
    ASSERT_TRUE(rig.engine.state() == PlaybackState::Stopped);
}

TEST_CASE(test_no_fetcher_reports_once) {
    core::EngineOptions options;
    options.remote_unavailable_reason = "Please install yt-dlp to play YouTube playlists.";
    Rig rig(options, false);
    auto pl = rig.store.save_remote_playlist(remote("PLnofetch", {"vidA", "vidB", "vidC"}));

    rig.engine.open(pl.id);
    rig.engine.play();
    rig.engine.pump();

    ASSERT_EQ(rig.count(events::Event::Type::RemoteUnavailable), 1u);
    ASSERT_EQ(rig.count(events::Event::Type::TrackFailed), 3u);
    ASSERT_EQ(rig.engine.failure_reason(pl.tracks[1].id), "Please install yt-dlp to play YouTube playlists.");
    ASSERT_TRUE(rig.engine.state() == PlaybackState::Stopped);
}

TEST_CASE(test_pause_while_downloading_keeps_download) {
    Rig rig;
    auto pl = rig.store.save_remote_playlist(remote("PLpause", {"vidA"}));

    rig.engine.open(pl.id);
    rig.engine.play();
    ASSERT_TRUE(rig.engine.toggle_pause() == CommandResult::Ok);

    auto file_a = cached_file("pausedA");
    rig.fetcher.resolve(0, file_a);
    rig.engine.pump();
    ASSERT_TRUE(rig.sink.loads.empty());
    ASSERT_EQ(rig.count(events::Event::Type::TrackReady), 1u);

    rig.engine.play();
    ASSERT_EQ(rig.sink.loads.size(), 1u);
    ASSERT_TRUE(rig.engine.state() == PlaybackState::Playing);

    rig.engine.toggle_pause();
    ASSERT_TRUE(rig.engine.state() == PlaybackState::Paused);
    ASSERT_EQ(rig.sink.pauses, 1);
    rig.engine.toggle_pause();
    ASSERT_TRUE(rig.engine.state() == PlaybackState::Playing);
    ASSERT_EQ(rig.sink.resumes, 1);
}

TEST_CASE(test_track_end_advances_and_repeats) {
    Rig rig;
    rig.engine.open(local(3));
    rig.engine.play();
    ASSERT_EQ(rig.sink.loads.size(), 1u);

    rig.sink.emit(audio::SinkEvent::Type::Finished);
    rig.engine.pump();
    ASSERT_EQ(rig.engine.cursor(), 1u);
    ASSERT_EQ(rig.sink.loads.size(), 2u);

    rig.engine.set_repeat(model::RepeatMode::One);
    rig.sink.emit(audio::SinkEvent::Type::Finished);
    rig.engine.pump();
    ASSERT_EQ(rig.engine.cursor(), 1u);
    ASSERT_EQ(rig.sink.loads.size(), 3u);
    ASSERT_TRUE(rig.sink.loads[2].first == rig.sink.loads[1].first);

    rig.engine.set_repeat(model::RepeatMode::All);
    rig.engine.play_at(2);
    rig.sink.emit(audio::SinkEvent::Type::Finished);
    rig.engine.pump();
    ASSERT_EQ(rig.engine.cursor(), 0u);
    ASSERT_TRUE(rig.engine.state() == PlaybackState::Playing);

    rig.engine.set_repeat(model::RepeatMode::Off);
    rig.engine.play_at(2);
    auto loads = rig.sink.loads.size();
    rig.sink.emit(audio::SinkEvent::Type::Finished);
    rig.engine.pump();
    ASSERT_EQ(rig.sink.loads.size(), loads);
    ASSERT_TRUE(rig.engine.state() == PlaybackState::Stopped);
}

TEST_CASE(test_stale_sink_events_ignored) {
    Rig rig;
    rig.engine.open(local(2));
    rig.engine.play();
    auto old_ticket = rig.sink.loads.back().second;
    rig.engine.skip_next();
    ASSERT_NE(rig.sink.loads.back().second, old_ticket);

    // A late Finished from the previous file
    rig.sink.loads.push_back({"/music/stale.flac", old_ticket});
    rig.sink.emit(audio::SinkEvent::Type::Finished);
    rig.engine.pump();
    ASSERT_EQ(rig.engine.cursor(), 1u);
    ASSERT_TRUE(rig.engine.state() == PlaybackState::Playing);
}

TEST_CASE(test_seek_requires_loaded_track) {
    Rig rig;
    auto pl = rig.store.save_remote_playlist(remote("PLseek", {"vidA"}));
    rig.engine.open(pl.id);
    ASSERT_TRUE(rig.engine.seek(1000) == CommandResult::NotReady);
    ASSERT_TRUE(rig.engine.seek_relative(15000) == CommandResult::NotReady);
    ASSERT_TRUE(rig.engine.seek_fraction(0.5) == CommandResult::NotReady);

    rig.engine.open(local(1));
    rig.engine.play();
    rig.sink.emit(audio::SinkEvent::Type::Started, 0, 200000);
    rig.engine.pump();
    ASSERT_EQ(rig.engine.duration_ms(), 200000);

    ASSERT_TRUE(rig.engine.seek_fraction(0.5) == CommandResult::Ok);
    ASSERT_EQ(rig.sink.seeks.back(), 100000);
    ASSERT_TRUE(rig.engine.seek_relative(-5000) == CommandResult::Ok);
    ASSERT_EQ(rig.sink.seeks.back(), 95000);
    ASSERT_TRUE(rig.engine.seek(500000) == CommandResult::Ok);
    ASSERT_EQ(rig.engine.position_ms(), 200000);
}

TEST_CASE(test_sink_error_clears_cached_path) {
    core::EngineOptions options;
    options.advance_on_failure = false;
    Rig rig(options);
    auto pl = rig.store.save_remote_playlist(remote("PLbadfile", {"vidA"}));
    auto a = pl.tracks[0].id;
    rig.store.set_track_path(a, cached_file("brokenA"));

    rig.engine.open(pl.id);
    rig.engine.play();
    ASSERT_EQ(rig.sink.loads.size(), 1u);

    rig.sink.emit(audio::SinkEvent::Type::Error, 0, 0, "decode failed");
    rig.engine.pump();
    ASSERT_TRUE(rig.engine.slot_state(a) == SlotState::Failed);
    ASSERT_EQ(rig.engine.failure_reason(a), "decode failed");
    ASSERT_FALSE(rig.store.get_tracks(pl.id)[0].local_path.has_value());
    ASSERT_TRUE(rig.engine.state() == PlaybackState::Stopped);
}

TEST_CASE(test_refresh_keeps_current_track) {
    Rig rig;
    auto pl = rig.store.save_remote_playlist(remote("PLrefresh", {"vidA", "vidB", "vidC"}));
    auto a = pl.tracks[0].id;
    rig.store.set_track_path(a, cached_file("refreshA"));

    rig.engine.open(pl.id);
    rig.engine.play();
    ASSERT_TRUE(rig.engine.state() == PlaybackState::Playing);

    auto tracks = rig.store.replace_tracks(pl.id, {{"Title vidD", "vidD"}, {"Title vidA", "vidA"}});
    rig.engine.update_tracks(pl.id, tracks);
    ASSERT_TRUE(rig.engine.current_track_id() == a);
    ASSERT_EQ(rig.engine.cursor(), 1u);
    ASSERT_EQ(rig.engine.order().size(), 2u);
    ASSERT_TRUE(rig.engine.state() == PlaybackState::Playing);

    auto stops = rig.sink.stops;
    tracks = rig.store.replace_tracks(pl.id, {{"Title vidD", "vidD"}});
    rig.engine.update_tracks(pl.id, tracks);
    ASSERT_TRUE(rig.engine.state() == PlaybackState::Stopped);
    ASSERT_EQ(rig.sink.stops, stops + 1);
    ASSERT_EQ(rig.engine.order().size(), 1u);

    // Another playlist's refresh leaves the session alone
    rig.engine.update_tracks(pl.id + 1, {});
    ASSERT_EQ(rig.engine.order().size(), 1u);
}

TEST_CASE(test_shuffled_refresh_tracks_membership) {
    core::EngineOptions options;
    options.shuffle = true;
    options.seed_source = [] { return std::uint64_t{7}; };
    Rig rig(options);

    auto pl = rig.store.save_remote_playlist(remote("PLmix", {"vidA", "vidB", "vidC", "vidD", "vidE"}));
    auto removed = pl.tracks[2].id;
    rig.engine.open(pl.id);
    ASSERT_TRUE(rig.engine.order().shuffled);
    ASSERT_TRUE(rig.engine.order().position_of(removed).has_value());

    auto tracks = rig.store.replace_tracks(
        pl.id, {{"Title vidA", "vidA"}, {"Title vidB", "vidB"}, {"Title vidD", "vidD"}, {"Title vidE", "vidE"},
                {"Title vidF", "vidF"}});
    model::TrackId added = 0;
    for (const auto& t : tracks) {
        if (t.remote_id == "vidF") added = t.id;
    }
    ASSERT_NE(added, model::TrackId{0});

    rig.engine.update_tracks(pl.id, tracks);
    const auto& order = rig.engine.order();
    ASSERT_TRUE(order.shuffled);
    ASSERT_EQ(order.size(), tracks.size());
    ASSERT_FALSE(order.position_of(removed).has_value());
    ASSERT_TRUE(order.position_of(added).has_value());
    for (const auto& t : tracks) {
        ASSERT_TRUE(order.position_of(t.id).has_value());
    }
}

TEST_CASE(test_shuffle_order_follows_seed) {
    core::EngineOptions options;
    options.shuffle = true;
    options.seed_source = [] { return std::uint64_t{42}; };
    Rig rig(options);

    auto pl = local(12);
    std::vector<model::TrackId> ids;
    for (const auto& t : pl.tracks) ids.push_back(t.id);

    rig.engine.open(pl);
    ASSERT_TRUE(rig.engine.order().shuffled);
    ASSERT_TRUE(rig.engine.order().track_ids == core::ShuffleSequencer::generate(ids, 42).track_ids);

    rig.engine.play_at(5);
    auto current = rig.engine.current_track_id();
    rig.engine.toggle_shuffle();
    ASSERT_FALSE(rig.engine.order().shuffled);
    ASSERT_TRUE(rig.engine.order().track_ids == ids);
    ASSERT_TRUE(rig.engine.current_track_id() == current);
    ASSERT_EQ(rig.count(events::Event::Type::ModeChanged), 1u);
}

TEST_CASE(test_volume_is_clamped) {
    Rig rig;
    ASSERT_EQ(rig.sink.volume, 50);
    ASSERT_TRUE(rig.engine.set_volume(150) == CommandResult::Ok);
    ASSERT_EQ(rig.engine.volume(), 100);
    ASSERT_EQ(rig.sink.volume, 100);
    ASSERT_TRUE(rig.engine.set_volume(120) == CommandResult::Ignored);
    ASSERT_TRUE(rig.engine.set_volume(-3) == CommandResult::Ok);
    ASSERT_EQ(rig.engine.volume(), 0);
}

TEST_CASE(test_commands_dispatch) {
    Rig rig;
    rig.engine.open(local(3));

    events::Command play_at{events::Command::Type::PlayAt};
    play_at.value = 2;
    ASSERT_TRUE(rig.engine.dispatch(play_at) == CommandResult::Ok);
    ASSERT_EQ(rig.engine.cursor(), 2u);

    play_at.value = -1;
    ASSERT_TRUE(rig.engine.dispatch(play_at) == CommandResult::Ignored);

    ASSERT_TRUE(rig.engine.dispatch({events::Command::Type::CycleRepeat}) == CommandResult::Ok);
    ASSERT_TRUE(rig.engine.repeat() == model::RepeatMode::All);

    ASSERT_TRUE(rig.engine.dispatch({events::Command::Type::Close}) == CommandResult::Ok);
    ASSERT_FALSE(rig.engine.has_session());
    ASSERT_EQ(rig.count(events::Event::Type::SessionClosed), 1u);

    events::Command open_missing{events::Command::Type::Open};
    open_missing.playlist_id = 999;
    ASSERT_TRUE(rig.engine.dispatch(open_missing) == CommandResult::Ignored);
}

int main(int argc, char** argv) {
    int rc = listui::test::TestRunner::instance().run_main(argc, argv);
    std::error_code ec;
    std::filesystem::remove_all(scratch_dir(), ec);
    return rc;
}
