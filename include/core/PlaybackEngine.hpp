#pragma once

#include "audio/AudioSink.hpp"
#include "backend/TrackStore.hpp"
#include "events/Command.hpp"
#include "events/EventBus.hpp"
#include "events/Mailbox.hpp"
#include "fetch/Fetcher.hpp"
#include "model/Library.hpp"
#include "model/Session.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace listui::core {

enum class CommandResult { Ok, Ignored, NotReady };

struct EngineOptions {
    bool shuffle = false;
    model::RepeatMode repeat = model::RepeatMode::Off;
    int volume = 50;
    bool advance_on_failure = true;
    std::function<std::uint64_t()> seed_source;  // Defaults to ShuffleSequencer::fresh_seed
    std::string remote_unavailable_reason;       // Shown when there is no fetcher
};

// Owns the playback session: cursor, order, transport state and the download
// tasks started for it. Every method runs on the foreground thread. Fetch jobs
// and the audio thread report through a mailbox consumed by pump().
//
// A fetch completion starts playback only when the token it captured at
// dispatch is still the session's token and its track is still current.
// Any cursor move, stop or new session changes the token.
class PlaybackEngine {
public:
    PlaybackEngine(backend::TrackStore& store, fetch::Fetcher* fetcher, audio::AudioSink& sink,
                   events::EventBus& bus, EngineOptions options = {});
    ~PlaybackEngine();

    PlaybackEngine(const PlaybackEngine&) = delete;
    PlaybackEngine& operator=(const PlaybackEngine&) = delete;

    // Session lifecycle
    void open(const model::Playlist& playlist);
    CommandResult open(model::PlaylistId id);
    void close();
    void shutdown();

    // Transport
    CommandResult play();
    CommandResult pause();
    CommandResult stop();
    CommandResult toggle_pause();
    CommandResult skip_next();
    CommandResult skip_prev();
    CommandResult play_at(size_t position);
    CommandResult seek(std::int64_t position_ms);
    CommandResult seek_relative(std::int64_t delta_ms);
    CommandResult seek_fraction(double fraction);
    CommandResult set_volume(int volume);

    // Modes
    void set_shuffle(bool enabled);
    void toggle_shuffle() { set_shuffle(!shuffle_); }
    void set_repeat(model::RepeatMode mode);
    void cycle_repeat();

    // Starts a download for the current track unless it is playable or already being fetched.
    void ensure_current_resolved();

    // The stored track list of `playlist_id` changed.
    void update_tracks(model::PlaylistId playlist_id, std::vector<model::Track> tracks);

    CommandResult dispatch(const events::Command& command);

    // Consumes fetch and audio messages. Call from the foreground loop.
    void pump();

    // Queries
    [[nodiscard]] bool has_session() const { return session_.has_value(); }
    [[nodiscard]] std::optional<model::PlaylistId> playlist_id() const;
    [[nodiscard]] std::string playlist_title() const;
    [[nodiscard]] const model::PlaybackOrder& order() const { return order_; }
    [[nodiscard]] size_t cursor() const { return cursor_; }
    [[nodiscard]] std::optional<model::TrackId> current_track_id() const;
    [[nodiscard]] const model::Track* track(model::TrackId id) const;
    [[nodiscard]] std::vector<model::TrackId> upcoming(size_t n) const;

    [[nodiscard]] model::PlaybackState state() const { return state_; }
    [[nodiscard]] model::SlotState slot_state(model::TrackId id) const;
    [[nodiscard]] std::string failure_reason(model::TrackId id) const;
    [[nodiscard]] std::optional<model::DownloadTask> download(model::TrackId id) const;
    [[nodiscard]] size_t active_downloads() const;
    [[nodiscard]] model::FetchToken token() const { return {generation_, advance_}; }

    [[nodiscard]] int volume() const { return volume_; }
    [[nodiscard]] bool shuffle() const { return shuffle_; }
    [[nodiscard]] model::RepeatMode repeat() const { return repeat_; }
    [[nodiscard]] std::int64_t position_ms() const { return position_ms_; }
    [[nodiscard]] std::int64_t duration_ms() const { return duration_ms_; }

private:
    struct Session {
        model::PlaylistId playlist_id = model::kEphemeralPlaylist;
        std::string title;
        std::vector<model::Track> tracks;
        std::unordered_map<model::TrackId, size_t> index;
        std::unordered_map<model::TrackId, model::SlotState> slots;
        std::unordered_map<model::TrackId, std::string> failures;
    };

    struct ActiveTask {
        model::DownloadTask task;
        model::TrackDescriptor descriptor;
        fetch::FetchHandle handle;
        bool killed = false;      // Process termination requested
        bool redispatch = false;  // Requested again after being killed
    };

    struct Message {
        enum class Type { FetchProgress, FetchSettled, Sink, AdvanceAfterFailure };
        Type type;
        model::TrackId track_id = 0;
        std::uint64_t serial = 0;
        double fraction = 0.0;
        fetch::FetchResult result;
        audio::SinkEvent sink;
        model::FetchToken token;
    };

    model::Track* current_track();
    std::uint64_t next_seed();
    void set_slot(model::TrackId id, model::SlotState state);
    void rebuild_order(std::optional<model::TrackId> keep_current);
    void teardown(bool kill_downloads);
    void move_cursor(size_t position);
    void leave_current();
    void play_current();
    void start_playback();
    void dispatch_fetch(const model::Track& track);
    void fail_current(const std::string& reason);
    void advance_after_failure();
    CommandResult wrap_around();

    void on_fetch_progress(const Message& msg);
    void on_fetch_settled(const Message& msg);
    void on_sink_event(const audio::SinkEvent& event);
    void on_track_finished();

    void publish(events::Event event);
    void publish_transport();

    backend::TrackStore& store_;
    fetch::Fetcher* fetcher_;
    audio::AudioSink& sink_;
    events::EventBus& bus_;
    EngineOptions options_;
    std::shared_ptr<events::Mailbox<Message>> inbox_;

    std::optional<Session> session_;
    model::PlaybackOrder order_;
    size_t cursor_ = 0;
    std::uint64_t generation_ = 0;
    std::uint64_t advance_ = 0;
    std::uint64_t seed_ = 0;

    model::PlaybackState state_ = model::PlaybackState::Stopped;
    bool want_play_ = false;
    bool loaded_ = false;  // The sink holds the current track
    std::uint64_t sink_ticket_ = 0;
    std::int64_t position_ms_ = 0;
    std::int64_t duration_ms_ = 0;
    size_t consecutive_failures_ = 0;

    int volume_ = 50;
    bool shuffle_ = false;
    model::RepeatMode repeat_ = model::RepeatMode::Off;

    std::unordered_map<model::TrackId, ActiveTask> tasks_;
    std::uint64_t next_serial_ = 0;
    bool remote_unavailable_reported_ = false;
};

}  // namespace listui::core
