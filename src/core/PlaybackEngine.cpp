#include "core/PlaybackEngine.hpp"
#include "core/ShuffleSequencer.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <system_error>

namespace listui::core {

using model::DownloadState;
using model::PlaybackState;
using model::SlotState;
using util::Logger;

namespace {

constexpr int kMaxPumpRounds = 64;

bool is_active(DownloadState state) {
    return state == DownloadState::Pending || state == DownloadState::InProgress;
}

}  // namespace

PlaybackEngine::PlaybackEngine(backend::TrackStore& store, fetch::Fetcher* fetcher, audio::AudioSink& sink,
                               events::EventBus& bus, EngineOptions options)
    : store_(store),
      fetcher_(fetcher),
      sink_(sink),
      bus_(bus),
      options_(std::move(options)),
      inbox_(std::make_shared<events::Mailbox<Message>>()),
      volume_(std::clamp(options_.volume, 0, 100)),
      shuffle_(options_.shuffle),
      repeat_(options_.repeat) {
    auto inbox = inbox_;
    sink_.set_listener([inbox](const audio::SinkEvent& event) {
        Message msg{Message::Type::Sink};
        msg.sink = event;
        inbox->post(std::move(msg));
    });
    sink_.set_volume(volume_);
}

PlaybackEngine::~PlaybackEngine() {
    shutdown();
    sink_.set_listener(nullptr);
}

// ---------------------------------------------------------------------------
// Session lifecycle
// ---------------------------------------------------------------------------

void PlaybackEngine::open(const model::Playlist& playlist) {
    teardown(true);

    ++generation_;
    advance_ = 0;
    consecutive_failures_ = 0;

    Session session;
    session.playlist_id = playlist.id;
    session.title = playlist.title;
    session.tracks = playlist.tracks;
    for (size_t i = 0; i < session.tracks.size(); ++i) {
        const auto& t = session.tracks[i];
        session.index[t.id] = i;
        session.slots[t.id] = t.local_path ? SlotState::Resolved : SlotState::Unresolved;
    }
    session_ = std::move(session);

    if (shuffle_) seed_ = next_seed();
    rebuild_order(playlist.last_track_id);

    Logger::info("PlaybackEngine: Opened \"" + playlist.title + "\" (" + std::to_string(playlist.tracks.size()) +
                 " tracks, generation " + std::to_string(generation_) + ")");

    events::Event opened{events::Event::Type::SessionOpened};
    opened.message = playlist.title;
    publish(opened);
    publish({events::Event::Type::OrderChanged});
    publish_transport();
}

CommandResult PlaybackEngine::open(model::PlaylistId id) {
    auto playlist = store_.get_playlist(id);
    if (!playlist) {
        Logger::warn("PlaybackEngine: No playlist with id " + std::to_string(id));
        return CommandResult::Ignored;
    }
    open(*playlist);
    return CommandResult::Ok;
}

void PlaybackEngine::close() {
    if (!session_) return;
    Logger::info("PlaybackEngine: Closing \"" + session_->title + "\"");
    teardown(true);
    publish({events::Event::Type::SessionClosed});
    publish_transport();
}

void PlaybackEngine::shutdown() {
    close();
    for (auto& [id, active] : tasks_) {
        if (!active.killed) {
            active.handle.cancel();
            active.killed = true;
        }
    }
}

void PlaybackEngine::teardown(bool kill_downloads) {
    for (auto& [id, active] : tasks_) {
        if (is_active(active.task.state)) {
            active.task.state = DownloadState::Cancelled;
        }
        active.redispatch = false;
        if (kill_downloads && !active.killed) {
            active.handle.cancel();
            active.killed = true;
        }
    }

    if (loaded_) {
        sink_.stop();
        loaded_ = false;
    }
    state_ = PlaybackState::Stopped;
    want_play_ = false;
    position_ms_ = 0;
    duration_ms_ = 0;
    ++advance_;

    session_.reset();
    order_ = {};
    cursor_ = 0;
}

// ---------------------------------------------------------------------------
// Transport
// ---------------------------------------------------------------------------

CommandResult PlaybackEngine::play() {
    if (!session_ || order_.empty()) return CommandResult::Ignored;

    if (state_ == PlaybackState::Paused && loaded_) {
        sink_.resume();
        state_ = PlaybackState::Playing;
        want_play_ = true;
        publish_transport();
        return CommandResult::Ok;
    }
    if (state_ == PlaybackState::Playing) return CommandResult::Ignored;

    want_play_ = true;
    consecutive_failures_ = 0;
    play_current();
    return CommandResult::Ok;
}

CommandResult PlaybackEngine::pause() {
    if (state_ == PlaybackState::Playing) {
        sink_.pause();
        state_ = PlaybackState::Paused;
        want_play_ = false;
        publish_transport();
        return CommandResult::Ok;
    }
    if (want_play_) {
        // Still downloading: keep the download, drop the intent to play it
        want_play_ = false;
        return CommandResult::Ok;
    }
    return CommandResult::Ignored;
}

CommandResult PlaybackEngine::stop() {
    if (!session_) return CommandResult::Ignored;

    want_play_ = false;
    leave_current();
    ++advance_;
    state_ = PlaybackState::Stopped;
    publish_transport();
    return CommandResult::Ok;
}

CommandResult PlaybackEngine::toggle_pause() {
    if (state_ == PlaybackState::Playing) return pause();
    if (want_play_) {
        if (auto id = current_track_id(); id && slot_state(*id) == SlotState::Fetching) return pause();
    }
    return play();
}

CommandResult PlaybackEngine::skip_next() {
    if (!session_ || order_.empty()) return CommandResult::Ignored;
    consecutive_failures_ = 0;

    auto next = ShuffleSequencer::advance(order_, cursor_, Direction::Forward);
    if (!next) {
        if (repeat_ == model::RepeatMode::Off) return stop();
        return wrap_around();
    }
    move_cursor(*next);
    return CommandResult::Ok;
}

CommandResult PlaybackEngine::skip_prev() {
    if (!session_ || order_.empty()) return CommandResult::Ignored;
    consecutive_failures_ = 0;

    if (cursor_ == 0) {
        // Nothing before the first track: restart it
        want_play_ = true;
        if (loaded_) {
            sink_.seek(0);
            position_ms_ = 0;
            if (state_ == PlaybackState::Paused) {
                sink_.resume();
                state_ = PlaybackState::Playing;
                publish_transport();
            }
            events::Event moved{events::Event::Type::PositionChanged};
            moved.duration_ms = duration_ms_;
            publish(moved);
        } else {
            play_current();
        }
        return CommandResult::Ok;
    }

    auto prev = ShuffleSequencer::advance(order_, cursor_, Direction::Backward);
    move_cursor(prev.value_or(0));
    return CommandResult::Ok;
}

CommandResult PlaybackEngine::play_at(size_t position) {
    if (!session_ || position >= order_.size()) return CommandResult::Ignored;
    consecutive_failures_ = 0;

    if (position == cursor_) {
        want_play_ = true;
        if (loaded_) {
            start_playback();
        } else {
            play_current();
        }
        return CommandResult::Ok;
    }
    move_cursor(position);
    return CommandResult::Ok;
}

CommandResult PlaybackEngine::seek(std::int64_t position_ms) {
    if (!loaded_ || (state_ != PlaybackState::Playing && state_ != PlaybackState::Paused)) {
        return CommandResult::NotReady;
    }

    position_ms = std::max<std::int64_t>(0, position_ms);
    sink_.seek(position_ms);
    position_ms_ = duration_ms_ > 0 ? std::min(position_ms, duration_ms_) : position_ms;

    events::Event moved{events::Event::Type::PositionChanged};
    moved.position_ms = position_ms_;
    moved.duration_ms = duration_ms_;
    publish(moved);
    return CommandResult::Ok;
}

CommandResult PlaybackEngine::seek_relative(std::int64_t delta_ms) {
    if (!loaded_ || (state_ != PlaybackState::Playing && state_ != PlaybackState::Paused)) {
        return CommandResult::NotReady;
    }
    return seek(std::max<std::int64_t>(0, position_ms_ + delta_ms));
}

CommandResult PlaybackEngine::seek_fraction(double fraction) {
    if (!loaded_ || (state_ != PlaybackState::Playing && state_ != PlaybackState::Paused) || duration_ms_ <= 0) {
        return CommandResult::NotReady;
    }
    fraction = std::clamp(fraction, 0.0, 1.0);
    return seek(static_cast<std::int64_t>(fraction * static_cast<double>(duration_ms_)));
}

CommandResult PlaybackEngine::set_volume(int volume) {
    volume = std::clamp(volume, 0, 100);
    if (volume == volume_) return CommandResult::Ignored;

    volume_ = volume;
    sink_.set_volume(volume_);

    events::Event changed{events::Event::Type::VolumeChanged};
    changed.volume = volume_;
    publish(changed);
    return CommandResult::Ok;
}

// ---------------------------------------------------------------------------
// Modes
// ---------------------------------------------------------------------------

void PlaybackEngine::set_shuffle(bool enabled) {
    if (enabled == shuffle_) return;
    shuffle_ = enabled;
    if (shuffle_) seed_ = next_seed();

    if (session_) {
        rebuild_order(current_track_id());
        publish({events::Event::Type::OrderChanged});
    }
    publish({events::Event::Type::ModeChanged});
}

void PlaybackEngine::set_repeat(model::RepeatMode mode) {
    if (mode == repeat_) return;
    repeat_ = mode;
    publish({events::Event::Type::ModeChanged});
}

void PlaybackEngine::cycle_repeat() {
    switch (repeat_) {
        case model::RepeatMode::Off: set_repeat(model::RepeatMode::All); break;
        case model::RepeatMode::All: set_repeat(model::RepeatMode::One); break;
        case model::RepeatMode::One: set_repeat(model::RepeatMode::Off); break;
    }
}

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

void PlaybackEngine::ensure_current_resolved() {
    auto* track = current_track();
    if (!track) return;

    if (track->local_path) {
        std::error_code ec;
        if (!track->is_remote() || std::filesystem::exists(*track->local_path, ec)) {
            set_slot(track->id, SlotState::Resolved);
            return;
        }
        Logger::warn("PlaybackEngine: Cached file vanished: " + track->local_path->string());
        track->local_path.reset();
        store_.set_track_path(track->id, std::nullopt);
    }

    if (!track->is_remote()) {
        fail_current("No audio file for " + track->title);
        return;
    }

    if (!fetcher_) {
        std::string reason = options_.remote_unavailable_reason.empty()
            ? "Remote playback is unavailable"
            : options_.remote_unavailable_reason;
        if (!remote_unavailable_reported_) {
            remote_unavailable_reported_ = true;
            events::Event unavailable{events::Event::Type::RemoteUnavailable};
            unavailable.message = reason;
            publish(unavailable);
        }
        fail_current(reason);
        return;
    }

    auto it = tasks_.find(track->id);
    if (it != tasks_.end()) {
        // Attach to the task already running for this track
        auto& active = it->second;
        active.task.owner = token();
        if (active.task.state == DownloadState::Cancelled) {
            if (active.killed) {
                active.redispatch = true;
            } else {
                active.task.state = active.task.progress > 0.0 ? DownloadState::InProgress : DownloadState::Pending;
            }
        }
        set_slot(track->id, SlotState::Fetching);
        return;
    }

    dispatch_fetch(*track);
}

void PlaybackEngine::dispatch_fetch(const model::Track& track) {
    ActiveTask active;
    active.task.track_id = track.id;
    active.task.serial = ++next_serial_;
    active.task.owner = token();
    active.descriptor = {track.title, *track.remote_id};

    const auto id = track.id;
    const auto serial = active.task.serial;
    auto inbox = inbox_;

    Logger::info("PlaybackEngine: Fetching " + *track.remote_id + " (task " + std::to_string(serial) + ")");
    set_slot(id, SlotState::Fetching);
    auto [it, inserted] = tasks_.insert_or_assign(id, std::move(active));

    it->second.handle = fetcher_->fetch(
        it->second.descriptor, it->second.task.owner,
        [inbox, id, serial](double fraction) {
            Message msg{Message::Type::FetchProgress};
            msg.track_id = id;
            msg.serial = serial;
            msg.fraction = fraction;
            inbox->post(std::move(msg));
        },
        [inbox, id, serial](const fetch::FetchResult& result) {
            Message msg{Message::Type::FetchSettled};
            msg.track_id = id;
            msg.serial = serial;
            msg.result = result;
            inbox->post(std::move(msg));
        });

    events::Event progress{events::Event::Type::Progress};
    progress.track_id = id;
    publish(progress);
}

// ---------------------------------------------------------------------------
// Message consumption
// ---------------------------------------------------------------------------

void PlaybackEngine::pump() {
    for (int round = 0; round < kMaxPumpRounds; ++round) {
        auto batch = inbox_->drain();
        if (batch.empty()) return;

        for (const auto& msg : batch) {
            switch (msg.type) {
                case Message::Type::FetchProgress:
                    on_fetch_progress(msg);
                    break;
                case Message::Type::FetchSettled:
                    on_fetch_settled(msg);
                    break;
                case Message::Type::Sink:
                    on_sink_event(msg.sink);
                    break;
                case Message::Type::AdvanceAfterFailure:
                    if (msg.token == token()) advance_after_failure();
                    break;
            }
        }
    }
}

void PlaybackEngine::on_fetch_progress(const Message& msg) {
    auto it = tasks_.find(msg.track_id);
    if (it == tasks_.end() || it->second.task.serial != msg.serial) return;

    auto& task = it->second.task;
    task.progress = std::max(task.progress, msg.fraction);
    if (task.state == DownloadState::Pending) task.state = DownloadState::InProgress;

    if (session_ && task.owner.generation == generation_ && task.state != DownloadState::Cancelled) {
        events::Event progress{events::Event::Type::Progress};
        progress.track_id = msg.track_id;
        progress.fraction = task.progress;
        publish(progress);
    }
}

// The single place where a finished download may affect playback.
void PlaybackEngine::on_fetch_settled(const Message& msg) {
    const auto& result = msg.result;

    // A finished file is worth keeping whatever happened to the session
    if (result.outcome == fetch::FetchOutcome::Resolved) {
        store_.set_track_path(msg.track_id, result.path);
    }

    auto it = tasks_.find(msg.track_id);
    if (it == tasks_.end() || it->second.task.serial != msg.serial) {
        Logger::debug("PlaybackEngine: Result for unknown task " + std::to_string(msg.serial));
        return;
    }
    ActiveTask active = std::move(it->second);
    tasks_.erase(it);

    const bool cancelled = active.task.state == DownloadState::Cancelled && !active.redispatch;
    DownloadState final_state = DownloadState::Cancelled;
    if (!cancelled) {
        switch (result.outcome) {
            case fetch::FetchOutcome::Resolved: final_state = DownloadState::Completed; break;
            case fetch::FetchOutcome::Failed: final_state = DownloadState::Failed; break;
            case fetch::FetchOutcome::Cancelled: final_state = DownloadState::Cancelled; break;
        }
    }

    const bool same_generation = session_ && active.task.owner.generation == generation_;
    if (same_generation) {
        auto idx = session_->index.find(msg.track_id);
        if (idx != session_->index.end() && result.outcome == fetch::FetchOutcome::Resolved) {
            session_->tracks[idx->second].local_path = result.path;
            session_->failures.erase(msg.track_id);
            set_slot(msg.track_id, SlotState::Resolved);
        }
    }

    Logger::debug("PlaybackEngine: Task " + std::to_string(msg.serial) + " settled as " +
                  std::string(model::to_string(final_state)));
    events::Event settled{events::Event::Type::DownloadSettled};
    settled.track_id = msg.track_id;
    settled.download_state = final_state;
    settled.message = result.reason;
    publish(settled);

    const bool relevant = same_generation && !cancelled && active.task.owner == token() &&
                          current_track_id() == msg.track_id;
    if (!relevant) return;

    if (active.redispatch && result.outcome != fetch::FetchOutcome::Resolved) {
        // The killed process did not produce a file; start over for the new request
        if (auto* track = current_track()) dispatch_fetch(*track);
        return;
    }

    if (result.outcome == fetch::FetchOutcome::Resolved) {
        events::Event ready{events::Event::Type::TrackReady};
        ready.track_id = msg.track_id;
        publish(ready);
        if (want_play_) start_playback();
        return;
    }

    fail_current(result.reason.empty() ? "Download failed" : result.reason);
}

void PlaybackEngine::on_sink_event(const audio::SinkEvent& event) {
    if (!loaded_ || event.ticket != sink_ticket_) return;

    switch (event.type) {
        case audio::SinkEvent::Type::Started:
        case audio::SinkEvent::Type::Position: {
            if (event.type == audio::SinkEvent::Type::Started) consecutive_failures_ = 0;
            position_ms_ = event.position_ms;
            duration_ms_ = event.duration_ms;
            events::Event moved{events::Event::Type::PositionChanged};
            moved.position_ms = position_ms_;
            moved.duration_ms = duration_ms_;
            publish(moved);
            break;
        }

        case audio::SinkEvent::Type::Finished:
            loaded_ = false;
            position_ms_ = duration_ms_;
            on_track_finished();
            break;

        case audio::SinkEvent::Type::Error: {
            loaded_ = false;
            state_ = PlaybackState::Stopped;
            if (auto* track = current_track(); track && track->is_remote() && track->local_path) {
                // Download again on the next play()
                track->local_path.reset();
                store_.set_track_path(track->id, std::nullopt);
            }
            fail_current(event.message);
            break;
        }
    }
}

void PlaybackEngine::on_track_finished() {
    if (repeat_ == model::RepeatMode::One) {
        start_playback();
        return;
    }

    auto next = ShuffleSequencer::advance(order_, cursor_, Direction::Forward);
    if (!next) {
        if (repeat_ == model::RepeatMode::Off) {
            Logger::info("PlaybackEngine: End of playlist");
            want_play_ = false;
            ++advance_;
            state_ = PlaybackState::Stopped;
            publish_transport();
            return;
        }
        wrap_around();
        return;
    }
    move_cursor(*next);
}

// ---------------------------------------------------------------------------
// Cursor movement
// ---------------------------------------------------------------------------

void PlaybackEngine::move_cursor(size_t position) {
    leave_current();
    ++advance_;
    cursor_ = std::min(position, order_.size() - 1);
    want_play_ = true;
    publish({events::Event::Type::OrderChanged});
    play_current();
}

CommandResult PlaybackEngine::wrap_around() {
    leave_current();
    ++advance_;
    if (shuffle_) seed_ = next_seed();
    rebuild_order(std::nullopt);
    want_play_ = true;
    publish({events::Event::Type::OrderChanged});
    play_current();
    return CommandResult::Ok;
}

void PlaybackEngine::leave_current() {
    if (auto id = current_track_id()) {
        auto it = tasks_.find(*id);
        if (it != tasks_.end()) {
            auto& active = it->second;
            if (is_active(active.task.state)) {
                // Logical cancel only; the process keeps filling the cache
                active.task.state = DownloadState::Cancelled;
                set_slot(*id, SlotState::Unresolved);
            } else if (active.redispatch) {
                // Still waiting for a killed process; nobody wants the new download now
                active.redispatch = false;
                set_slot(*id, SlotState::Unresolved);
            }
        }
    }
    if (loaded_) {
        sink_.stop();
        loaded_ = false;
    }
    position_ms_ = 0;
    duration_ms_ = 0;
}

void PlaybackEngine::play_current() {
    auto* track = current_track();
    if (!track) return;

    ensure_current_resolved();

    track = current_track();
    if (track && track->local_path && slot_state(track->id) == SlotState::Resolved) {
        start_playback();
    } else if (state_ != PlaybackState::Stopped) {
        state_ = PlaybackState::Stopped;
        publish_transport();
    }
}

void PlaybackEngine::start_playback() {
    auto* track = current_track();
    if (!track || !track->local_path) return;

    ++sink_ticket_;
    sink_.load(*track->local_path, sink_ticket_);
    loaded_ = true;
    state_ = PlaybackState::Playing;
    position_ms_ = 0;
    duration_ms_ = 0;

    Logger::info("PlaybackEngine: Playing \"" + track->title + "\"");
    if (session_->playlist_id != model::kEphemeralPlaylist) {
        store_.set_last_track(session_->playlist_id, track->id);
    }
    publish_transport();
}

void PlaybackEngine::fail_current(const std::string& reason) {
    auto id = current_track_id();
    if (!id) return;

    Logger::warn("PlaybackEngine: Track " + std::to_string(*id) + " failed: " + reason);
    session_->failures[*id] = reason;
    set_slot(*id, SlotState::Failed);

    events::Event failed{events::Event::Type::TrackFailed};
    failed.track_id = *id;
    failed.message = reason;
    publish(failed);

    if (want_play_ && options_.advance_on_failure) {
        // Deferred to pump() so a run of failures never recurses
        Message msg{Message::Type::AdvanceAfterFailure};
        msg.token = token();
        inbox_->post(std::move(msg));
    } else {
        want_play_ = false;
        state_ = PlaybackState::Stopped;
        publish_transport();
    }
}

void PlaybackEngine::advance_after_failure() {
    if (!session_ || order_.empty()) return;

    if (++consecutive_failures_ >= order_.size()) {
        Logger::warn("PlaybackEngine: Every track failed, stopping");
        stop();
        return;
    }

    auto next = ShuffleSequencer::advance(order_, cursor_, Direction::Forward);
    if (!next) {
        if (repeat_ == model::RepeatMode::Off) {
            stop();
            return;
        }
        wrap_around();
        return;
    }
    move_cursor(*next);
}

// ---------------------------------------------------------------------------
// Playlist mutation
// ---------------------------------------------------------------------------

void PlaybackEngine::update_tracks(model::PlaylistId playlist_id, std::vector<model::Track> tracks) {
    if (!session_ || session_->playlist_id != playlist_id) return;

    auto current = current_track_id();
    auto& session = *session_;
    auto old_slots = std::move(session.slots);

    session.tracks = std::move(tracks);
    session.index.clear();
    session.slots.clear();
    for (size_t i = 0; i < session.tracks.size(); ++i) {
        const auto& t = session.tracks[i];
        session.index[t.id] = i;

        SlotState slot = t.local_path ? SlotState::Resolved : SlotState::Unresolved;
        if (!t.local_path) {
            auto old = old_slots.find(t.id);
            if (old != old_slots.end() && old->second != SlotState::Resolved) slot = old->second;
        }
        session.slots[t.id] = slot;
    }

    // Downloads for tracks that disappeared are no longer wanted
    for (auto& [id, active] : tasks_) {
        if (active.task.owner.generation == generation_ && !session.index.count(id)) {
            if (is_active(active.task.state)) active.task.state = DownloadState::Cancelled;
            active.redispatch = false;
        }
    }

    const bool survives = current && session.index.count(*current) > 0;
    rebuild_order(survives ? current : std::nullopt);

    if (current && !survives) {
        Logger::info("PlaybackEngine: Current track was removed, stopping");
        if (loaded_) {
            sink_.stop();
            loaded_ = false;
        }
        ++advance_;
        want_play_ = false;
        state_ = PlaybackState::Stopped;
        position_ms_ = 0;
        duration_ms_ = 0;
        publish_transport();
    }
    publish({events::Event::Type::OrderChanged});
}

void PlaybackEngine::rebuild_order(std::optional<model::TrackId> keep_current) {
    std::vector<model::TrackId> ids;
    if (session_) {
        ids.reserve(session_->tracks.size());
        for (const auto& t : session_->tracks) ids.push_back(t.id);
    }

    order_ = shuffle_ ? ShuffleSequencer::generate(ids, seed_, generation_)
                      : ShuffleSequencer::identity(ids, generation_);
    cursor_ = 0;
    if (keep_current) {
        if (auto pos = order_.position_of(*keep_current)) cursor_ = *pos;
    }
}

// ---------------------------------------------------------------------------
// Commands and queries
// ---------------------------------------------------------------------------

CommandResult PlaybackEngine::dispatch(const events::Command& command) {
    using Type = events::Command::Type;
    switch (command.type) {
        case Type::Open:          return open(command.playlist_id);
        case Type::Play:          return play();
        case Type::Pause:         return pause();
        case Type::Stop:          return stop();
        case Type::SkipNext:      return skip_next();
        case Type::SkipPrev:      return skip_prev();
        case Type::Seek:          return seek(command.value);
        case Type::SetVolume:     return set_volume(static_cast<int>(command.value));
        case Type::TogglePause:   return toggle_pause();
        case Type::PlayAt:
            if (command.value < 0) return CommandResult::Ignored;
            return play_at(static_cast<size_t>(command.value));
        case Type::SeekRelative:  return seek_relative(command.value);
        case Type::SeekFraction:  return seek_fraction(command.fraction);
        case Type::ToggleShuffle: toggle_shuffle(); return CommandResult::Ok;
        case Type::CycleRepeat:   cycle_repeat(); return CommandResult::Ok;
        case Type::Close:         close(); return CommandResult::Ok;
    }
    return CommandResult::Ignored;
}

std::optional<model::PlaylistId> PlaybackEngine::playlist_id() const {
    if (!session_) return std::nullopt;
    return session_->playlist_id;
}

std::string PlaybackEngine::playlist_title() const {
    return session_ ? session_->title : std::string();
}

std::optional<model::TrackId> PlaybackEngine::current_track_id() const {
    if (!session_ || cursor_ >= order_.size()) return std::nullopt;
    return order_.track_ids[cursor_];
}

model::Track* PlaybackEngine::current_track() {
    auto id = current_track_id();
    if (!id) return nullptr;
    auto it = session_->index.find(*id);
    if (it == session_->index.end()) return nullptr;
    return &session_->tracks[it->second];
}

const model::Track* PlaybackEngine::track(model::TrackId id) const {
    if (!session_) return nullptr;
    auto it = session_->index.find(id);
    if (it == session_->index.end()) return nullptr;
    return &session_->tracks[it->second];
}

std::vector<model::TrackId> PlaybackEngine::upcoming(size_t n) const {
    return ShuffleSequencer::upcoming(order_, cursor_, n);
}

model::SlotState PlaybackEngine::slot_state(model::TrackId id) const {
    if (!session_) return SlotState::Unresolved;
    auto it = session_->slots.find(id);
    return it == session_->slots.end() ? SlotState::Unresolved : it->second;
}

std::string PlaybackEngine::failure_reason(model::TrackId id) const {
    if (!session_) return {};
    auto it = session_->failures.find(id);
    return it == session_->failures.end() ? std::string() : it->second;
}

std::optional<model::DownloadTask> PlaybackEngine::download(model::TrackId id) const {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second.task;
}

size_t PlaybackEngine::active_downloads() const {
    return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(), [](const auto& entry) {
        return is_active(entry.second.task.state);
    }));
}

std::uint64_t PlaybackEngine::next_seed() {
    return options_.seed_source ? options_.seed_source() : ShuffleSequencer::fresh_seed();
}

void PlaybackEngine::set_slot(model::TrackId id, model::SlotState state) {
    if (session_ && session_->index.count(id)) session_->slots[id] = state;
}

void PlaybackEngine::publish(events::Event event) {
    bus_.publish(event);
}

void PlaybackEngine::publish_transport() {
    events::Event changed{events::Event::Type::TransportChanged};
    changed.state = state_;
    publish(changed);
}

}  // namespace listui::core
