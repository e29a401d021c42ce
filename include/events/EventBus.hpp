#pragma once

#include "model/Session.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace listui::events {

// Notifications from the playback engine to the shell.
struct Event {
    enum class Type {
        SessionOpened,
        SessionClosed,
        OrderChanged,       // Order regenerated or cursor moved
        TransportChanged,   // state
        Progress,           // track_id, fraction
        TrackReady,         // track_id
        TrackFailed,        // track_id, message
        DownloadSettled,    // track_id, download_state
        PositionChanged,    // position_ms, duration_ms
        VolumeChanged,      // volume
        ModeChanged,        // shuffle / repeat
        RemoteUnavailable,  // message
    };
    Type type;
    model::TrackId track_id = -1;
    double fraction = 0.0;
    model::PlaybackState state = model::PlaybackState::Stopped;
    model::DownloadState download_state = model::DownloadState::Pending;
    std::int64_t position_ms = 0;
    std::int64_t duration_ms = 0;
    int volume = 0;
    std::string message;
};

class EventBus {
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = std::uint64_t;

    static EventBus& instance() {
        static EventBus instance;
        return instance;
    }

    EventBus() = default;

    SubscriptionId subscribe(Event::Type type, Handler handler);
    void unsubscribe(SubscriptionId id);
    void publish(const Event& event);

private:
    struct Subscription {
        SubscriptionId id;
        Handler handler;
    };
    std::map<Event::Type, std::vector<Subscription>> subscribers_;
    SubscriptionId next_id_ = 1;
    std::mutex mutex_;
};

}  // namespace listui::events
