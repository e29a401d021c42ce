#pragma once

#include "model/Library.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace listui::model {

enum class PlaybackState { Stopped, Playing, Paused };
enum class RepeatMode { Off, All, One };

// Per-track slot as seen by the shell.
enum class SlotState { Unresolved, Fetching, Resolved, Failed };

enum class DownloadState { Pending, InProgress, Completed, Failed, Cancelled };

// Captured when a download is dispatched. `generation` changes with every
// opened session, `advance` with every cursor move or stop inside it.
struct FetchToken {
    std::uint64_t generation = 0;
    std::uint64_t advance = 0;

    bool operator==(const FetchToken&) const = default;
};

struct PlaybackOrder {
    std::vector<TrackId> track_ids;
    std::uint64_t generation = 0;
    std::uint64_t seed = 0;
    bool shuffled = false;

    size_t size() const { return track_ids.size(); }
    bool empty() const { return track_ids.empty(); }
    std::optional<size_t> position_of(TrackId id) const {
        for (size_t i = 0; i < track_ids.size(); ++i) {
            if (track_ids[i] == id) return i;
        }
        return std::nullopt;
    }
};

struct DownloadTask {
    TrackId track_id = 0;
    std::uint64_t serial = 0;  // Unique per dispatch
    DownloadState state = DownloadState::Pending;
    double progress = 0.0;
    FetchToken owner;
    std::optional<std::filesystem::path> path;
    std::string reason;
};

inline std::string_view to_string(PlaybackState state) {
    switch (state) {
        case PlaybackState::Stopped: return "stopped";
        case PlaybackState::Playing: return "playing";
        case PlaybackState::Paused:  return "paused";
    }
    return "unknown";
}

inline std::string_view to_string(RepeatMode mode) {
    switch (mode) {
        case RepeatMode::Off: return "off";
        case RepeatMode::All: return "all";
        case RepeatMode::One: return "one";
    }
    return "off";
}

inline std::string_view to_string(DownloadState state) {
    switch (state) {
        case DownloadState::Pending:    return "pending";
        case DownloadState::InProgress: return "in-progress";
        case DownloadState::Completed:  return "completed";
        case DownloadState::Failed:     return "failed";
        case DownloadState::Cancelled:  return "cancelled";
    }
    return "unknown";
}

inline RepeatMode repeat_from_string(std::string_view name) {
    if (name == "all") return RepeatMode::All;
    if (name == "one") return RepeatMode::One;
    return RepeatMode::Off;
}

}  // namespace listui::model
