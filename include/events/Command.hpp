#pragma once

#include "model/Library.hpp"
#include <cstdint>

namespace listui::events {

// Transport commands sent from the shell to the playback engine.
struct Command {
    enum class Type {
        Open,           // playlist_id
        Play,
        Pause,
        Stop,
        SkipNext,
        SkipPrev,
        Seek,           // value = position in ms
        SetVolume,      // value = 0..100
        TogglePause,
        PlayAt,         // value = position in the play order
        SeekRelative,   // value = delta in ms
        SeekFraction,   // fraction = 0..1
        ToggleShuffle,
        CycleRepeat,
        Close,
    };
    Type type;
    std::int64_t value = 0;
    double fraction = 0.0;
    model::PlaylistId playlist_id = model::kEphemeralPlaylist;
};

}  // namespace listui::events
