#pragma once

#include "model/Session.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace listui::core {

enum class Direction { Forward, Backward };

// Pure functions computing play orders. Same (ids, seed) gives the same order on every platform.
class ShuffleSequencer {
public:
    static model::PlaybackOrder generate(const std::vector<model::TrackId>& track_ids, std::uint64_t seed,
                                         std::uint64_t generation = 0);
    static model::PlaybackOrder identity(const std::vector<model::TrackId>& track_ids,
                                         std::uint64_t generation = 0);

    // nullopt when moving forward past the last entry. Moving back from 0 stays at 0.
    static std::optional<size_t> advance(const model::PlaybackOrder& order, size_t cursor, Direction direction);

    // Up to n ids following `cursor`, in play order.
    static std::vector<model::TrackId> upcoming(const model::PlaybackOrder& order, size_t cursor, size_t n);

    // Seed from the kernel's random pool.
    static std::uint64_t fresh_seed();
};

}  // namespace listui::core
