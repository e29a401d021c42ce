#include "core/ShuffleSequencer.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <random>
#include <sys/random.h>

namespace listui::core {

model::PlaybackOrder ShuffleSequencer::generate(const std::vector<model::TrackId>& track_ids, std::uint64_t seed,
                                                std::uint64_t generation) {
    model::PlaybackOrder order;
    order.track_ids = track_ids;
    order.generation = generation;
    order.seed = seed;
    order.shuffled = true;

    // Fisher-Yates on raw engine output; std::uniform_int_distribution differs between libraries
    std::mt19937_64 rng(seed);
    auto& ids = order.track_ids;
    for (size_t i = ids.size(); i > 1; --i) {
        size_t j = static_cast<size_t>(rng() % i);
        std::swap(ids[i - 1], ids[j]);
    }
    return order;
}

model::PlaybackOrder ShuffleSequencer::identity(const std::vector<model::TrackId>& track_ids,
                                                std::uint64_t generation) {
    model::PlaybackOrder order;
    order.track_ids = track_ids;
    order.generation = generation;
    return order;
}

std::optional<size_t> ShuffleSequencer::advance(const model::PlaybackOrder& order, size_t cursor,
                                                Direction direction) {
    if (order.empty()) return std::nullopt;

    if (direction == Direction::Backward) {
        if (cursor == 0) return 0;
        return std::min(cursor - 1, order.size() - 1);
    }
    if (cursor + 1 >= order.size()) return std::nullopt;
    return cursor + 1;
}

std::vector<model::TrackId> ShuffleSequencer::upcoming(const model::PlaybackOrder& order, size_t cursor, size_t n) {
    std::vector<model::TrackId> out;
    for (size_t i = cursor + 1; i < order.size() && out.size() < n; ++i) {
        out.push_back(order.track_ids[i]);
    }
    return out;
}

std::uint64_t ShuffleSequencer::fresh_seed() {
    std::uint64_t seed = 0;
    if (getrandom(&seed, sizeof(seed), 0) != static_cast<ssize_t>(sizeof(seed))) {
        util::Logger::warn("ShuffleSequencer: getrandom failed, seeding from the clock");
        seed = static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
    }
    return seed;
}

}  // namespace listui::core
