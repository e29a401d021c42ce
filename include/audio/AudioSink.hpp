#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace audio {

struct SinkEvent {
    enum class Type { Started, Position, Finished, Error };
    Type type = Type::Position;
    std::uint64_t ticket = 0;      // Ticket passed to load()
    std::int64_t position_ms = 0;
    std::int64_t duration_ms = 0;
    std::string message;           // Error only
};

// Audio output as seen by the playback engine. Commands return immediately;
// the outcome comes back through the listener, called from the audio thread.
class AudioSink {
public:
    using Listener = std::function<void(const SinkEvent&)>;

    virtual ~AudioSink() = default;

    virtual void set_listener(Listener listener) = 0;

    // Stops whatever plays and starts `path`. Events for it carry `ticket`.
    virtual void load(const std::filesystem::path& path, std::uint64_t ticket) = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void stop() = 0;
    virtual void seek(std::int64_t position_ms) = 0;
    virtual void set_volume(int percent) = 0;
};

}  // namespace audio
