#pragma once

#include "audio/AudioSink.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace audio {

class AudioDecoder;
class PipeWireOutput;

// Decodes and plays one file at a time on a dedicated thread.
class PlaybackThread : public AudioSink {
public:
    PlaybackThread();
    ~PlaybackThread() override;

    PlaybackThread(const PlaybackThread&) = delete;
    PlaybackThread& operator=(const PlaybackThread&) = delete;

    void set_listener(Listener listener) override;
    void load(const std::filesystem::path& path, std::uint64_t ticket) override;
    void pause() override;
    void resume() override;
    void stop() override;
    void seek(std::int64_t position_ms) override;
    void set_volume(int percent) override;

private:
    struct Request {
        std::filesystem::path path;
        std::uint64_t ticket = 0;
    };

    void run(std::stop_token stop_token);
    void play(const Request& request, std::uint64_t serial, PipeWireOutput& output, std::stop_token stop_token);
    bool interrupted(std::uint64_t serial) const { return interrupt_.load() != serial; }
    void emit(const SinkEvent& event);

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::optional<Request> pending_;
    std::atomic<std::uint64_t> interrupt_{0};  // Bumped by load() and stop()

    std::atomic<bool> paused_{false};
    std::atomic<std::int64_t> seek_request_ms_{-1};
    std::atomic<int> volume_{50};

    std::mutex listener_mutex_;
    Listener listener_;

    std::jthread thread_;
};

}  // namespace audio
