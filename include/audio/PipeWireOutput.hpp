#pragma once

#include <cstddef>

struct pw_thread_loop;
struct pw_stream;

namespace audio {

// One F32 playback stream on its own PipeWire thread loop.
// The stream is kept across tracks of the same format.
class PipeWireOutput {
public:
    PipeWireOutput() = default;
    ~PipeWireOutput();

    PipeWireOutput(const PipeWireOutput&) = delete;
    PipeWireOutput& operator=(const PipeWireOutput&) = delete;

    // Starts the thread loop on first use. Reopens the stream when the format differs.
    [[nodiscard]] bool open(int sample_rate, int channels);
    // `drain` lets queued audio play out first.
    void close(bool drain);

    // Blocks until a buffer is free. Returns frames written, 0 on failure.
    size_t write(const float* data, size_t frames);
    void set_paused(bool paused);
    void set_volume(int percent);

    bool is_open() const { return stream_ != nullptr; }
    bool matches(int sample_rate, int channels) const {
        return stream_ && sample_rate_ == sample_rate && channels_ == channels;
    }

private:
    bool start_loop();
    bool wait_streaming();

    struct pw_thread_loop* loop_ = nullptr;
    struct pw_stream* stream_ = nullptr;
    int sample_rate_ = 0;
    int channels_ = 0;
    bool paused_ = false;
    float gain_ = 0.5f;
};

}  // namespace audio
