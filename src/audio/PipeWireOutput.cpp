#include "audio/PipeWireOutput.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <mutex>
#include <thread>

using listui::util::Logger;

namespace audio {

namespace {

std::once_flag pw_init_flag;

// Buffers are pulled with dequeue in write(); nothing to do in the callback
void on_process(void*) {}

const struct pw_stream_events stream_events = {
    .version = PW_VERSION_STREAM_EVENTS,
    .destroy = nullptr,
    .state_changed = nullptr,
    .control_info = nullptr,
    .io_changed = nullptr,
    .param_changed = nullptr,
    .add_buffer = nullptr,
    .remove_buffer = nullptr,
    .process = on_process,
    .drained = nullptr,
    .command = nullptr,
    .trigger_done = nullptr,
};

constexpr auto kStateTimeout = std::chrono::seconds(2);
constexpr int kBufferRetries = 50;

}  // namespace

PipeWireOutput::~PipeWireOutput() {
    close(false);
    if (loop_) {
        pw_thread_loop_stop(loop_);
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

bool PipeWireOutput::start_loop() {
    if (loop_) return true;

    std::call_once(pw_init_flag, [] { pw_init(nullptr, nullptr); });
    loop_ = pw_thread_loop_new("listui-audio", nullptr);
    if (!loop_) {
        Logger::error("PipeWireOutput: Cannot create thread loop");
        return false;
    }
    if (pw_thread_loop_start(loop_) < 0) {
        Logger::error("PipeWireOutput: Cannot start thread loop");
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }
    return true;
}

bool PipeWireOutput::open(int sample_rate, int channels) {
    if (matches(sample_rate, channels)) return true;
    if (stream_) close(true);
    if (!start_loop()) return false;

    pw_thread_loop_lock(loop_);

    struct pw_properties* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Playback",
        PW_KEY_MEDIA_ROLE, "Music",
        nullptr);

    stream_ = pw_stream_new_simple(pw_thread_loop_get_loop(loop_), "listui", props, &stream_events, this);
    if (!stream_) {
        pw_thread_loop_unlock(loop_);
        Logger::error("PipeWireOutput: Cannot create stream");
        return false;
    }

    uint8_t pod_buffer[1024];
    struct spa_pod_builder builder = SPA_POD_BUILDER_INIT(pod_buffer, sizeof(pod_buffer));
    struct spa_audio_info_raw info = {};
    info.format = SPA_AUDIO_FORMAT_F32;
    info.channels = static_cast<uint32_t>(channels);
    info.rate = static_cast<uint32_t>(sample_rate);
    const struct spa_pod* params[1] = {
        spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &info),
    };

    int result = pw_stream_connect(
        stream_, PW_DIRECTION_OUTPUT, PW_ID_ANY,
        static_cast<pw_stream_flags>(PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS),
        params, 1);

    pw_thread_loop_unlock(loop_);

    if (result < 0) {
        Logger::error("PipeWireOutput: Stream connect failed (" + std::to_string(result) + ")");
        close(false);
        return false;
    }

    sample_rate_ = sample_rate;
    channels_ = channels;
    paused_ = false;
    Logger::info("PipeWireOutput: Stream open at " + std::to_string(sample_rate) + "Hz " +
                 std::to_string(channels) + "ch");
    return true;
}

void PipeWireOutput::close(bool drain) {
    if (!stream_) return;

    pw_thread_loop_lock(loop_);
    pw_stream_flush(stream_, drain);
    pw_stream_destroy(stream_);
    pw_thread_loop_unlock(loop_);

    stream_ = nullptr;
    sample_rate_ = 0;
    channels_ = 0;
}

bool PipeWireOutput::wait_streaming() {
    auto deadline = std::chrono::steady_clock::now() + kStateTimeout;
    while (std::chrono::steady_clock::now() < deadline) {
        pw_thread_loop_lock(loop_);
        auto state = pw_stream_get_state(stream_, nullptr);
        pw_thread_loop_unlock(loop_);

        if (state == PW_STREAM_STATE_STREAMING) return true;
        if (state == PW_STREAM_STATE_ERROR) {
            Logger::error("PipeWireOutput: Stream in error state");
            return false;
        }
        // Suspended sinks take a moment to wake up
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    Logger::error("PipeWireOutput: Stream never started streaming");
    return false;
}

size_t PipeWireOutput::write(const float* data, size_t frames) {
    if (!stream_ || !data || frames == 0) return 0;
    if (!wait_streaming()) return 0;

    struct pw_buffer* pw_buf = nullptr;
    for (int attempt = 0; attempt < kBufferRetries; ++attempt) {
        pw_thread_loop_lock(loop_);
        pw_buf = pw_stream_dequeue_buffer(stream_);
        if (pw_buf) break;
        pw_thread_loop_unlock(loop_);
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(2 << std::min(attempt, 4), 50)));
    }
    if (!pw_buf) {
        Logger::error("PipeWireOutput: No free buffer, sink may be suspended");
        return 0;
    }

    // Loop is locked from here on
    struct spa_data& out = pw_buf->buffer->datas[0];
    if (!out.data) {
        pw_stream_queue_buffer(stream_, pw_buf);
        pw_thread_loop_unlock(loop_);
        return 0;
    }

    const size_t stride = static_cast<size_t>(channels_) * sizeof(float);
    const size_t count = std::min(frames, out.maxsize / stride);
    auto* dst = static_cast<float*>(out.data);
    for (size_t i = 0; i < count * channels_; ++i) {
        float sample = data[i] * gain_;
        dst[i] = std::isfinite(sample) ? std::clamp(sample, -1.0f, 1.0f) : 0.0f;
    }

    out.chunk->offset = 0;
    out.chunk->stride = static_cast<int32_t>(stride);
    out.chunk->size = static_cast<uint32_t>(count * stride);

    pw_stream_queue_buffer(stream_, pw_buf);
    pw_thread_loop_unlock(loop_);
    return count;
}

void PipeWireOutput::set_paused(bool paused) {
    if (paused_ == paused || !stream_) return;

    pw_thread_loop_lock(loop_);
    pw_stream_set_active(stream_, !paused);
    pw_thread_loop_unlock(loop_);
    paused_ = paused;
}

void PipeWireOutput::set_volume(int percent) {
    gain_ = static_cast<float>(std::clamp(percent, 0, 100)) / 100.0f;
}

}  // namespace audio
