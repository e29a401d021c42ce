#include "audio/PlaybackThread.hpp"
#include "audio/AudioDecoder.hpp"
#include "audio/PipeWireOutput.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <vector>

using listui::util::Logger;

namespace audio {

namespace {

constexpr int kBufferFrames = 4096;
constexpr auto kPositionInterval = std::chrono::milliseconds(250);
constexpr auto kPausePoll = std::chrono::milliseconds(50);

}  // namespace

PlaybackThread::PlaybackThread()
    : thread_([this](std::stop_token st) { run(st); }) {}

PlaybackThread::~PlaybackThread() {
    thread_.request_stop();
    ++interrupt_;
    cv_.notify_all();
}

void PlaybackThread::set_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void PlaybackThread::emit(const SinkEvent& event) {
    Listener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) listener(event);
}

void PlaybackThread::load(const std::filesystem::path& path, std::uint64_t ticket) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = Request{path, ticket};
        ++interrupt_;
        paused_ = false;
        seek_request_ms_ = -1;
    }
    cv_.notify_all();
}

void PlaybackThread::pause() {
    paused_ = true;
}

void PlaybackThread::resume() {
    paused_ = false;
}

void PlaybackThread::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.reset();
        ++interrupt_;
        paused_ = false;
    }
    cv_.notify_all();
}

void PlaybackThread::seek(std::int64_t position_ms) {
    seek_request_ms_ = std::max<std::int64_t>(0, position_ms);
}

void PlaybackThread::set_volume(int percent) {
    volume_ = percent;
}

void PlaybackThread::run(std::stop_token stop_token) {
    PipeWireOutput output;

    while (!stop_token.stop_requested()) {
        Request request;
        std::uint64_t serial = 0;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, stop_token, [this] { return pending_.has_value(); });
            if (stop_token.stop_requested()) break;
            request = std::move(*pending_);
            pending_.reset();
            serial = interrupt_.load();
        }

        play(request, serial, output, stop_token);
    }

    output.close(false);
    Logger::debug("PlaybackThread: Exiting");
}

void PlaybackThread::play(const Request& request, std::uint64_t serial, PipeWireOutput& output,
                          std::stop_token stop_token) {
    auto fail = [&](const std::string& message) {
        Logger::error("PlaybackThread: " + message);
        output.close(false);
        emit({SinkEvent::Type::Error, request.ticket, 0, 0, message});
    };

    auto decoder = make_decoder(request.path);
    if (!decoder) {
        fail("Unsupported format: " + request.path.filename().string());
        return;
    }
    if (!decoder->open(request.path)) {
        fail("Cannot decode " + request.path.filename().string());
        return;
    }
    if (!output.open(decoder->sample_rate(), decoder->channels())) {
        fail("Audio output unavailable");
        return;
    }

    int volume = volume_.load();
    output.set_volume(volume);
    output.set_paused(false);
    emit({SinkEvent::Type::Started, request.ticket, 0, decoder->duration_ms(), {}});

    std::vector<float> buffer(static_cast<size_t>(kBufferFrames) * decoder->channels());
    auto last_report = std::chrono::steady_clock::now();

    while (!stop_token.stop_requested() && !interrupted(serial)) {
        if (int v = volume_.load(); v != volume) {
            volume = v;
            output.set_volume(volume);
        }

        std::int64_t target = seek_request_ms_.exchange(-1);
        if (target >= 0) {
            if (target >= decoder->duration_ms() && decoder->duration_ms() > 0) {
                break;  // Seeking past the end finishes the track
            }
            output.close(false);
            if (!decoder->seek_ms(target) || !output.open(decoder->sample_rate(), decoder->channels())) {
                fail("Seek failed");
                return;
            }
            output.set_volume(volume);
            emit({SinkEvent::Type::Position, request.ticket, decoder->position_ms(), decoder->duration_ms(), {}});
        }

        if (paused_.load()) {
            output.set_paused(true);
            std::this_thread::sleep_for(kPausePoll);
            continue;
        }
        output.set_paused(false);

        auto now = std::chrono::steady_clock::now();
        if (now - last_report >= kPositionInterval) {
            emit({SinkEvent::Type::Position, request.ticket, decoder->position_ms(), decoder->duration_ms(), {}});
            last_report = now;
        }

        int frames = decoder->read(buffer.data(), kBufferFrames);
        if (frames <= 0) {
            output.close(true);
            emit({SinkEvent::Type::Finished, request.ticket, decoder->duration_ms(), decoder->duration_ms(), {}});
            return;
        }

        size_t offset = 0;
        size_t remaining = static_cast<size_t>(frames);
        while (remaining > 0 && !interrupted(serial) && !stop_token.stop_requested()) {
            size_t written = output.write(buffer.data() + offset * decoder->channels(), remaining);
            if (written == 0) {
                fail("Audio output stopped accepting data");
                return;
            }
            offset += written;
            remaining -= written;
        }
    }

    if (!stop_token.stop_requested() && !interrupted(serial)) {
        // Left the loop through a seek past the end
        output.close(false);
        emit({SinkEvent::Type::Finished, request.ticket, decoder->duration_ms(), decoder->duration_ms(), {}});
        return;
    }

    // Interrupted by load() or stop(): cut the queued audio
    output.close(false);
}

}  // namespace audio
