#include "audio/SndfileDecoder.hpp"
#include "util/Logger.hpp"

using listui::util::Logger;

namespace audio {

SndfileDecoder::~SndfileDecoder() {
    close();
}

bool SndfileDecoder::open(const std::filesystem::path& path) {
    close();

    SF_INFO info{};
    file_ = sf_open(path.c_str(), SFM_READ, &info);
    if (!file_) {
        Logger::error("SndfileDecoder: Cannot open " + path.string() + ": " + sf_strerror(nullptr));
        return false;
    }

    sample_rate_ = info.samplerate;
    channels_ = info.channels;
    total_frames_ = static_cast<std::int64_t>(info.frames);
    position_frames_ = 0;

    Logger::info("SndfileDecoder: " + path.filename().string() + " " + std::to_string(sample_rate_) + "Hz " +
                 std::to_string(channels_) + "ch, " + std::to_string(duration_ms() / 1000) + "s");
    return true;
}

void SndfileDecoder::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
    reset_stream();
}

int SndfileDecoder::read(float* buffer, int max_frames) {
    if (!file_ || !buffer) return 0;

    sf_count_t frames = sf_readf_float(file_, buffer, max_frames);
    if (frames < 0) return 0;
    position_frames_ += frames;
    return static_cast<int>(frames);
}

bool SndfileDecoder::seek_frame(std::int64_t frame) {
    if (!file_) return false;

    sf_count_t result = sf_seek(file_, static_cast<sf_count_t>(frame), SEEK_SET);
    if (result < 0) {
        Logger::warn("SndfileDecoder: Seek to frame " + std::to_string(frame) + " failed");
        return false;
    }
    position_frames_ = result;
    return true;
}

}  // namespace audio
