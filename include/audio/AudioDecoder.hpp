#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>

namespace audio {

// Interleaved float PCM source for one file.
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;

    virtual bool open(const std::filesystem::path& path) = 0;
    virtual void close() = 0;

    // Returns frames decoded into `buffer` (channels * max_frames floats); 0 at end or error.
    virtual int read(float* buffer, int max_frames) = 0;
    virtual bool seek_frame(std::int64_t frame) = 0;

    int sample_rate() const { return sample_rate_; }
    int channels() const { return channels_; }

    std::int64_t position_ms() const {
        return sample_rate_ > 0 ? position_frames_ * 1000 / sample_rate_ : 0;
    }
    std::int64_t duration_ms() const {
        return sample_rate_ > 0 ? total_frames_ * 1000 / sample_rate_ : 0;
    }

    bool seek_ms(std::int64_t ms) {
        if (sample_rate_ == 0) return false;
        return seek_frame(ms * sample_rate_ / 1000);
    }

protected:
    void reset_stream() {
        sample_rate_ = 0;
        channels_ = 0;
        total_frames_ = 0;
        position_frames_ = 0;
    }

    int sample_rate_ = 0;
    int channels_ = 0;
    std::int64_t total_frames_ = 0;
    std::int64_t position_frames_ = 0;
};

// Picks a decoder by file extension. nullptr for unsupported formats.
std::unique_ptr<AudioDecoder> make_decoder(const std::filesystem::path& path);

}  // namespace audio
