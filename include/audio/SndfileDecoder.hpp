#pragma once

#include "audio/AudioDecoder.hpp"
#include <sndfile.h>

namespace audio {

// FLAC and WAV through libsndfile.
class SndfileDecoder : public AudioDecoder {
public:
    SndfileDecoder() = default;
    ~SndfileDecoder() override;

    SndfileDecoder(const SndfileDecoder&) = delete;
    SndfileDecoder& operator=(const SndfileDecoder&) = delete;

    bool open(const std::filesystem::path& path) override;
    void close() override;
    int read(float* buffer, int max_frames) override;
    bool seek_frame(std::int64_t frame) override;

private:
    SNDFILE* file_ = nullptr;
};

}  // namespace audio
