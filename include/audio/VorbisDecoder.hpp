#pragma once

#include "audio/AudioDecoder.hpp"
#include <vorbis/vorbisfile.h>

namespace audio {

class VorbisDecoder : public AudioDecoder {
public:
    VorbisDecoder() = default;
    ~VorbisDecoder() override;

    VorbisDecoder(const VorbisDecoder&) = delete;
    VorbisDecoder& operator=(const VorbisDecoder&) = delete;

    bool open(const std::filesystem::path& path) override;
    void close() override;
    int read(float* buffer, int max_frames) override;
    bool seek_frame(std::int64_t frame) override;

private:
    OggVorbis_File vf_{};
    bool opened_ = false;
};

}  // namespace audio
