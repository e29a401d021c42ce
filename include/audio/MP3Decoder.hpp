#pragma once

#include "audio/AudioDecoder.hpp"
#include <mpg123.h>

namespace audio {

class MP3Decoder : public AudioDecoder {
public:
    MP3Decoder();
    ~MP3Decoder() override;

    MP3Decoder(const MP3Decoder&) = delete;
    MP3Decoder& operator=(const MP3Decoder&) = delete;

    bool open(const std::filesystem::path& path) override;
    void close() override;
    int read(float* buffer, int max_frames) override;
    bool seek_frame(std::int64_t frame) override;

private:
    mpg123_handle* handle_ = nullptr;
    bool opened_ = false;
};

}  // namespace audio
