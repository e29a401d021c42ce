#include "audio/MP3Decoder.hpp"
#include "util/Logger.hpp"
#include <mutex>

using listui::util::Logger;

namespace audio {

namespace {

std::once_flag mpg123_init_flag;

}  // namespace

MP3Decoder::MP3Decoder() {
    // mpg123_init is process-wide; mpg123_exit is left to process exit
    std::call_once(mpg123_init_flag, [] { mpg123_init(); });

    int err = MPG123_OK;
    handle_ = mpg123_new(nullptr, &err);
    if (!handle_) {
        Logger::error(std::string("MP3Decoder: mpg123_new failed: ") + mpg123_plain_strerror(err));
    }
}

MP3Decoder::~MP3Decoder() {
    close();
    if (handle_) {
        mpg123_delete(handle_);
        handle_ = nullptr;
    }
}

bool MP3Decoder::open(const std::filesystem::path& path) {
    if (!handle_) return false;
    close();

    // Float output straight from the decoder; the stream accepts F32
    mpg123_param(handle_, MPG123_ADD_FLAGS, MPG123_QUIET, 0.0);
    mpg123_format_none(handle_);
    const long* rates = nullptr;
    size_t rate_count = 0;
    mpg123_rates(&rates, &rate_count);
    for (size_t i = 0; i < rate_count; ++i) {
        mpg123_format(handle_, rates[i], MPG123_MONO | MPG123_STEREO, MPG123_ENC_FLOAT_32);
    }

    if (mpg123_open(handle_, path.c_str()) != MPG123_OK) {
        Logger::error("MP3Decoder: Cannot open " + path.string() + ": " + mpg123_strerror(handle_));
        return false;
    }
    opened_ = true;

    long rate = 0;
    int channels = 0;
    int encoding = 0;
    if (mpg123_getformat(handle_, &rate, &channels, &encoding) != MPG123_OK) {
        Logger::error("MP3Decoder: No stream format in " + path.string());
        close();
        return false;
    }

    // Full scan gives an exact length for VBR files
    mpg123_scan(handle_);
    off_t length = mpg123_length(handle_);

    sample_rate_ = static_cast<int>(rate);
    channels_ = channels;
    total_frames_ = length > 0 ? static_cast<std::int64_t>(length) : 0;
    position_frames_ = 0;

    Logger::info("MP3Decoder: " + path.filename().string() + " " + std::to_string(sample_rate_) + "Hz " +
                 std::to_string(channels_) + "ch, " + std::to_string(duration_ms() / 1000) + "s");
    return true;
}

void MP3Decoder::close() {
    if (handle_ && opened_) {
        mpg123_close(handle_);
    }
    opened_ = false;
    reset_stream();
}

int MP3Decoder::read(float* buffer, int max_frames) {
    if (!opened_ || !buffer || channels_ == 0) return 0;

    const size_t wanted = static_cast<size_t>(max_frames) * channels_ * sizeof(float);
    size_t done = 0;
    int result = mpg123_read(handle_, reinterpret_cast<unsigned char*>(buffer), wanted, &done);

    if (result == MPG123_NEW_FORMAT) {
        result = mpg123_read(handle_, reinterpret_cast<unsigned char*>(buffer), wanted, &done);
    }
    if (result == MPG123_ERR) {
        Logger::error(std::string("MP3Decoder: Read error: ") + mpg123_strerror(handle_));
        return 0;
    }

    int frames = static_cast<int>(done / (sizeof(float) * channels_));
    position_frames_ += frames;
    return frames;
}

bool MP3Decoder::seek_frame(std::int64_t frame) {
    if (!opened_) return false;

    off_t result = mpg123_seek(handle_, static_cast<off_t>(frame), SEEK_SET);
    if (result < 0) {
        Logger::warn("MP3Decoder: Seek to frame " + std::to_string(frame) + " failed");
        return false;
    }
    position_frames_ = static_cast<std::int64_t>(result);
    return true;
}

}  // namespace audio
