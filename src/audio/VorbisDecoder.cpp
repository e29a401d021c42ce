#include "audio/VorbisDecoder.hpp"
#include "util/Logger.hpp"

using listui::util::Logger;

namespace audio {

VorbisDecoder::~VorbisDecoder() {
    close();
}

bool VorbisDecoder::open(const std::filesystem::path& path) {
    close();

    int err = ov_fopen(path.c_str(), &vf_);
    if (err < 0) {
        Logger::error("VorbisDecoder: Cannot open " + path.string() + " (code " + std::to_string(err) + ")");
        return false;
    }
    opened_ = true;

    vorbis_info* info = ov_info(&vf_, -1);
    if (!info) {
        Logger::error("VorbisDecoder: No stream info in " + path.string());
        close();
        return false;
    }

    sample_rate_ = static_cast<int>(info->rate);
    channels_ = info->channels;
    ogg_int64_t total = ov_pcm_total(&vf_, -1);
    total_frames_ = total > 0 ? total : 0;
    position_frames_ = 0;

    Logger::info("VorbisDecoder: " + path.filename().string() + " " + std::to_string(sample_rate_) + "Hz " +
                 std::to_string(channels_) + "ch, " + std::to_string(duration_ms() / 1000) + "s");
    return true;
}

void VorbisDecoder::close() {
    if (opened_) {
        ov_clear(&vf_);
        opened_ = false;
    }
    reset_stream();
}

int VorbisDecoder::read(float* buffer, int max_frames) {
    if (!opened_ || !buffer) return 0;

    int frames = 0;
    int section = 0;
    while (frames < max_frames) {
        float** pcm = nullptr;
        long got = ov_read_float(&vf_, &pcm, max_frames - frames, &section);
        if (got == OV_HOLE) continue;
        if (got <= 0) break;

        // Planar to interleaved
        for (long i = 0; i < got; ++i) {
            for (int ch = 0; ch < channels_; ++ch) {
                buffer[(frames + i) * channels_ + ch] = pcm[ch][i];
            }
        }
        frames += static_cast<int>(got);
    }

    position_frames_ += frames;
    return frames;
}

bool VorbisDecoder::seek_frame(std::int64_t frame) {
    if (!opened_) return false;

    int result = ov_pcm_seek(&vf_, static_cast<ogg_int64_t>(frame));
    if (result != 0) {
        Logger::warn("VorbisDecoder: Seek to frame " + std::to_string(frame) + " failed (code " +
                     std::to_string(result) + ")");
        return false;
    }
    position_frames_ = frame;
    return true;
}

}  // namespace audio
