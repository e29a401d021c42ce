#include "audio/AudioDecoder.hpp"
#include "audio/MP3Decoder.hpp"
#include "audio/SndfileDecoder.hpp"
#include "audio/VorbisDecoder.hpp"
#include "util/Platform.hpp"

namespace audio {

std::unique_ptr<AudioDecoder> make_decoder(const std::filesystem::path& path) {
    auto format = listui::util::Platform::get_audio_format(path);

    if (format == "mp3") return std::make_unique<MP3Decoder>();
    if (format == "flac" || format == "wav") return std::make_unique<SndfileDecoder>();
    if (format == "ogg") return std::make_unique<VorbisDecoder>();
    return nullptr;
}

}  // namespace audio
