#include "audio/AudioDecoder.hpp"
#include "audio/M4ADecoder.hpp"
#include "audio/MP3Decoder.hpp"
#include "audio/OGGDecoder.hpp"
#include "audio/SndfileDecoder.hpp"
#include "model/Track.hpp"
#include "util/Logger.hpp"

namespace lyre::audio {

std::unique_ptr<AudioDecoder> create_decoder(const std::string& filepath) {
    switch (model::detect_format(filepath)) {
        case model::AudioFormat::MP3:
            return std::make_unique<MP3Decoder>();
        case model::AudioFormat::FLAC:
        case model::AudioFormat::WAV:
            return std::make_unique<SndfileDecoder>();
        case model::AudioFormat::OGG:
            return std::make_unique<OGGDecoder>();
        case model::AudioFormat::M4A:
            return std::make_unique<M4ADecoder>();
        case model::AudioFormat::Unknown:
            break;
    }
    util::Logger::warn("AudioDecoder: Unsupported format: " + filepath);
    return nullptr;
}

}  // namespace lyre::audio
