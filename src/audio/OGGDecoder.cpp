#include "audio/OGGDecoder.hpp"
#include "util/Logger.hpp"

namespace lyre::audio {

OGGDecoder::~OGGDecoder() {
    close();
}

bool OGGDecoder::open(const std::string& filepath) {
    util::Logger::debug("OGGDecoder: Opening file: " + filepath);

    int ret = ov_fopen(filepath.c_str(), &vf_);
    if (ret < 0) {
        util::Logger::error("OGGDecoder: Failed to open OGG stream: " + filepath +
                           " (code=" + std::to_string(ret) + ")");
        return false;
    }

    vorbis_info* info = ov_info(&vf_, -1);
    if (!info) {
        util::Logger::error("OGGDecoder: Failed to get vorbis info for: " + filepath);
        ov_clear(&vf_);
        return false;
    }

    sample_rate_ = static_cast<int>(info->rate);
    channels_ = info->channels;
    ogg_int64_t total = ov_pcm_total(&vf_, -1);
    total_frames_ = total < 0 ? 0 : static_cast<long>(total);
    position_frames_ = 0;
    is_open_ = true;

    util::Logger::info("OGGDecoder: Opened - " +
                       std::to_string(sample_rate_) + "Hz, " +
                       std::to_string(channels_) + "ch, " +
                       std::to_string(total_frames_) + " frames");
    return true;
}

void OGGDecoder::close() {
    if (is_open_) {
        ov_clear(&vf_);
        is_open_ = false;
    }
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
    position_frames_ = 0;
}

int OGGDecoder::read_pcm(float* buffer, int max_frames) {
    if (!is_open_ || !buffer) return -1;

    float** pcm = nullptr;
    int bitstream = 0;
    int frames_read = 0;

    while (frames_read < max_frames) {
        long ret = ov_read_float(&vf_, &pcm, max_frames - frames_read, &bitstream);
        if (ret == OV_HOLE) {
            // Recoverable gap in the page sequence
            continue;
        }
        if (ret < 0) {
            util::Logger::error("OGGDecoder: Read error (code=" + std::to_string(ret) + ")");
            return frames_read > 0 ? frames_read : -1;
        }
        if (ret == 0) break;  // EOF

        for (long i = 0; i < ret; i++) {
            for (int ch = 0; ch < channels_; ch++) {
                buffer[(frames_read + i) * channels_ + ch] = pcm[ch][i];
            }
        }
        frames_read += static_cast<int>(ret);
    }

    position_frames_ += frames_read;
    return frames_read;
}

bool OGGDecoder::seek(long frame) {
    util::Logger::debug("OGGDecoder: Seeking to frame " + std::to_string(frame));

    if (!is_open_) return false;

    int result = ov_pcm_seek(&vf_, static_cast<ogg_int64_t>(frame));
    if (result != 0) {
        util::Logger::error("OGGDecoder: Seek failed (code=" + std::to_string(result) + ")");
        return false;
    }

    position_frames_ = frame;
    return true;
}

}  // namespace lyre::audio
