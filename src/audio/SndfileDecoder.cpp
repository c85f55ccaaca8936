#include "audio/SndfileDecoder.hpp"
#include "util/Logger.hpp"

namespace lyre::audio {

SndfileDecoder::~SndfileDecoder() {
    close();
}

bool SndfileDecoder::open(const std::string& filepath) {
    util::Logger::debug("SndfileDecoder: Opening file: " + filepath);

    info_ = SF_INFO{};
    file_ = sf_open(filepath.c_str(), SFM_READ, &info_);
    if (!file_) {
        util::Logger::error("SndfileDecoder: Failed to open " + filepath + ": " + sf_strerror(nullptr));
        info_ = SF_INFO{};
        return false;
    }

    position_frames_ = 0;

    util::Logger::info("SndfileDecoder: Opened - " +
                       std::to_string(info_.samplerate) + "Hz, " +
                       std::to_string(info_.channels) + "ch, " +
                       std::to_string(info_.frames) + " frames");
    return true;
}

void SndfileDecoder::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
    info_ = SF_INFO{};
    position_frames_ = 0;
}

int SndfileDecoder::read_pcm(float* buffer, int max_frames) {
    if (!file_ || !buffer) return -1;

    sf_count_t frames_read = sf_readf_float(file_, buffer, max_frames);
    if (frames_read == 0 && sf_error(file_) != SF_ERR_NO_ERROR) {
        util::Logger::error(std::string("SndfileDecoder: Read error: ") + sf_strerror(file_));
        return -1;
    }

    position_frames_ += static_cast<long>(frames_read);
    return static_cast<int>(frames_read);
}

bool SndfileDecoder::seek(long frame) {
    util::Logger::debug("SndfileDecoder: Seeking to frame " + std::to_string(frame));

    if (!file_) return false;

    sf_count_t result = sf_seek(file_, static_cast<sf_count_t>(frame), SEEK_SET);
    if (result < 0) {
        util::Logger::error("SndfileDecoder: Seek failed to frame " + std::to_string(frame));
        return false;
    }

    position_frames_ = static_cast<long>(result);
    return true;
}

}  // namespace lyre::audio
