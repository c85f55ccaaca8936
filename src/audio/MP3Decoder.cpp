#include "audio/MP3Decoder.hpp"
#include "util/Logger.hpp"
#include <mutex>

namespace lyre::audio {

namespace {

// mpg123_init() is process-wide; never paired with mpg123_exit() per
// instance since other handles may still be live
void init_library() {
    static std::once_flag flag;
    std::call_once(flag, [] { mpg123_init(); });
}

}  // namespace

MP3Decoder::MP3Decoder() {
    init_library();
    int err = MPG123_OK;
    handle_ = mpg123_new(nullptr, &err);
    if (!handle_) {
        util::Logger::error("MP3Decoder: mpg123_new failed: " + std::string(mpg123_plain_strerror(err)));
    }
}

MP3Decoder::~MP3Decoder() {
    close();
    if (handle_) {
        mpg123_delete(handle_);
        handle_ = nullptr;
    }
}

bool MP3Decoder::open(const std::string& filepath) {
    util::Logger::debug("MP3Decoder: Opening file: " + filepath);

    if (!handle_) {
        util::Logger::error("MP3Decoder: Handle is null");
        return false;
    }

    // Accept every rate, but only float output. Must be set before open so
    // the first decoded frame already arrives as float.
    mpg123_format_none(handle_);
    const long* rates = nullptr;
    size_t rate_count = 0;
    mpg123_rates(&rates, &rate_count);
    for (size_t i = 0; i < rate_count; ++i) {
        mpg123_format(handle_, rates[i], MPG123_MONO | MPG123_STEREO, MPG123_ENC_FLOAT_32);
    }

    if (mpg123_open(handle_, filepath.c_str()) != MPG123_OK) {
        util::Logger::error("MP3Decoder: Failed to open file: " + filepath +
                           " (error: " + std::string(mpg123_strerror(handle_)) + ")");
        return false;
    }

    long rate = 0;
    int channels = 0, encoding = 0;
    if (mpg123_getformat(handle_, &rate, &channels, &encoding) != MPG123_OK) {
        util::Logger::error("MP3Decoder: Failed to get format for: " + filepath);
        mpg123_close(handle_);
        return false;
    }

    sample_rate_ = static_cast<int>(rate);
    channels_ = channels;

    off_t length = mpg123_length(handle_);
    total_frames_ = (length == MPG123_ERR) ? 0 : static_cast<long>(length);
    position_frames_ = 0;
    open_ = true;

    util::Logger::info("MP3Decoder: Opened - " +
                       std::to_string(sample_rate_) + "Hz, " +
                       std::to_string(channels_) + "ch, " +
                       std::to_string(total_frames_) + " frames");
    return true;
}

void MP3Decoder::close() {
    if (handle_ && open_) {
        mpg123_close(handle_);
    }
    open_ = false;
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
    position_frames_ = 0;
}

int MP3Decoder::read_pcm(float* buffer, int max_frames) {
    if (!open_ || !buffer || channels_ == 0) return -1;

    const size_t bytes_wanted = static_cast<size_t>(max_frames) * channels_ * sizeof(float);
    size_t bytes_read = 0;

    int result = mpg123_read(handle_, reinterpret_cast<unsigned char*>(buffer),
                             bytes_wanted, &bytes_read);

    if (result == MPG123_NEW_FORMAT) {
        // Only rate/channel changes land here since the encoding is pinned
        long rate = 0;
        int channels = 0, encoding = 0;
        mpg123_getformat(handle_, &rate, &channels, &encoding);
        if (rate != sample_rate_ || channels != channels_) {
            util::Logger::error("MP3Decoder: Format changed mid-stream, stopping");
            return -1;
        }
        result = mpg123_read(handle_, reinterpret_cast<unsigned char*>(buffer),
                             bytes_wanted, &bytes_read);
    }

    // CRITICAL: check for errors before touching data, partial reads on error are garbage
    if (result == MPG123_ERR) {
        util::Logger::error("MP3Decoder: Read error: " + std::string(mpg123_strerror(handle_)));
        return -1;
    }

    if (result == MPG123_DONE && bytes_read == 0) {
        return 0;
    }

    int frames_read = static_cast<int>(bytes_read / (sizeof(float) * channels_));
    position_frames_ += frames_read;
    return frames_read;
}

bool MP3Decoder::seek(long frame) {
    util::Logger::debug("MP3Decoder: Seeking to frame " + std::to_string(frame));

    if (!open_) return false;

    off_t result = mpg123_seek(handle_, static_cast<off_t>(frame), SEEK_SET);
    if (result < 0) {
        util::Logger::error("MP3Decoder: Seek failed to frame " + std::to_string(frame));
        return false;
    }

    position_frames_ = static_cast<long>(result);
    return true;
}

}  // namespace lyre::audio
