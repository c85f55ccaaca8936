#pragma once

#include <memory>
#include <string>

namespace lyre::audio {

/// Pull-based PCM source for one file. Decoders run on the read-ahead
/// worker thread, never on the audio callback, so they may log and allocate.
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;

    virtual bool open(const std::string& filepath) = 0;
    virtual void close() = 0;

    // Interleaved float samples. Returns frames read, 0 at end of stream,
    // negative on a decode error.
    virtual int read_pcm(float* buffer, int max_frames) = 0;

    virtual int get_sample_rate() const = 0;
    virtual int get_channels() const = 0;
    virtual long get_total_frames() const = 0;
    virtual long get_position_frames() const = 0;

    virtual bool seek(long frame) = 0;
    virtual bool is_open() const = 0;

    double get_duration_seconds() const {
        if (get_sample_rate() == 0) return 0.0;
        return static_cast<double>(get_total_frames()) / get_sample_rate();
    }
};

// Picks a decoder by file extension. Null for unsupported formats.
std::unique_ptr<AudioDecoder> create_decoder(const std::string& filepath);

}  // namespace lyre::audio
