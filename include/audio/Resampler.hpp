#pragma once

#include <cstddef>
#include <memory>
#include <vector>

struct SwrContext;

namespace lyre::audio {

/**
 * Resampler: planar stereo sample-rate converter for one stream.
 *
 * Built on the control thread for a fixed maximum input block; all buffers
 * (ours and libswresample's) are sized in the constructor, so process() and
 * reset() are safe on the audio thread. Uses linear interpolation between
 * the polyphase filter taps with a short filter: cheap, and plenty for music
 * at common rates.
 */
class Resampler {
    struct Private {
        explicit Private() = default;
    };

public:
    // Null (and logs) if libswresample rejects the configuration
    static std::unique_ptr<Resampler> create(int input_rate, int output_rate, size_t max_input_frames);

    Resampler(Private, SwrContext* ctx, int input_rate, int output_rate,
              size_t max_input_frames, size_t max_output_frames);
    ~Resampler();

    Resampler(const Resampler&) = delete;
    Resampler& operator=(const Resampler&) = delete;

    // Converts frames (<= max_input_frames) and returns the number of output
    // frames now in left()/right()
    size_t process(const float* left, const float* right, size_t frames);

    // Drops buffered input so the next block starts clean (after a seek)
    void reset();

    [[nodiscard]] const float* left() const { return out_left_.data(); }
    [[nodiscard]] const float* right() const { return out_right_.data(); }

    [[nodiscard]] int input_rate() const { return input_rate_; }
    [[nodiscard]] int output_rate() const { return output_rate_; }
    [[nodiscard]] size_t max_input_frames() const { return max_input_frames_; }
    [[nodiscard]] size_t max_output_frames() const { return out_left_.size(); }

private:
    SwrContext* ctx_ = nullptr;
    int input_rate_ = 0;
    int output_rate_ = 0;
    size_t max_input_frames_ = 0;
    std::vector<float> out_left_;
    std::vector<float> out_right_;
};

}  // namespace lyre::audio
