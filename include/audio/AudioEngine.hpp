#pragma once

#include "audio/Messages.hpp"
#include "util/SpscQueue.hpp"
#include <array>
#include <cstddef>

namespace lyre::audio {

/**
 * AudioEngine: the real-time render callback.
 *
 * process() runs on the device thread. It never allocates, locks, logs or
 * blocks: commands arrive on a lock-free channel, timing and end-of-stream
 * reports leave on another, and a replaced Voice is sent back for the
 * control thread to destroy.
 *
 * Output is interleaved stereo float at output_rate.
 */
class AudioEngine {
public:
    static constexpr size_t CHANNELS = 2;
    // Retired voices held when the report channel is full. While every slot
    // is taken, process() stops taking commands.
    static constexpr size_t RETIRED_BACKLOG = 4;

    AudioEngine(util::Channel<ToProcess>::Consumer commands,
                util::Channel<FromProcess>::Producer reports,
                int output_rate);

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    void process(float* data, size_t frames);

    // Gain curve: perceived loudness tracks the cube of the linear setting
    [[nodiscard]] static float amplitude(float gain) { return gain * gain * gain; }

    [[nodiscard]] int output_rate() const { return output_rate_; }

private:
    void handle(ToProcess& message);
    void adopt(UseStream& message);
    void seek(double seconds);
    void retire(VoicePtr voice);
    [[nodiscard]] bool has_backlog_room() const;
    void flush_pending();
    void report_playhead();
    // Decodes (and resamples) one source block into the fan-out buffer
    ReadStatus refill();

    util::Channel<ToProcess>::Consumer commands_;
    util::Channel<FromProcess>::Producer reports_;
    int output_rate_;

    VoicePtr voice_;
    PlaybackStatus status_ = PlaybackStatus::Paused;
    float gain_ = 1.0f;
    bool done_ = false;
    bool done_pending_ = false;
    uint64_t done_generation_ = 0;

    std::array<VoicePtr, RETIRED_BACKLOG> backlog_;
};

}  // namespace lyre::audio
