#pragma once

#include "audio/Resampler.hpp"
#include "audio/StreamSource.hpp"
#include <cstdint>
#include <memory>
#include <variant>
#include <vector>

namespace lyre::audio {

enum class PlaybackStatus {
    Paused,
    Play,
};

[[nodiscard]] inline PlaybackStatus toggle(PlaybackStatus status) {
    return status == PlaybackStatus::Play ? PlaybackStatus::Paused : PlaybackStatus::Play;
}

/// Voice: everything the engine needs to render one stream.
///
/// Built and sized on the control thread, owned by the engine while live,
/// and handed back through FromProcess::Retired so that it is destroyed
/// (worker join, buffer frees) off the audio thread.
struct Voice {
    std::unique_ptr<StreamSource> source;
    std::unique_ptr<Resampler> resampler;  // null when rates match

    // Stamped on every report about this voice so the control thread can
    // drop reports that were in flight when it switched tracks
    uint64_t generation = 0;

    // Planar block read from the source
    std::vector<float> left;
    std::vector<float> right;

    // Interleaved stereo at the output rate, not yet copied to the device
    std::vector<float> fanout;
    size_t fanout_pos = 0;  // frames
    size_t fanout_len = 0;  // frames

    // Allocates scratch for source (and resampler, if any)
    static std::unique_ptr<Voice> make(std::unique_ptr<StreamSource> source,
                                       std::unique_ptr<Resampler> resampler);
};

using VoicePtr = std::unique_ptr<Voice>;

// Control -> engine

struct UseStream {
    VoicePtr voice;
    PlaybackStatus status = PlaybackStatus::Play;
};

struct SetStatus {
    PlaybackStatus status;
};

// Linear 0..1; the engine applies the cubic curve
struct SetVolume {
    float gain;
};

struct SeekTo {
    double seconds;
};

using ToProcess = std::variant<std::monostate, UseStream, SetStatus, SetVolume, SeekTo>;

// Engine -> control

struct Playhead {
    double seconds;
    uint64_t generation;
};

struct IsDone {
    uint64_t generation;
};

struct Retired {
    VoicePtr voice;
};

using FromProcess = std::variant<std::monostate, Playhead, IsDone, Retired>;

}  // namespace lyre::audio
