#pragma once

#include <cstddef>
#include <functional>

namespace lyre::audio {

/// A device stream that pulls interleaved stereo float from a render
/// callback on its own real-time thread.
class AudioOutput {
public:
    using RenderCallback = std::function<void(float* data, size_t frames)>;

    virtual ~AudioOutput() = default;

    // Opens the device and starts calling render. False if unavailable.
    virtual bool start(RenderCallback render) = 0;
    // Stops callbacks; render is never called after this returns
    virtual void stop() = 0;

    [[nodiscard]] virtual int sample_rate() const = 0;
    [[nodiscard]] virtual bool is_running() const = 0;
};

}  // namespace lyre::audio
