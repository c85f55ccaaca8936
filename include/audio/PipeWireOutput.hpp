#pragma once

#include "audio/AudioOutput.hpp"
#include "audio/PipeWireContext.hpp"
#include <atomic>

struct pw_stream;

namespace lyre::audio {

/**
 * PipeWireOutput: pull-model PipeWire playback stream.
 *
 * PipeWire calls on_process() on its real-time thread whenever it wants a
 * buffer; we fill it through the render callback. Stream setup and teardown
 * happen under the thread-loop lock.
 */
class PipeWireOutput : public AudioOutput {
public:
    PipeWireOutput(PipeWireContext& context, int sample_rate);
    ~PipeWireOutput() override;

    PipeWireOutput(const PipeWireOutput&) = delete;
    PipeWireOutput& operator=(const PipeWireOutput&) = delete;

    bool start(RenderCallback render) override;
    void stop() override;

    [[nodiscard]] int sample_rate() const override { return sample_rate_; }
    [[nodiscard]] bool is_running() const override {
        return stream_ != nullptr && !failed_.load(std::memory_order_relaxed);
    }

    // Stream event trampoline target
    void on_process();
    void on_state_changed(int old_state, int new_state, const char* error);

private:
    PipeWireContext& context_;
    int sample_rate_;
    RenderCallback render_;
    struct pw_stream* stream_ = nullptr;
    std::atomic<bool> failed_{false};
};

}  // namespace lyre::audio
