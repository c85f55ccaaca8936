#pragma once

struct pw_thread_loop;

namespace lyre::audio {

// Owns the PipeWire thread loop shared by all streams of the process
class PipeWireContext {
public:
    PipeWireContext() = default;
    ~PipeWireContext();

    PipeWireContext(const PipeWireContext&) = delete;
    PipeWireContext& operator=(const PipeWireContext&) = delete;

    [[nodiscard]] bool init();
    [[nodiscard]] struct pw_thread_loop* get_loop() const { return loop_; }

private:
    struct pw_thread_loop* loop_ = nullptr;
};

}  // namespace lyre::audio
