#include "audio/PipeWireOutput.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <algorithm>
#include <cstring>

namespace lyre::audio {

namespace {

constexpr uint32_t CHANNELS = 2;

void on_process_cb(void* userdata) {
    static_cast<PipeWireOutput*>(userdata)->on_process();
}

void on_state_changed_cb(void* userdata, enum pw_stream_state old_state,
                         enum pw_stream_state new_state, const char* error) {
    static_cast<PipeWireOutput*>(userdata)->on_state_changed(old_state, new_state, error);
}

const struct pw_stream_events stream_events = {
    .version = PW_VERSION_STREAM_EVENTS,
    .destroy = nullptr,
    .state_changed = on_state_changed_cb,
    .control_info = nullptr,
    .io_changed = nullptr,
    .param_changed = nullptr,
    .add_buffer = nullptr,
    .remove_buffer = nullptr,
    .process = on_process_cb,
    .drained = nullptr,
    .command = nullptr,
    .trigger_done = nullptr,
};

}  // namespace

PipeWireOutput::PipeWireOutput(PipeWireContext& context, int sample_rate)
    : context_(context), sample_rate_(sample_rate) {}

PipeWireOutput::~PipeWireOutput() {
    stop();
}

bool PipeWireOutput::start(RenderCallback render) {
    util::Logger::debug("PipeWireOutput: Starting (" + std::to_string(sample_rate_) + "Hz, stereo)");

    if (stream_) {
        util::Logger::debug("PipeWireOutput: Already running");
        return true;
    }

    struct pw_thread_loop* loop = context_.get_loop();
    if (!loop) {
        util::Logger::error("PipeWireOutput: Context loop is null");
        return false;
    }

    render_ = std::move(render);
    failed_.store(false, std::memory_order_relaxed);

    // CRITICAL: Lock the thread loop for all PipeWire operations
    pw_thread_loop_lock(loop);

    struct pw_properties* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Playback",
        PW_KEY_MEDIA_ROLE, "Music",
        PW_KEY_APP_NAME, "lyre",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop),
        "lyre",
        props,
        &stream_events,
        this
    );

    if (!stream_) {
        util::Logger::error("PipeWireOutput: Failed to create stream");
        pw_thread_loop_unlock(loop);
        return false;
    }

    uint8_t buffer[1024];
    struct spa_pod_builder builder = SPA_POD_BUILDER_INIT(buffer, sizeof(buffer));

    struct spa_audio_info_raw info = {};
    info.format = SPA_AUDIO_FORMAT_F32;
    info.channels = CHANNELS;
    info.rate = static_cast<uint32_t>(sample_rate_);
    info.position[0] = SPA_AUDIO_CHANNEL_FL;
    info.position[1] = SPA_AUDIO_CHANNEL_FR;

    const struct spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &info);

    int result = pw_stream_connect(
        stream_,
        PW_DIRECTION_OUTPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT |
            PW_STREAM_FLAG_MAP_BUFFERS |
            PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    pw_thread_loop_unlock(loop);

    if (result < 0) {
        util::Logger::error("PipeWireOutput: Stream connect failed (result=" + std::to_string(result) + ")");
        stop();
        return false;
    }

    util::Logger::info("PipeWireOutput: Stream connected");
    return true;
}

void PipeWireOutput::stop() {
    if (!stream_) return;

    util::Logger::debug("PipeWireOutput: Stopping stream");
    struct pw_thread_loop* loop = context_.get_loop();
    if (loop) {
        pw_thread_loop_lock(loop);
        pw_stream_destroy(stream_);
        pw_thread_loop_unlock(loop);
    } else {
        pw_stream_destroy(stream_);
    }
    stream_ = nullptr;
}

// Real-time thread: no logging, no locking
void PipeWireOutput::on_process() {
    struct pw_buffer* pw_buf = pw_stream_dequeue_buffer(stream_);
    if (!pw_buf) return;

    struct spa_buffer* buf = pw_buf->buffer;
    auto* dst = static_cast<float*>(buf->datas[0].data);
    if (!dst) {
        pw_stream_queue_buffer(stream_, pw_buf);
        return;
    }

    const uint32_t stride = sizeof(float) * CHANNELS;
    uint32_t frames = buf->datas[0].maxsize / stride;
    if (pw_buf->requested > 0) {
        frames = std::min(frames, static_cast<uint32_t>(pw_buf->requested));
    }

    if (render_) {
        render_(dst, frames);
    } else {
        std::memset(dst, 0, static_cast<size_t>(frames) * stride);
    }

    buf->datas[0].chunk->offset = 0;
    buf->datas[0].chunk->stride = stride;
    buf->datas[0].chunk->size = frames * stride;

    pw_stream_queue_buffer(stream_, pw_buf);
}

// Runs on the loop thread, not the real-time one
void PipeWireOutput::on_state_changed(int old_state, int new_state, const char* error) {
    util::Logger::debug(std::string("PipeWireOutput: State ") +
                        pw_stream_state_as_string(static_cast<pw_stream_state>(old_state)) + " -> " +
                        pw_stream_state_as_string(static_cast<pw_stream_state>(new_state)));
    if (new_state == PW_STREAM_STATE_ERROR) {
        failed_.store(true, std::memory_order_relaxed);
        util::Logger::error(std::string("PipeWireOutput: Stream error: ") + (error ? error : "unknown"));
    }
}

}  // namespace lyre::audio
