#include "audio/Resampler.hpp"
#include "util/Logger.hpp"

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/mathematics.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
}

namespace lyre::audio {

namespace {

// Taps per phase; libswresample's default is 32
constexpr int FILTER_SIZE = 8;
// Headroom for frames the filter holds back and releases later
constexpr size_t OUTPUT_SLACK = 64;

}  // namespace

std::unique_ptr<Resampler> Resampler::create(int input_rate, int output_rate, size_t max_input_frames) {
    if (input_rate <= 0 || output_rate <= 0 || max_input_frames == 0) {
        util::Logger::error("Resampler: Invalid configuration " + std::to_string(input_rate) +
                            " -> " + std::to_string(output_rate));
        return nullptr;
    }

    SwrContext* ctx = nullptr;
    AVChannelLayout stereo = AV_CHANNEL_LAYOUT_STEREO;
    int ret = swr_alloc_set_opts2(&ctx,
                                  &stereo, AV_SAMPLE_FMT_FLTP, output_rate,
                                  &stereo, AV_SAMPLE_FMT_FLTP, input_rate,
                                  0, nullptr);
    if (ret < 0 || !ctx) {
        util::Logger::error("Resampler: swr_alloc_set_opts2 failed");
        swr_free(&ctx);
        return nullptr;
    }

    av_opt_set_int(ctx, "linear_interp", 1, 0);
    av_opt_set_int(ctx, "filter_size", FILTER_SIZE, 0);

    if (swr_init(ctx) < 0) {
        util::Logger::error("Resampler: swr_init failed");
        swr_free(&ctx);
        return nullptr;
    }

    const size_t max_output = static_cast<size_t>(
        av_rescale_rnd(static_cast<int64_t>(max_input_frames), output_rate, input_rate, AV_ROUND_UP)) +
        OUTPUT_SLACK;

    util::Logger::info("Resampler: " + std::to_string(input_rate) + "Hz -> " +
                       std::to_string(output_rate) + "Hz");
    return std::make_unique<Resampler>(Private{}, ctx, input_rate, output_rate,
                                       max_input_frames, max_output);
}

Resampler::Resampler(Private, SwrContext* ctx, int input_rate, int output_rate,
                     size_t max_input_frames, size_t max_output_frames)
    : ctx_(ctx),
      input_rate_(input_rate),
      output_rate_(output_rate),
      max_input_frames_(max_input_frames),
      out_left_(max_output_frames),
      out_right_(max_output_frames) {
    // Run one full block of silence through so libswresample sizes its
    // internal buffers now, on the control thread
    std::vector<float> silence(max_input_frames_, 0.0f);
    process(silence.data(), silence.data(), max_input_frames_);
    reset();
}

Resampler::~Resampler() {
    swr_free(&ctx_);
}

size_t Resampler::process(const float* left, const float* right, size_t frames) {
    if (frames > max_input_frames_) {
        frames = max_input_frames_;
    }

    const uint8_t* in[2] = {
        reinterpret_cast<const uint8_t*>(left),
        reinterpret_cast<const uint8_t*>(right),
    };
    uint8_t* out[2] = {
        reinterpret_cast<uint8_t*>(out_left_.data()),
        reinterpret_cast<uint8_t*>(out_right_.data()),
    };

    int converted = swr_convert(ctx_, out, static_cast<int>(out_left_.size()),
                                in, static_cast<int>(frames));
    return converted > 0 ? static_cast<size_t>(converted) : 0;
}

void Resampler::reset() {
    // Output still owed for input fed before the seek
    const int64_t delay = swr_get_delay(ctx_, output_rate_);
    if (delay > 0) {
        swr_drop_output(ctx_, static_cast<int>(delay));
    }
}

}  // namespace lyre::audio
