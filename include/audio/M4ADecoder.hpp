#pragma once

#include "AudioDecoder.hpp"
#include <vector>

// Forward declarations for FFmpeg types
struct AVFormatContext;
struct AVCodecContext;
struct AVPacket;
struct AVFrame;
struct SwrContext;

namespace lyre::audio {

// AAC/ALAC in MP4 containers through FFmpeg. libswresample only converts the
// sample layout here (planar -> interleaved float), never the rate.
class M4ADecoder : public AudioDecoder {
public:
    M4ADecoder() = default;
    ~M4ADecoder() override;

    M4ADecoder(const M4ADecoder&) = delete;
    M4ADecoder& operator=(const M4ADecoder&) = delete;

    [[nodiscard]] bool open(const std::string& filepath) override;
    void close() override;

    [[nodiscard]] int read_pcm(float* buffer, int max_frames) override;

    [[nodiscard]] int get_sample_rate() const override { return sample_rate_; }
    [[nodiscard]] int get_channels() const override { return channels_; }
    [[nodiscard]] long get_total_frames() const override { return total_frames_; }
    [[nodiscard]] long get_position_frames() const override { return position_frames_; }

    [[nodiscard]] bool seek(long frame) override;
    [[nodiscard]] bool is_open() const override { return format_ctx_ != nullptr; }

private:
    // Decodes the next frame into residual_. False at end of stream or error.
    bool decode_next();

    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVPacket* packet_ = nullptr;
    AVFrame* frame_ = nullptr;
    SwrContext* swr_ctx_ = nullptr;

    int audio_stream_index_ = -1;
    int sample_rate_ = 0;
    int channels_ = 0;
    long total_frames_ = 0;
    long position_frames_ = 0;
    bool draining_ = false;
    bool failed_ = false;

    // Converted frames not yet handed out. Grows to the largest codec frame
    // and is then reused.
    std::vector<float> residual_;
    int residual_frames_ = 0;
    int residual_offset_ = 0;
};

}  // namespace lyre::audio
