#include "audio/M4ADecoder.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cstring>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
#include <libswresample/swresample.h>
}

namespace lyre::audio {

namespace {

std::string av_error_string(int err) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(err, errbuf, sizeof(errbuf));
    return errbuf;
}

}  // namespace

M4ADecoder::~M4ADecoder() {
    close();
}

bool M4ADecoder::open(const std::string& filepath) {
    util::Logger::debug("M4ADecoder: Opening file: " + filepath);

    int ret = avformat_open_input(&format_ctx_, filepath.c_str(), nullptr, nullptr);
    if (ret < 0) {
        util::Logger::error("M4ADecoder: Failed to open file: " + filepath + " (" + av_error_string(ret) + ")");
        return false;
    }

    ret = avformat_find_stream_info(format_ctx_, nullptr);
    if (ret < 0) {
        util::Logger::error("M4ADecoder: Failed to find stream info");
        close();
        return false;
    }

    const AVCodec* codec = nullptr;
    audio_stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
    if (audio_stream_index_ < 0 || !codec) {
        util::Logger::error("M4ADecoder: No decodable audio stream in " + filepath);
        close();
        return false;
    }

    AVStream* audio_stream = format_ctx_->streams[audio_stream_index_];

    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) {
        util::Logger::error("M4ADecoder: Failed to allocate codec context");
        close();
        return false;
    }

    ret = avcodec_parameters_to_context(codec_ctx_, audio_stream->codecpar);
    if (ret < 0) {
        util::Logger::error("M4ADecoder: Failed to copy codec parameters");
        close();
        return false;
    }

    ret = avcodec_open2(codec_ctx_, codec, nullptr);
    if (ret < 0) {
        util::Logger::error("M4ADecoder: Failed to open codec (" + av_error_string(ret) + ")");
        close();
        return false;
    }

    sample_rate_ = codec_ctx_->sample_rate;
    channels_ = codec_ctx_->ch_layout.nb_channels;

    if (audio_stream->duration != AV_NOPTS_VALUE) {
        total_frames_ = static_cast<long>(av_rescale_q(audio_stream->duration, audio_stream->time_base,
                                                       AVRational{1, sample_rate_}));
    } else if (format_ctx_->duration != AV_NOPTS_VALUE) {
        total_frames_ = static_cast<long>(av_rescale(format_ctx_->duration, sample_rate_, AV_TIME_BASE));
    } else {
        total_frames_ = 0;
    }

    AVChannelLayout out_ch_layout;
    av_channel_layout_default(&out_ch_layout, channels_);
    ret = swr_alloc_set_opts2(&swr_ctx_,
                              &out_ch_layout, AV_SAMPLE_FMT_FLT, sample_rate_,
                              &codec_ctx_->ch_layout, codec_ctx_->sample_fmt, sample_rate_,
                              0, nullptr);
    av_channel_layout_uninit(&out_ch_layout);
    if (ret < 0 || swr_init(swr_ctx_) < 0) {
        util::Logger::error("M4ADecoder: Failed to initialize sample converter");
        close();
        return false;
    }

    packet_ = av_packet_alloc();
    frame_ = av_frame_alloc();
    if (!packet_ || !frame_) {
        util::Logger::error("M4ADecoder: Failed to allocate packet/frame");
        close();
        return false;
    }

    position_frames_ = 0;
    draining_ = false;
    failed_ = false;

    util::Logger::info("M4ADecoder: Opened - " +
                       std::to_string(sample_rate_) + "Hz, " +
                       std::to_string(channels_) + "ch, " +
                       std::to_string(total_frames_) + " frames");
    return true;
}

void M4ADecoder::close() {
    residual_frames_ = 0;
    residual_offset_ = 0;

    if (frame_) av_frame_free(&frame_);
    if (packet_) av_packet_free(&packet_);
    if (swr_ctx_) swr_free(&swr_ctx_);
    if (codec_ctx_) avcodec_free_context(&codec_ctx_);
    if (format_ctx_) avformat_close_input(&format_ctx_);

    audio_stream_index_ = -1;
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
    position_frames_ = 0;
    draining_ = false;
    failed_ = false;
}

bool M4ADecoder::decode_next() {
    while (true) {
        int ret = avcodec_receive_frame(codec_ctx_, frame_);
        if (ret == 0) {
            const size_t needed = static_cast<size_t>(frame_->nb_samples) * channels_;
            if (residual_.size() < needed) {
                residual_.resize(needed);
            }
            uint8_t* out_ptr = reinterpret_cast<uint8_t*>(residual_.data());
            int converted = swr_convert(swr_ctx_, &out_ptr, frame_->nb_samples,
                                        const_cast<const uint8_t**>(frame_->extended_data),
                                        frame_->nb_samples);
            av_frame_unref(frame_);
            if (converted < 0) {
                util::Logger::error("M4ADecoder: Sample conversion failed");
                failed_ = true;
                return false;
            }
            residual_frames_ = converted;
            residual_offset_ = 0;
            if (converted > 0) return true;
            continue;
        }
        if (ret == AVERROR_EOF) {
            return false;
        }
        if (ret != AVERROR(EAGAIN)) {
            util::Logger::error("M4ADecoder: Decode error (" + av_error_string(ret) + ")");
            failed_ = true;
            return false;
        }

        // Decoder wants more input
        if (draining_) return false;

        ret = av_read_frame(format_ctx_, packet_);
        if (ret < 0) {
            // End of file: flush the decoder's remaining frames
            draining_ = true;
            avcodec_send_packet(codec_ctx_, nullptr);
            continue;
        }
        if (packet_->stream_index == audio_stream_index_) {
            ret = avcodec_send_packet(codec_ctx_, packet_);
            if (ret < 0 && ret != AVERROR(EAGAIN)) {
                util::Logger::warn("M4ADecoder: Dropping bad packet (" + av_error_string(ret) + ")");
            }
        }
        av_packet_unref(packet_);
    }
}

int M4ADecoder::read_pcm(float* buffer, int max_frames) {
    if (!format_ctx_ || !codec_ctx_ || !buffer) return -1;

    int frames_written = 0;
    while (frames_written < max_frames) {
        if (residual_frames_ == 0 && !decode_next()) {
            break;
        }
        int to_copy = std::min(residual_frames_, max_frames - frames_written);
        std::memcpy(buffer + static_cast<size_t>(frames_written) * channels_,
                    residual_.data() + static_cast<size_t>(residual_offset_) * channels_,
                    static_cast<size_t>(to_copy) * channels_ * sizeof(float));
        frames_written += to_copy;
        residual_offset_ += to_copy;
        residual_frames_ -= to_copy;
    }

    if (frames_written == 0 && failed_) {
        return -1;
    }
    position_frames_ += frames_written;
    return frames_written;
}

bool M4ADecoder::seek(long frame) {
    util::Logger::debug("M4ADecoder: Seeking to frame " + std::to_string(frame));

    if (!format_ctx_ || audio_stream_index_ < 0) return false;

    residual_frames_ = 0;
    residual_offset_ = 0;

    AVStream* stream = format_ctx_->streams[audio_stream_index_];
    int64_t timestamp = av_rescale_q(frame, AVRational{1, sample_rate_}, stream->time_base);

    int ret = av_seek_frame(format_ctx_, audio_stream_index_, timestamp, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        util::Logger::error("M4ADecoder: Seek failed (" + av_error_string(ret) + ")");
        return false;
    }

    avcodec_flush_buffers(codec_ctx_);
    draining_ = false;
    failed_ = false;
    position_frames_ = frame;
    return true;
}

}  // namespace lyre::audio
