#include "audio/StreamSource.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace lyre::audio {

std::unique_ptr<StreamSource> StreamSource::open(const std::string& path, double start_seconds) {
    auto decoder = create_decoder(path);
    if (!decoder) {
        return nullptr;
    }
    if (!decoder->open(path)) {
        util::Logger::error("StreamSource: Cannot open " + path);
        return nullptr;
    }

    const int channels = decoder->get_channels();
    if (channels < 1 || channels > 2) {
        util::Logger::error("StreamSource: Unsupported channel count " + std::to_string(channels) +
                            " in " + path);
        return nullptr;
    }
    if (decoder->get_sample_rate() <= 0) {
        util::Logger::error("StreamSource: Invalid sample rate in " + path);
        return nullptr;
    }

    long start_frame = 0;
    if (start_seconds > 0.0) {
        start_frame = std::lround(start_seconds * decoder->get_sample_rate());
        if (!decoder->seek(start_frame)) {
            util::Logger::warn("StreamSource: Start seek failed, playing from the beginning");
            start_frame = 0;
        }
    }

    auto source = std::make_unique<StreamSource>(Private{}, std::move(decoder), path);
    source->position_ = start_frame;
    source->worker_ = std::jthread([raw = source.get()](std::stop_token stop) {
        raw->worker_loop(std::move(stop));
    });
    source->block_until_ready();

    util::Logger::info("StreamSource: Streaming " + path + " (" +
                       std::to_string(source->sample_rate_) + "Hz, " +
                       std::to_string(source->channels_) + "ch) from frame " +
                       std::to_string(start_frame));
    return source;
}

StreamSource::StreamSource(Private, std::unique_ptr<AudioDecoder> decoder, std::string path)
    : decoder_(std::move(decoder)),
      path_(std::move(path)),
      sample_rate_(decoder_->get_sample_rate()),
      channels_(decoder_->get_channels()),
      total_frames_(decoder_->get_total_frames()),
      blocks_(std::make_unique<Block[]>(BLOCK_COUNT)),
      decode_buffer_(BLOCK_FRAMES * 2) {
    for (size_t i = 0; i < BLOCK_COUNT; ++i) {
        uint8_t index = static_cast<uint8_t>(i);
        // Capacity equals BLOCK_COUNT, cannot fail
        (void)free_.try_push(std::move(index));
    }
}

StreamSource::~StreamSource() {
    if (worker_.joinable()) {
        worker_.request_stop();
        wake_worker();
        worker_.join();
    }
    util::Logger::debug("StreamSource: Closed " + path_);
}

double StreamSource::duration_seconds() const {
    if (sample_rate_ <= 0) return 0.0;
    return static_cast<double>(total_frames_) / sample_rate_;
}

void StreamSource::block_until_ready() {
    while (true) {
        uint32_t seen = progress_.load(std::memory_order_acquire);
        if (filled_.size() >= READY_BLOCKS || worker_idle_at_end_.load(std::memory_order_acquire)) {
            return;
        }
        progress_.wait(seen, std::memory_order_acquire);
    }
}

void StreamSource::wake_worker() {
    wake_.fetch_add(1, std::memory_order_release);
    wake_.notify_one();
}

// ============================================================================
// Worker thread
// ============================================================================

bool StreamSource::fill_block(uint8_t index, uint64_t epoch) {
    Block& block = blocks_[index];
    block.frames = 0;
    block.epoch = epoch;
    block.last = false;

    while (block.frames < BLOCK_FRAMES) {
        const int wanted = static_cast<int>(BLOCK_FRAMES - block.frames);
        const int got = decoder_->read_pcm(decode_buffer_.data(), wanted);
        if (got <= 0) {
            if (got < 0) {
                util::Logger::error("StreamSource: Decode error in " + path_ + ", ending stream");
            }
            block.last = true;
            break;
        }

        const float* src = decode_buffer_.data();
        float* left = block.left.data() + block.frames;
        float* right = block.right.data() + block.frames;
        if (channels_ == 1) {
            std::copy(src, src + got, left);
            std::copy(src, src + got, right);
        } else {
            for (int i = 0; i < got; ++i) {
                left[i] = src[2 * i];
                right[i] = src[2 * i + 1];
            }
        }
        block.frames += static_cast<size_t>(got);
    }
    return !block.last;
}

void StreamSource::worker_loop(std::stop_token stop) {
    uint64_t epoch = seek_epoch_.load(std::memory_order_acquire);
    bool at_end = false;

    while (!stop.stop_requested()) {
        const uint32_t wake = wake_.load(std::memory_order_acquire);

        const uint64_t requested = seek_epoch_.load(std::memory_order_acquire);
        if (requested != epoch) {
            epoch = requested;
            const long target = seek_target_.load(std::memory_order_acquire);
            at_end = false;
            worker_idle_at_end_.store(false, std::memory_order_release);
            if (!decoder_->seek(target)) {
                util::Logger::error("StreamSource: Seek to frame " + std::to_string(target) + " failed");
                // Fall through and keep decoding from wherever the decoder is
            }
        }

        uint8_t index = 0;
        if (at_end || !free_.try_pop(index)) {
            wake_.wait(wake, std::memory_order_acquire);
            continue;
        }

        at_end = !fill_block(index, epoch);
        (void)filled_.try_push(std::move(index));

        if (at_end) {
            worker_idle_at_end_.store(true, std::memory_order_release);
        }
        progress_.fetch_add(1, std::memory_order_release);
        progress_.notify_all();
    }
}

// ============================================================================
// Audio thread
// ============================================================================

void StreamSource::release_current() {
    if (current_ >= 0) {
        uint8_t index = static_cast<uint8_t>(current_);
        (void)free_.try_push(std::move(index));
        current_ = -1;
        offset_ = 0;
        wake_worker();
    }
}

ReadResult StreamSource::read(float* left, float* right, size_t frames) {
    if (ended_) {
        return {0, ReadStatus::EndOfStream};
    }

    size_t done = 0;
    while (done < frames) {
        if (current_ < 0) {
            uint8_t index = 0;
            if (!filled_.try_pop(index)) {
                return {done, done > 0 ? ReadStatus::Ok : ReadStatus::NotReady};
            }
            if (blocks_[index].epoch != epoch_) {
                // Decoded before the last seek
                (void)free_.try_push(std::move(index));
                wake_worker();
                continue;
            }
            current_ = index;
            offset_ = 0;
        }

        const Block& block = blocks_[current_];
        const size_t n = std::min(frames - done, block.frames - offset_);
        std::copy_n(block.left.data() + offset_, n, left + done);
        std::copy_n(block.right.data() + offset_, n, right + done);
        offset_ += n;
        done += n;
        position_ += static_cast<long>(n);

        if (offset_ == block.frames) {
            const bool last = block.last;
            release_current();
            if (last) {
                ended_ = true;
                return {done, ReadStatus::EndOfStream};
            }
        }
    }
    return {done, ReadStatus::Ok};
}

void StreamSource::seek(long frame) {
    frame = std::max(0L, frame);
    if (total_frames_ > 0) {
        frame = std::min(frame, total_frames_);
    }

    release_current();
    ended_ = false;
    position_ = frame;
    ++epoch_;

    seek_target_.store(frame, std::memory_order_relaxed);
    seek_epoch_.store(epoch_, std::memory_order_release);
    wake_worker();
}

}  // namespace lyre::audio
