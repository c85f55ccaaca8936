#pragma once

#include "audio/AudioDecoder.hpp"
#include "util/SpscQueue.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace lyre::audio {

enum class ReadStatus {
    Ok,           // frames delivered, more may follow
    NotReady,     // cache ran dry (seek in flight or disk behind); play silence
    EndOfStream,  // nothing follows the frames delivered by this call
};

struct ReadResult {
    size_t frames = 0;
    ReadStatus status = ReadStatus::Ok;
};

/**
 * StreamSource: disk-streaming read-ahead cache around one decoder.
 *
 * A worker thread decodes into a fixed pool of BLOCK_COUNT blocks of
 * BLOCK_FRAMES planar stereo frames. Block indices circulate through two
 * SPSC queues: free (reader -> worker) and filled (worker -> reader).
 *
 * Threading:
 *   open(), destructor          control thread
 *   read(), seek(), position()  audio thread only; never block or allocate
 *
 * seek() bumps an epoch; the worker notices, re-seeks the decoder and tags
 * new blocks with the new epoch. The reader drops blocks with a stale epoch
 * and reports NotReady until fresh ones arrive.
 */
class StreamSource {
    // Restricts construction to open()
    struct Private {
        explicit Private() = default;
    };

public:
    static constexpr size_t BLOCK_FRAMES = 2048;
    static constexpr size_t BLOCK_COUNT = 8;
    // Blocks that must be decoded before open() returns
    static constexpr size_t READY_BLOCKS = 2;

    // Opens path and starts at start_seconds. Returns null (and logs) if the
    // file can't be decoded or isn't mono/stereo. Blocks until the cache
    // holds READY_BLOCKS or the whole file.
    static std::unique_ptr<StreamSource> open(const std::string& path, double start_seconds);

    StreamSource(Private, std::unique_ptr<AudioDecoder> decoder, std::string path);
    ~StreamSource();

    StreamSource(const StreamSource&) = delete;
    StreamSource& operator=(const StreamSource&) = delete;

    // Copies up to frames planar samples into left/right. Mono is duplicated.
    ReadResult read(float* left, float* right, size_t frames);

    // Jump to frame (clamped to the stream). Non-blocking.
    void seek(long frame);

    // Frame index of the next frame read() will return
    [[nodiscard]] long position() const { return position_; }

    [[nodiscard]] int sample_rate() const { return sample_rate_; }
    [[nodiscard]] int channels() const { return channels_; }
    [[nodiscard]] long total_frames() const { return total_frames_; }
    // 0 when the decoder can't tell
    [[nodiscard]] double duration_seconds() const;
    [[nodiscard]] const std::string& path() const { return path_; }

private:
    struct Block {
        std::array<float, BLOCK_FRAMES> left{};
        std::array<float, BLOCK_FRAMES> right{};
        size_t frames = 0;
        uint64_t epoch = 0;
        bool last = false;  // stream ends after this block
    };

    void block_until_ready();
    void worker_loop(std::stop_token stop);
    // Decodes into blocks_[index]; false when the stream ended in this block
    bool fill_block(uint8_t index, uint64_t epoch);
    void release_current();
    void wake_worker();

    std::unique_ptr<AudioDecoder> decoder_;
    std::string path_;
    int sample_rate_ = 0;
    int channels_ = 0;
    long total_frames_ = 0;

    std::unique_ptr<Block[]> blocks_;
    util::SpscQueue<uint8_t> free_{BLOCK_COUNT};
    util::SpscQueue<uint8_t> filled_{BLOCK_COUNT};

    // Worker-only decode scratch, interleaved
    std::vector<float> decode_buffer_;

    // Reader (audio thread) state
    int current_ = -1;
    size_t offset_ = 0;
    long position_ = 0;
    uint64_t epoch_ = 0;
    bool ended_ = false;

    // Cross-thread signalling
    std::atomic<uint64_t> seek_epoch_{0};
    std::atomic<long> seek_target_{0};
    std::atomic<uint32_t> wake_{0};
    std::atomic<uint32_t> progress_{0};
    std::atomic<bool> worker_idle_at_end_{false};

    std::jthread worker_;
};

}  // namespace lyre::audio
