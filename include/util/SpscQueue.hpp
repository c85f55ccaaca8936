#pragma once

#include <atomic>
#include <cstddef>
#include <utility>
#include <vector>

namespace lyre::util {

/**
 * SpscQueue: bounded single-producer/single-consumer ring.
 *
 * Wait-free on both sides: try_push() and try_pop() never block, never
 * allocate and never take a lock, so either end may live on the audio
 * callback thread. One slot is kept empty to tell "full" from "empty", so
 * the ring allocates capacity + 1 slots up front.
 *
 * T must be default constructible and movable (move-only types such as
 * std::unique_ptr are fine). A popped slot is left in its moved-from state.
 */
template<typename T>
class SpscQueue {
public:
    explicit SpscQueue(size_t capacity)
        : slots_(capacity + 1) {}

    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    // Producer side. On failure the value is left untouched in the caller.
    [[nodiscard]] bool try_push(T&& value) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t next = increment(tail);
        if (next == head_.load(std::memory_order_acquire)) {
            return false;  // Full
        }
        slots_[tail] = std::move(value);
        tail_.store(next, std::memory_order_release);
        return true;
    }

    // Consumer side.
    [[nodiscard]] bool try_pop(T& out) {
        const size_t head = head_.load(std::memory_order_relaxed);
        if (head == tail_.load(std::memory_order_acquire)) {
            return false;  // Empty
        }
        out = std::move(slots_[head]);
        head_.store(increment(head), std::memory_order_release);
        return true;
    }

    // Approximate when called from a third thread; exact from either end.
    [[nodiscard]] size_t size() const {
        const size_t head = head_.load(std::memory_order_acquire);
        const size_t tail = tail_.load(std::memory_order_acquire);
        return tail >= head ? tail - head : slots_.size() - head + tail;
    }

    [[nodiscard]] bool empty() const { return size() == 0; }
    [[nodiscard]] size_t capacity() const { return slots_.size() - 1; }

private:
    size_t increment(size_t i) const {
        return i + 1 == slots_.size() ? 0 : i + 1;
    }

    std::vector<T> slots_;

    // Separate cache lines: head is written by the consumer, tail by the producer
    alignas(64) std::atomic<size_t> head_{0};
    alignas(64) std::atomic<size_t> tail_{0};
};

/**
 * Channel: the two ends of one SpscQueue, handed to different threads.
 * Producer and Consumer are non-owning views; the Channel outlives both.
 */
template<typename T>
struct Channel {
    explicit Channel(size_t capacity) : queue(capacity) {}

    class Producer {
    public:
        explicit Producer(SpscQueue<T>& q) : queue_(&q) {}
        [[nodiscard]] bool push(T&& value) { return queue_->try_push(std::move(value)); }
    private:
        SpscQueue<T>* queue_;
    };

    class Consumer {
    public:
        explicit Consumer(SpscQueue<T>& q) : queue_(&q) {}
        [[nodiscard]] bool pop(T& out) { return queue_->try_pop(out); }
    private:
        SpscQueue<T>* queue_;
    };

    Producer producer() { return Producer(queue); }
    Consumer consumer() { return Consumer(queue); }

    SpscQueue<T> queue;
};

}  // namespace lyre::util
