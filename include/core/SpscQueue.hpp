#pragma once

#include <atomic>
#include <array>
#include <optional>
#include <cstddef>
#include <cstdint>

namespace core {

/**
 * Single-Producer-Single-Consumer (SPSC) lock-free ring buffer.
 * Carries pose input from the OSC receive thread to the processing thread,
 * and posture updates from the processing thread to the OSC send thread.
 *
 * Head and tail are free-running counters; the slot index is counter & mask.
 * A push into a full queue fails and is counted in droppedCount().
 *
 * @tparam T Element type (moved in and out)
 * @tparam Capacity Number of slots, must be a power of two
 */
template<typename T, size_t Capacity>
class SpscQueue {
    static_assert(Capacity >= 2 && (Capacity & (Capacity - 1)) == 0,
                  "SpscQueue capacity must be a power of two");

public:
    SpscQueue() : head_(0), tail_(0), dropped_(0) {}

    // Non-copyable
    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    /**
     * Producer side. Returns false (and counts a drop) if the queue is full.
     */
    bool try_push(T item) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail - head_.load(std::memory_order_acquire) >= Capacity) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        buffer_[tail & MASK] = std::move(item);
        tail_.store(tail + 1, std::memory_order_release);
        return true;
    }

    /**
     * Consumer side. Returns std::nullopt if empty.
     */
    std::optional<T> try_pop() {
        const size_t head = head_.load(std::memory_order_relaxed);
        if (head == tail_.load(std::memory_order_acquire)) {
            return std::nullopt;
        }

        T item = std::move(buffer_[head & MASK]);
        head_.store(head + 1, std::memory_order_release);
        return item;
    }

    /**
     * Consumer side. Moves the front item into `item`; false if empty.
     */
    bool pop_front(T& item) {
        auto val = try_pop();
        if (val) {
            item = std::move(*val);
            return true;
        }
        return false;
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    bool full() const {
        return size() >= Capacity;
    }

    size_t size() const {
        const size_t tail = tail_.load(std::memory_order_acquire);
        const size_t head = head_.load(std::memory_order_acquire);
        return tail - head;
    }

    static constexpr size_t capacity() { return Capacity; }

    uint64_t droppedCount() const { return dropped_.load(std::memory_order_relaxed); }

private:
    static constexpr size_t MASK = Capacity - 1;
    static constexpr size_t CACHE_LINE_SIZE = 64;

    // Separate cache lines so producer and consumer don't false-share
    alignas(CACHE_LINE_SIZE) std::atomic<size_t> head_;
    alignas(CACHE_LINE_SIZE) std::atomic<size_t> tail_;
    alignas(CACHE_LINE_SIZE) std::atomic<uint64_t> dropped_;

    std::array<T, Capacity> buffer_;
};

} // namespace core
