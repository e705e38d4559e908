#pragma once
#include <algorithm>
#include <atomic>
#include <cstring>
#include <vector>

// Lock-free single-producer single-consumer sample FIFO.
// Producer: device callback thread (no allocs, no locks).
// Consumer: the event loop, draining once per capture tick.
// When the consumer falls behind, new samples are dropped and counted.
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity = 8192)
        : buf_(capacity), capacity_(capacity) {}

    size_t write(const float* data, size_t count) {
        size_t wr = writePos_.load(std::memory_order_relaxed);
        size_t rd = readPos_.load(std::memory_order_acquire);

        size_t space   = capacity_ - (wr - rd);
        size_t toWrite = std::min(count, space);
        if (toWrite < count)
            dropped_.fetch_add(count - toWrite, std::memory_order_relaxed);
        if (toWrite == 0) return 0;

        size_t idx   = wr % capacity_;
        size_t first = std::min(toWrite, capacity_ - idx);
        std::memcpy(&buf_[idx], data, first * sizeof(float));
        if (toWrite > first)
            std::memcpy(&buf_[0], data + first, (toWrite - first) * sizeof(float));

        writePos_.store(wr + toWrite, std::memory_order_release);
        return toWrite;
    }

    // Appends up to maxCount samples to out.
    size_t readInto(std::vector<float>& out, size_t maxCount) {
        size_t rd = readPos_.load(std::memory_order_relaxed);
        size_t wr = writePos_.load(std::memory_order_acquire);

        size_t toRead = std::min(maxCount, wr - rd);
        if (toRead == 0) return 0;

        size_t base  = out.size();
        out.resize(base + toRead);
        size_t idx   = rd % capacity_;
        size_t first = std::min(toRead, capacity_ - idx);
        std::memcpy(&out[base], &buf_[idx], first * sizeof(float));
        if (toRead > first)
            std::memcpy(&out[base + first], &buf_[0], (toRead - first) * sizeof(float));

        readPos_.store(rd + toRead, std::memory_order_release);
        return toRead;
    }

    size_t available() const {
        return writePos_.load(std::memory_order_acquire)
             - readPos_.load(std::memory_order_relaxed);
    }

    size_t capacity() const { return capacity_; }

    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    // Only safe while the producer is stopped
    void reset() {
        writePos_.store(0, std::memory_order_relaxed);
        readPos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<float>  buf_;
    size_t              capacity_;
    std::atomic<size_t> writePos_{0};
    std::atomic<size_t> readPos_{0};
    std::atomic<size_t> dropped_{0};
};
