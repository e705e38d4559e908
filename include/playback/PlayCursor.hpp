#pragma once
#include <atomic>
#include <cstddef>

// Frame position shared between the output callback and the loop thread.
//
// The callback reads the position at the start of a block and advances it
// with compare-exchange at the end; a seek() that lands in between wins
// and the block's advance is dropped.
class PlayCursor {
public:
    size_t position() const { return pos_.load(std::memory_order_acquire); }

    void seek(size_t frame) { pos_.store(frame, std::memory_order_release); }

    // Real-time side
    size_t beginBlock() const { return pos_.load(std::memory_order_acquire); }

    // Returns false when a seek replaced the position during the block.
    bool endBlock(size_t start, size_t advanced) {
        return pos_.compare_exchange_strong(start, start + advanced,
                                            std::memory_order_acq_rel,
                                            std::memory_order_acquire);
    }

private:
    std::atomic<size_t> pos_{0};
};
