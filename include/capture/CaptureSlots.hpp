#pragma once
#include "CaptureTypes.hpp"
#include <map>
#include <mutex>

// At most one session per backend kind may hold device resources.
// Claimed in CaptureSession::start() on the same loop turn as its Idle
// check, released on every terminal transition.
class CaptureSlots {
public:
    // False if another session already holds the kind.
    bool claim(BackendKind kind, uint64_t sessionId) {
        std::lock_guard lock(mtx_);
        auto it = holders_.find(kind);
        if (it != holders_.end())
            return it->second == sessionId;
        holders_[kind] = sessionId;
        return true;
    }

    // Only the holder can release.
    void release(BackendKind kind, uint64_t sessionId) {
        std::lock_guard lock(mtx_);
        auto it = holders_.find(kind);
        if (it != holders_.end() && it->second == sessionId)
            holders_.erase(it);
    }

    // 0 when free
    uint64_t holder(BackendKind kind) const {
        std::lock_guard lock(mtx_);
        auto it = holders_.find(kind);
        return it == holders_.end() ? 0 : it->second;
    }

    bool busy(BackendKind kind) const { return holder(kind) != 0; }

private:
    mutable std::mutex mtx_;
    std::map<BackendKind, uint64_t> holders_;
};
