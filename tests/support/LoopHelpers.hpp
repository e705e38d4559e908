#pragma once
#include "core/EventLoop.hpp"
#include <chrono>
#include <functional>

// Runs every task that is ready now, including tasks those tasks post.
inline void drain(EventLoop& loop, int maxTurns = 1000) {
    for (int i = 0; i < maxTurns; i++)
        if (!loop.runOnce(std::chrono::milliseconds(0))) return;
}

// Keeps turning until done() or timeout; worker results count as turns.
inline bool runUntil(EventLoop& loop, const std::function<bool()>& done,
                     int timeoutMs = 2000) {
    return loop.runUntil(done, std::chrono::milliseconds(timeoutMs));
}
