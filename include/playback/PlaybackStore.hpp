#pragma once
#include "PlaybackTypes.hpp"
#include <functional>
#include <map>
#include <mutex>

// Shared playback-state store. The controller writes, any number of
// observers (UI panels, headless script) read snapshots or subscribe.
// Listeners run after the lock is released, on the writer's thread.
class PlaybackStore {
public:
    using Listener   = std::function<void(const PlaybackSession&)>;
    using ListenerId = uint64_t;

    PlaybackSession snapshot() const {
        std::lock_guard lock(mtx_);
        return session_;
    }

    void update(const std::function<void(PlaybackSession&)>& mutator) {
        PlaybackSession copy;
        std::map<ListenerId, Listener> listeners;
        {
            std::lock_guard lock(mtx_);
            mutator(session_);
            copy = session_;
            listeners = listeners_;
        }
        for (auto& [id, listener] : listeners)
            listener(copy);
    }

    ListenerId subscribe(Listener listener) {
        std::lock_guard lock(mtx_);
        ListenerId id = nextId_++;
        listeners_[id] = std::move(listener);
        return id;
    }

    void unsubscribe(ListenerId id) {
        std::lock_guard lock(mtx_);
        listeners_.erase(id);
    }

private:
    mutable std::mutex             mtx_;
    PlaybackSession                session_;
    std::map<ListenerId, Listener> listeners_;
    ListenerId                     nextId_ = 1;
};
