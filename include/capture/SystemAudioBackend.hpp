#pragma once
#include "ICaptureBackend.hpp"
#include "ICaptureBridge.hpp"
#include "core/EventLoop.hpp"
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <set>

// Whole-system audio through the native capture bridge. The bridge does
// the recording and hands back canonical WAV as base64, which finalize()
// decodes before delivery.
//
// The bridge is one shared recorder with no per-capture identity: a stop
// stops whatever is running. Bridge calls are therefore serialized. An
// acquire() issued while a start or stop is still outstanding (including
// the stop that returns an abandoned capture) waits until it finishes.
class SystemAudioBackend : public ICaptureBackend {
public:
    SystemAudioBackend(EventLoop& loop, std::shared_ptr<ICaptureBridge> bridge);

    BackendKind kind() const override { return BackendKind::System; }

    // Cached; refreshSupport() forces the next call to probe again.
    bool isSupported() override;
    void refreshSupport() { supported_.reset(); }

    void acquire(const CaptureRequest& request, AcquireCallback cb) override;
    std::optional<AudioError> beginStreaming(CaptureHandle handle) override;
    void finalize(CaptureHandle handle, FinalizeCallback cb) override;
    void release(CaptureHandle handle) override;

    std::string backendName() const override { return "system audio"; }

    size_t activeHandles() const { return state_->active.size(); }
    bool   bridgeBusy() const { return state_->bridgeBusy; }
    size_t queuedAcquires() const { return state_->waiting.size(); }

private:
    // Touched on the loop thread only
    struct State {
        std::set<CaptureHandle>           active;
        CaptureHandle                     nextHandle = 1;
        // Started, or a start/stop is in flight
        bool                              bridgeBusy = false;
        std::deque<std::function<void()>> waiting;
    };

    // Runs the next queued acquire once the bridge is idle
    static void runNext(const std::shared_ptr<State>& state);

    EventLoop&                      loop_;
    std::shared_ptr<ICaptureBridge> bridge_;
    std::shared_ptr<State>          state_;
    std::optional<bool>             supported_;
};
