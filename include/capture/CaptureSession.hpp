#pragma once
#include "CaptureSlots.hpp"
#include "CaptureTypes.hpp"
#include "ICaptureBackend.hpp"
#include "audio/AudioCanonicalizer.hpp"
#include "core/EventLoop.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>

// One bounded recording attempt against a single backend.
//
//   Idle → RequestingAccess → Recording → Stopping → Finalizing → Completed
//   Idle / RequestingAccess / Recording / Stopping / Finalizing → Cancelled
//   RequestingAccess / Recording / Stopping / Finalizing → Error
//
// Every asynchronous step is tagged with the operation generation current
// when it was issued. cancel(), failures and the finalize timeout bump the
// generation on the caller's turn, so a completion that arrives later sees
// a mismatch and is dropped: no clip is ever delivered after cancel().
//
// Must be owned by a std::shared_ptr (CaptureService::createSession);
// async completions hold only a weak reference.
class CaptureSession : public std::enable_shared_from_this<CaptureSession> {
public:
    CaptureSession(EventLoop& loop,
                   std::shared_ptr<ICaptureBackend> backend,
                   std::shared_ptr<CaptureSlots> slots,
                   std::shared_ptr<IAudioCanonicalizer> canonicalizer,
                   const CaptureOptions& options);
    ~CaptureSession();

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    // Commands return false (and log) when invalid in the current state.
    bool start();
    bool stop();
    bool cancel();

    uint64_t     id() const { return id_; }
    BackendKind  kind() const { return kind_; }
    CaptureState state() const { return state_; }
    double       elapsedSeconds() const { return elapsed_; }
    double       maxDurationSeconds() const { return options_.maxDurationSeconds; }
    bool         cancelled() const { return cancelled_; }
    const AudioError& error() const { return error_; }
    std::optional<EventLoop::Clock::time_point> startedAt() const { return startedAt_; }

    nlohmann::json toJson() const;

    // Observers, invoked on the loop thread
    std::function<void(CaptureState)>        onStateChange;
    std::function<void(double)>              onElapsed;
    std::function<void(const CapturedClip&)> onComplete;
    std::function<void(const AudioError&)>   onError;

private:
    void transition(CaptureState next);
    void handleAcquired(uint64_t generation, const AcquireResult& result);
    void handleFinalized(uint64_t generation, const FinalizeResult& result);
    void deliver(uint64_t generation, CapturedClip clip);
    void handleFinalizeTimeout(uint64_t generation);
    void tick();
    void fail(const AudioError& err);

    double measureElapsed() const;
    void   clearTimers();
    void   releaseHandle();
    void   releaseSlot();
    bool   isCurrent(uint64_t generation) const;

    EventLoop&                           loop_;
    std::shared_ptr<ICaptureBackend>     backend_;
    std::shared_ptr<CaptureSlots>        slots_;
    std::shared_ptr<IAudioCanonicalizer> canonicalizer_;
    CaptureOptions                       options_;

    uint64_t     id_;
    BackendKind  kind_;
    CaptureState state_ = CaptureState::Idle;
    AudioError   error_;
    bool         cancelled_    = false;
    bool         slotHeld_     = false;
    uint64_t     opGeneration_ = 0;

    CaptureHandle handle_ = 0;
    std::optional<EventLoop::Clock::time_point> startedAt_;
    double elapsed_  = 0;
    double duration_ = 0;

    EventLoop::TimerId tickTimer_     = 0;
    EventLoop::TimerId deadlineTimer_ = 0;
    EventLoop::TimerId finalizeTimer_ = 0;
};
