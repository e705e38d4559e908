#include "capture/CaptureSession.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cmath>

namespace {
std::atomic<uint64_t> g_nextSessionId{1};
}

CaptureSession::CaptureSession(EventLoop& loop,
                               std::shared_ptr<ICaptureBackend> backend,
                               std::shared_ptr<CaptureSlots> slots,
                               std::shared_ptr<IAudioCanonicalizer> canonicalizer,
                               const CaptureOptions& options)
    : loop_(loop), backend_(std::move(backend)), slots_(std::move(slots)),
      canonicalizer_(std::move(canonicalizer)), options_(options),
      id_(g_nextSessionId++), kind_(backend_->kind())
{
    options_.maxDurationSeconds = std::max(0.1, options_.maxDurationSeconds);
    options_.tickIntervalMs     = std::max(10, options_.tickIntervalMs);
    options_.finalizeTimeoutMs  = std::max(10, options_.finalizeTimeoutMs);
}

CaptureSession::~CaptureSession() {
    if (state_ != CaptureState::Idle && !isTerminal(state_)) {
        spdlog::debug("Capture session {} destroyed while {}, releasing",
                      id_, toString(state_));
        cancelled_ = true;
        ++opGeneration_;
    }
    clearTimers();
    releaseHandle();
    releaseSlot();
}

bool CaptureSession::isCurrent(uint64_t generation) const {
    return generation == opGeneration_ && !cancelled_;
}

void CaptureSession::transition(CaptureState next) {
    spdlog::debug("Capture session {} ({}): {} -> {}", id_, toString(kind_),
                  toString(state_), toString(next));
    state_ = next;
    if (onStateChange) onStateChange(next);
}

bool CaptureSession::start() {
    if (state_ != CaptureState::Idle) {
        spdlog::warn("Capture session {}: start() ignored in {}", id_, toString(state_));
        return false;
    }

    // Claimed on this turn, before anything async is issued
    if (!slots_->claim(kind_, id_)) {
        error_ = {ErrorKind::BackendBusy,
                  toString(kind_) + " capture already active in session " +
                  std::to_string(slots_->holder(kind_))};
        spdlog::warn("Capture session {}: {}", id_, error_.describe());
        return false;
    }
    slotHeld_ = true;

    transition(CaptureState::RequestingAccess);
    spdlog::info("Capture session {}: requesting {} access (max {:.1f}s)",
                 id_, backend_->backendName(), options_.maxDurationSeconds);

    CaptureRequest request;
    request.constraints        = options_.constraints;
    request.maxDurationSeconds = options_.maxDurationSeconds;

    uint64_t generation = ++opGeneration_;
    std::weak_ptr<CaptureSession> weak = weak_from_this();
    auto backend = backend_;
    backend_->acquire(request, [weak, generation, backend](AcquireResult result) {
        if (auto self = weak.lock()) {
            self->handleAcquired(generation, result);
        } else if (result.ok) {
            backend->release(result.handle);
        }
    });
    return true;
}

void CaptureSession::handleAcquired(uint64_t generation, const AcquireResult& result) {
    if (!isCurrent(generation)) {
        // Access granted after cancel: give the device straight back
        if (result.ok) backend_->release(result.handle);
        spdlog::debug("Capture session {}: discarded stale acquire result", id_);
        return;
    }

    if (!result.ok) {
        fail(result.error);
        return;
    }

    handle_ = result.handle;
    if (auto err = backend_->beginStreaming(handle_)) {
        fail(*err);
        return;
    }

    startedAt_ = loop_.now();
    elapsed_   = 0;
    transition(CaptureState::Recording);
    spdlog::info("Capture session {}: recording", id_);

    std::weak_ptr<CaptureSession> weak = weak_from_this();
    tickTimer_ = loop_.callEvery(std::chrono::milliseconds(options_.tickIntervalMs),
        [weak]() {
            if (auto self = weak.lock()) self->tick();
        });

    auto bound = std::chrono::milliseconds(
        static_cast<int64_t>(std::ceil(options_.maxDurationSeconds * 1000.0)));
    deadlineTimer_ = loop_.callAfter(bound, [weak]() {
        auto self = weak.lock();
        if (self && self->state_ == CaptureState::Recording) {
            spdlog::info("Capture session {}: reached {:.1f}s limit, stopping",
                         self->id_, self->options_.maxDurationSeconds);
            self->elapsed_ = self->options_.maxDurationSeconds;
            self->stop();
        }
    });
}

double CaptureSession::measureElapsed() const {
    if (!startedAt_) return 0;
    double secs = std::chrono::duration<double>(loop_.now() - *startedAt_).count();
    return std::clamp(secs, 0.0, options_.maxDurationSeconds);
}

void CaptureSession::tick() {
    if (state_ != CaptureState::Recording) return;

    // Measured against the start timestamp, never accumulated per tick
    elapsed_ = std::max(elapsed_, measureElapsed());
    if (onElapsed) onElapsed(elapsed_);

    if (elapsed_ >= options_.maxDurationSeconds) {
        spdlog::info("Capture session {}: reached {:.1f}s limit, stopping",
                     id_, options_.maxDurationSeconds);
        stop();
    }
}

bool CaptureSession::stop() {
    if (state_ != CaptureState::Recording) {
        spdlog::warn("Capture session {}: stop() ignored in {}", id_, toString(state_));
        return false;
    }

    elapsed_  = std::max(elapsed_, measureElapsed());
    duration_ = elapsed_;
    loop_.cancelTimer(tickTimer_);
    loop_.cancelTimer(deadlineTimer_);
    tickTimer_ = deadlineTimer_ = 0;

    transition(CaptureState::Stopping);
    spdlog::info("Capture session {}: stopping after {:.2f}s", id_, duration_);

    uint64_t generation = ++opGeneration_;
    std::weak_ptr<CaptureSession> weak = weak_from_this();

    finalizeTimer_ = loop_.callAfter(std::chrono::milliseconds(options_.finalizeTimeoutMs),
        [weak, generation]() {
            if (auto self = weak.lock()) self->handleFinalizeTimeout(generation);
        });

    // finalize() consumes the handle
    CaptureHandle handle = handle_;
    handle_ = 0;
    backend_->finalize(handle, [weak, generation](FinalizeResult result) {
        if (auto self = weak.lock()) self->handleFinalized(generation, result);
    });
    return true;
}

void CaptureSession::handleFinalized(uint64_t generation, const FinalizeResult& result) {
    if (!isCurrent(generation)) {
        spdlog::debug("Capture session {}: discarded stale finalize result", id_);
        return;
    }
    if (!result.ok) {
        fail(result.error);
        return;
    }

    transition(CaptureState::Finalizing);

    CapturedClip raw;
    raw.bytes = result.bytes;
    raw.mime  = result.mime;

    if (!canonicalizer_) {
        deliver(generation, std::move(raw));
        return;
    }

    auto* loop = &loop_;
    auto canonicalizer = canonicalizer_;
    std::weak_ptr<CaptureSession> weak = weak_from_this();
    loop_.offload([loop, canonicalizer, weak, generation, raw]() {
        CapturedClip clip;
        try {
            clip.bytes     = canonicalizer->convert(raw.bytes, raw.mime);
            clip.mime      = canonicalizer->canonicalMime();
            clip.canonical = true;
        } catch (const AudioException& e) {
            // EncodeFailure is recovered here: deliver what the backend gave us
            spdlog::warn("Canonicalization of {} failed ({}), delivering raw bytes",
                         raw.mime, e.what());
            clip = raw;
        }
        loop->post([weak, generation, clip]() {
            if (auto self = weak.lock()) self->deliver(generation, clip);
        });
    });
}

void CaptureSession::deliver(uint64_t generation, CapturedClip clip) {
    if (!isCurrent(generation)) {
        spdlog::debug("Capture session {}: discarded stale clip", id_);
        return;
    }

    loop_.cancelTimer(finalizeTimer_);
    finalizeTimer_ = 0;

    clip.sessionId       = id_;
    clip.durationSeconds = duration_;

    transition(CaptureState::Completed);
    releaseSlot();
    spdlog::info("Capture session {}: completed, {:.2f}s {} ({} bytes)",
                 id_, clip.durationSeconds, clip.mime, clip.bytes.size());

    if (onComplete) onComplete(clip);
}

void CaptureSession::handleFinalizeTimeout(uint64_t generation) {
    if (!isCurrent(generation)) return;
    finalizeTimer_ = 0;
    if (state_ != CaptureState::Stopping && state_ != CaptureState::Finalizing) return;

    fail({ErrorKind::FinalizeTimeout,
          "no clip within " + std::to_string(options_.finalizeTimeoutMs) + "ms of stop"});
}

bool CaptureSession::cancel() {
    switch (state_) {
        case CaptureState::Idle:
        case CaptureState::RequestingAccess:
        case CaptureState::Recording:
        case CaptureState::Stopping:
        case CaptureState::Finalizing:
            break;
        default:
            spdlog::warn("Capture session {}: cancel() ignored in {}", id_, toString(state_));
            return false;
    }

    // Flag first; every in-flight handler checks it on a later turn
    cancelled_ = true;
    ++opGeneration_;

    clearTimers();
    releaseHandle();
    transition(CaptureState::Cancelled);
    releaseSlot();
    spdlog::info("Capture session {}: cancelled", id_);
    return true;
}

void CaptureSession::fail(const AudioError& err) {
    ++opGeneration_;
    clearTimers();
    releaseHandle();

    error_ = err;
    transition(CaptureState::Error);
    releaseSlot();
    spdlog::error("Capture session {} ({}): {}", id_, toString(kind_), err.describe());

    if (onError) onError(err);
}

void CaptureSession::clearTimers() {
    loop_.cancelTimer(tickTimer_);
    loop_.cancelTimer(deadlineTimer_);
    loop_.cancelTimer(finalizeTimer_);
    tickTimer_ = deadlineTimer_ = finalizeTimer_ = 0;
}

void CaptureSession::releaseHandle() {
    if (handle_ == 0) return;
    backend_->release(handle_);
    handle_ = 0;
}

void CaptureSession::releaseSlot() {
    if (!slotHeld_) return;
    slots_->release(kind_, id_);
    slotHeld_ = false;
}

nlohmann::json CaptureSession::toJson() const {
    nlohmann::json j = {
        {"id",                   id_},
        {"backend",              toString(kind_)},
        {"state",                toString(state_)},
        {"elapsed_seconds",      elapsed_},
        {"max_duration_seconds", options_.maxDurationSeconds},
        {"cancelled",            cancelled_}
    };
    if (error_.isError())
        j["error"] = {{"kind", toString(error_.kind)}, {"message", error_.message}};
    return j;
}
