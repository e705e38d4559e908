#include "capture/SystemAudioBackend.hpp"
#include "audio/Base64.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

SystemAudioBackend::SystemAudioBackend(EventLoop& loop,
                                       std::shared_ptr<ICaptureBridge> bridge)
    : loop_(loop), bridge_(std::move(bridge)), state_(std::make_shared<State>()) {}

bool SystemAudioBackend::isSupported() {
    if (!supported_) {
        supported_ = bridge_ && bridge_->isSupported();
        spdlog::info("System audio capture {} ({})",
                     *supported_ ? "available" : "unavailable",
                     bridge_ ? bridge_->endpoint() : "no bridge");
    }
    return *supported_;
}

void SystemAudioBackend::runNext(const std::shared_ptr<State>& state) {
    if (state->bridgeBusy || state->waiting.empty()) return;
    auto next = std::move(state->waiting.front());
    state->waiting.pop_front();
    next();
}

void SystemAudioBackend::acquire(const CaptureRequest& request, AcquireCallback cb) {
    auto* loop  = &loop_;
    auto bridge = bridge_;
    auto state  = state_;
    int seconds = static_cast<int>(std::ceil(request.maxDurationSeconds));

    if (!bridge) {
        AcquireResult result;
        result.error = {ErrorKind::UnsupportedPlatform, "no system capture bridge"};
        loop_.post([cb, result]() { cb(result); });
        return;
    }

    auto begin = [loop, bridge, state, seconds, cb]() {
        state->bridgeBusy = true;
        loop->offload([loop, bridge, state, seconds, cb]() {
            auto r = bridge->startCapture(seconds);
            loop->post([state, r, cb]() {
                AcquireResult result;
                if (r.ok) {
                    // Busy until finalize() or release() has stopped it
                    result.ok     = true;
                    result.handle = state->nextHandle++;
                    state->active.insert(result.handle);
                } else {
                    state->bridgeBusy = false;
                    result.error = r.error;
                    spdlog::warn("System capture start failed: {}", r.error.describe());
                }
                cb(result);
                runNext(state);
            });
        });
    };

    if (state->bridgeBusy) {
        spdlog::debug("System capture bridge busy, queueing start ({} waiting)",
                      state->waiting.size() + 1);
        state->waiting.push_back(std::move(begin));
        return;
    }
    begin();
}

std::optional<AudioError> SystemAudioBackend::beginStreaming(CaptureHandle handle) {
    // The bridge records from start_capture on
    if (!state_->active.count(handle))
        return AudioError{ErrorKind::DeviceUnavailable,
                          "unknown capture handle " + std::to_string(handle)};
    return std::nullopt;
}

void SystemAudioBackend::finalize(CaptureHandle handle, FinalizeCallback cb) {
    if (!state_->active.erase(handle)) {
        FinalizeResult result;
        result.error = {ErrorKind::DeviceUnavailable,
                        "unknown capture handle " + std::to_string(handle)};
        loop_.post([cb, result]() { cb(result); });
        return;
    }

    auto* loop  = &loop_;
    auto bridge = bridge_;
    auto state  = state_;
    loop_.offload([loop, bridge, state, cb]() {
        FinalizeResult result;
        auto r = bridge->stopCapture();
        if (!r.ok) {
            result.error = r.error;
        } else {
            try {
                result.bytes = base64Decode(r.payload);
                result.mime  = "audio/wav";
                result.ok    = true;
            } catch (const AudioException& e) {
                result.error = e.error();
            }
        }
        loop->post([state, cb, result]() {
            state->bridgeBusy = false;
            cb(result);
            runNext(state);
        });
    });
}

void SystemAudioBackend::release(CaptureHandle handle) {
    if (!state_->active.erase(handle)) return;

    // No abort on the bridge: stop it and drop whatever it recorded. The
    // bridge stays busy until this stop is done so it cannot hit a newer
    // capture.
    auto* loop  = &loop_;
    auto bridge = bridge_;
    auto state  = state_;
    loop_.offload([loop, bridge, state, handle]() {
        auto r = bridge->stopCapture();
        if (r.ok)
            spdlog::debug("System capture handle {} released, discarded {} base64 bytes",
                          handle, r.payload.size());
        else
            spdlog::debug("System capture handle {} release: {}", handle,
                          r.error.describe());
        loop->post([state]() {
            state->bridgeBusy = false;
            runNext(state);
        });
    });
}
