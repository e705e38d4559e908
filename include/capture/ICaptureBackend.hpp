#pragma once
#include "CaptureTypes.hpp"
#include <functional>
#include <optional>
#include <string>

// Capability contract shared by the local microphone and the native
// system-audio bridge.
//
// acquire() and finalize() complete asynchronously: their callbacks are
// always posted to the event loop, never invoked from inside the call.
// Handles are owned by the backend until finalize() consumes them or
// release() drops them.
class ICaptureBackend {
public:
    virtual ~ICaptureBackend() = default;

    using AcquireCallback  = std::function<void(AcquireResult)>;
    using FinalizeCallback = std::function<void(FinalizeResult)>;

    virtual BackendKind kind() const = 0;

    // Runtime capability probe; must be checked before the backend is offered.
    virtual bool isSupported() = 0;

    virtual void acquire(const CaptureRequest& request, AcquireCallback cb) = 0;

    // Synchronous; an error leaves the handle acquired (caller releases).
    virtual std::optional<AudioError> beginStreaming(CaptureHandle handle) = 0;

    // Stops the stream and delivers (rawBytes, mime). Consumes the handle.
    virtual void finalize(CaptureHandle handle, FinalizeCallback cb) = 0;

    // Immediate release of device/stream resources; buffered audio is
    // discarded. Idempotent, unknown handles are ignored.
    virtual void release(CaptureHandle handle) = 0;

    virtual std::string backendName() const = 0;
};
