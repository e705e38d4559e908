#pragma once
#include "CaptureSession.hpp"
#include "CaptureSlots.hpp"
#include "ICaptureBackend.hpp"
#include "audio/AudioCanonicalizer.hpp"
#include "core/EventLoop.hpp"
#include <map>
#include <memory>
#include <vector>

// Owns the capture backends and the per-kind slot table and hands out
// sessions. A backend is only offered once its isSupported() probe passed.
class CaptureService {
public:
    CaptureService(EventLoop& loop,
                   std::shared_ptr<IAudioCanonicalizer> canonicalizer);

    // Replaces any backend of the same kind.
    void registerBackend(std::shared_ptr<ICaptureBackend> backend,
                         const CaptureOptions& defaults);

    std::shared_ptr<ICaptureBackend> backend(BackendKind kind) const;

    // Registered backends whose capability probe succeeds
    std::vector<BackendKind> availableBackends();
    bool isAvailable(BackendKind kind);

    // nullptr if no backend of that kind is registered.
    std::shared_ptr<CaptureSession> createSession(BackendKind kind);
    std::shared_ptr<CaptureSession> createSession(BackendKind kind,
                                                  const CaptureOptions& options);

    // The session currently holding the kind's slot, if still alive
    std::shared_ptr<CaptureSession> activeSession(BackendKind kind) const;

    CaptureOptions defaultOptions(BackendKind kind) const;
    CaptureSlots& slots() { return *slots_; }

private:
    struct Entry {
        std::shared_ptr<ICaptureBackend> backend;
        CaptureOptions                   defaults;
    };

    EventLoop&                           loop_;
    std::shared_ptr<IAudioCanonicalizer> canonicalizer_;
    std::shared_ptr<CaptureSlots>        slots_;
    std::map<BackendKind, Entry>         backends_;
    std::map<uint64_t, std::weak_ptr<CaptureSession>> sessions_;
};
