#include "capture/CaptureService.hpp"
#include <spdlog/spdlog.h>

CaptureService::CaptureService(EventLoop& loop,
                               std::shared_ptr<IAudioCanonicalizer> canonicalizer)
    : loop_(loop), canonicalizer_(std::move(canonicalizer)),
      slots_(std::make_shared<CaptureSlots>()) {}

void CaptureService::registerBackend(std::shared_ptr<ICaptureBackend> backend,
                                     const CaptureOptions& defaults) {
    if (!backend) return;
    auto kind = backend->kind();
    spdlog::info("Capture backend registered: {} ({})", backend->backendName(),
                 toString(kind));
    backends_[kind] = {std::move(backend), defaults};
}

std::shared_ptr<ICaptureBackend> CaptureService::backend(BackendKind kind) const {
    auto it = backends_.find(kind);
    return it == backends_.end() ? nullptr : it->second.backend;
}

bool CaptureService::isAvailable(BackendKind kind) {
    auto it = backends_.find(kind);
    return it != backends_.end() && it->second.backend->isSupported();
}

std::vector<BackendKind> CaptureService::availableBackends() {
    std::vector<BackendKind> result;
    for (auto& [kind, entry] : backends_)
        if (entry.backend->isSupported()) result.push_back(kind);
    return result;
}

CaptureOptions CaptureService::defaultOptions(BackendKind kind) const {
    auto it = backends_.find(kind);
    return it == backends_.end() ? CaptureOptions{} : it->second.defaults;
}

std::shared_ptr<CaptureSession> CaptureService::createSession(BackendKind kind) {
    return createSession(kind, defaultOptions(kind));
}

std::shared_ptr<CaptureSession> CaptureService::createSession(BackendKind kind,
                                                              const CaptureOptions& options) {
    auto it = backends_.find(kind);
    if (it == backends_.end()) {
        spdlog::error("No {} capture backend registered", toString(kind));
        return nullptr;
    }

    // Forget sessions that have been discarded
    for (auto s = sessions_.begin(); s != sessions_.end();) {
        if (s->second.expired()) s = sessions_.erase(s);
        else ++s;
    }

    auto session = std::make_shared<CaptureSession>(
        loop_, it->second.backend, slots_, canonicalizer_, options);
    sessions_[session->id()] = session;
    return session;
}

std::shared_ptr<CaptureSession> CaptureService::activeSession(BackendKind kind) const {
    auto id = slots_->holder(kind);
    if (id == 0) return nullptr;
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second.lock();
}
