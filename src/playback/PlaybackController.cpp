#include "playback/PlaybackController.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

PlaybackController::PlaybackController(PlaybackStore& store,
                                       std::shared_ptr<IWaveformSurfaceFactory> factory,
                                       std::shared_ptr<ObjectUrlRegistry> registry,
                                       const SurfaceConfig& surfaceConfig)
    : store_(store), factory_(std::move(factory)),
      registry_(std::move(registry)), surfaceConfig_(surfaceConfig) {}

PlaybackController::~PlaybackController() {
    teardown();
    if (registry_)
        for (auto& url : pendingUrls_) registry_->revoke(url);
}

bool PlaybackController::isCurrent(uint64_t generation) const {
    return binding_ && binding_->generation == generation && generation == generation_;
}

void PlaybackController::teardown() {
    if (!binding_) return;
    auto binding = std::move(binding_);
    auto& surface = binding->surface;

    // pause → clear source → revoke URLs → destroy, continuing past failures
    try {
        surface->pause();
        surface->empty();
    } catch (const std::exception& e) {
        spdlog::warn("Playback teardown (gen {}): {}", binding->generation, e.what());
    }
    if (registry_)
        for (auto& url : binding->objectUrls) registry_->revoke(url);
    try {
        surface->destroy();
    } catch (const std::exception& e) {
        spdlog::warn("Playback teardown (gen {}): destroy failed: {}",
                     binding->generation, e.what());
    }
    spdlog::debug("Playback binding gen {} torn down", binding->generation);
}

void PlaybackController::assignSource(const std::optional<std::string>& url,
                                      const std::string& id, const std::string& title) {
    uint64_t generation = ++generation_;
    teardown();

    if (!url) {
        store_.update([&](PlaybackSession& s) {
            s.sourceUrl.reset();
            s.sourceId.clear();
            s.title.clear();
            s.state          = PlaybackState::Empty;
            s.currentTime    = 0;
            s.totalDuration  = 0;
            s.loadingPercent = 0;
            s.error          = {};
            s.loadGeneration = generation;
        });
        spdlog::info("Playback source cleared");
        return;
    }

    store_.update([&](PlaybackSession& s) {
        s.sourceUrl      = *url;
        s.sourceId       = id;
        s.title          = title.empty() ? *url : title;
        s.state          = PlaybackState::Loading;
        s.currentTime    = 0;
        s.totalDuration  = 0;
        s.loadingPercent = 0;
        s.error          = {};
        s.loadGeneration = generation;
    });
    // A listener reassigned the source from inside the update
    if (generation != generation_) return;
    spdlog::info("Playback: loading {} (gen {})", *url, generation);

    std::unique_ptr<IWaveformSurface> surface;
    std::string initError = "surface factory returned no surface";
    try {
        if (factory_) surface = factory_->create(surfaceConfig_);
    } catch (const std::exception& e) {
        initError = e.what();
    }

    auto urls = std::move(pendingUrls_);
    pendingUrls_.clear();

    if (!surface) {
        if (registry_)
            for (auto& u : urls) registry_->revoke(u);
        AudioError err{ErrorKind::RendererInitFailure, initError};
        store_.update([&](PlaybackSession& s) {
            s.state = PlaybackState::Error;
            s.error = err;
        });
        spdlog::error("Playback: {}", err.describe());
        return;
    }

    binding_ = std::make_unique<Binding>();
    binding_->generation = generation;
    binding_->surface    = std::move(surface);
    binding_->objectUrls = std::move(urls);

    auto& s = *binding_->surface;
    wire(s, generation);

    double volume = store_.snapshot().volume;
    s.setVolume(volume);
    s.setMuted(volume <= 0.0);
    s.load(*url, [this, generation](std::optional<AudioError> err) {
        handleLoaded(generation, err);
    });
}

std::string PlaybackController::assignClip(const CapturedClip& clip,
                                           const std::string& title) {
    if (!registry_) {
        spdlog::error("Playback: no object URL registry for clip {}", clip.sessionId);
        return "";
    }
    auto url = registry_->create(clip.bytes, clip.mime);
    pendingUrls_.push_back(url);
    assignSource(url, "capture-" + std::to_string(clip.sessionId), title);
    return url;
}

void PlaybackController::wire(IWaveformSurface& surface, uint64_t generation) {
    surface.onReady = [this, generation](double duration) {
        handleReady(generation, duration);
    };
    surface.onTimeUpdate = [this, generation](double t) {
        if (!isCurrent(generation)) return;
        store_.update([&](PlaybackSession& s) {
            if (hasMedia(s.state)) s.currentTime = std::clamp(t, 0.0, s.totalDuration);
        });
    };
    surface.onPlay = [this, generation]() {
        if (!isCurrent(generation)) return;
        store_.update([](PlaybackSession& s) {
            if (hasMedia(s.state)) s.state = PlaybackState::Playing;
        });
    };
    surface.onPause = [this, generation]() {
        if (!isCurrent(generation)) return;
        store_.update([](PlaybackSession& s) {
            if (s.state == PlaybackState::Playing) s.state = PlaybackState::Paused;
        });
    };
    surface.onFinish = [this, generation]() { handleFinish(generation); };
    surface.onError = [this, generation](const AudioError& err) {
        failWith(generation, err);
    };
    surface.onLoading = [this, generation](int percent) {
        if (!isCurrent(generation)) return;
        store_.update([&](PlaybackSession& s) {
            if (s.state == PlaybackState::Loading)
                s.loadingPercent = std::clamp(percent, 0, 100);
        });
    };
}

void PlaybackController::handleLoaded(uint64_t generation,
                                      const std::optional<AudioError>& err) {
    if (!isCurrent(generation)) {
        spdlog::debug("Playback: discarded stale load result (gen {}, current {})",
                      generation, generation_);
        return;
    }
    if (err) {
        AudioError e = *err;
        if (e.kind != ErrorKind::DecodeFailure && e.kind != ErrorKind::RendererInitFailure)
            e.kind = ErrorKind::LoadFailure;
        failWith(generation, e);
    }
}

void PlaybackController::handleReady(uint64_t generation, double duration) {
    if (!isCurrent(generation)) {
        spdlog::debug("Playback: discarded stale ready (gen {}, current {})",
                      generation, generation_);
        return;
    }

    double volume = 1.0;
    store_.update([&](PlaybackSession& s) {
        s.state          = PlaybackState::Ready;
        s.totalDuration  = std::max(0.0, duration);
        s.currentTime    = 0;
        s.loadingPercent = 100;
        volume = s.volume;
    });
    spdlog::info("Playback ready: {:.2f}s (gen {})", duration, generation);
    // Listeners run inside update() and may have reassigned the source
    if (!isCurrent(generation)) return;

    auto& surface = *binding_->surface;
    surface.setVolume(volume);
    surface.setMuted(volume <= 0.0);

    // Autoplay; a rejection leaves the session Ready
    surface.play([this, generation](std::optional<AudioError> err) {
        if (err && isCurrent(generation))
            spdlog::info("Autoplay rejected: {}", err->describe());
    });
}

void PlaybackController::handleFinish(uint64_t generation) {
    if (!isCurrent(generation)) return;

    auto snap = store_.snapshot();
    if (!hasMedia(snap.state)) return;

    if (snap.loopEnabled) {
        spdlog::debug("Playback: loop, restarting");
        store_.update([](PlaybackSession& s) { s.currentTime = 0; });
        if (!isCurrent(generation)) return;
        auto& surface = *binding_->surface;
        surface.seekTo(0);
        surface.play([this, generation](std::optional<AudioError> err) {
            if (err) failWith(generation, {ErrorKind::PlaybackFailure, err->message});
        });
        return;
    }

    store_.update([](PlaybackSession& s) {
        s.state       = PlaybackState::Paused;
        s.currentTime = s.totalDuration;
    });
    spdlog::debug("Playback finished");
}

void PlaybackController::failWith(uint64_t generation, const AudioError& err) {
    if (!isCurrent(generation)) {
        spdlog::debug("Playback: discarded stale error {}", err.describe());
        return;
    }

    // Transport stays disabled until a new source is assigned; the binding
    // itself is torn down by that assignment.
    binding_->surface->pause();
    store_.update([&](PlaybackSession& s) {
        s.state = PlaybackState::Error;
        s.error = err;
    });
    spdlog::error("Playback: {}", err.describe());
}

bool PlaybackController::play() {
    auto snap = store_.snapshot();
    if (!binding_ || !hasMedia(snap.state)) {
        spdlog::debug("Playback: play() ignored in {}", toString(snap.state));
        return false;
    }
    uint64_t generation = binding_->generation;
    binding_->surface->play([this, generation](std::optional<AudioError> err) {
        if (err) failWith(generation, {ErrorKind::PlaybackFailure, err->message});
    });
    return true;
}

bool PlaybackController::pause() {
    auto snap = store_.snapshot();
    if (!binding_ || !hasMedia(snap.state)) {
        spdlog::debug("Playback: pause() ignored in {}", toString(snap.state));
        return false;
    }
    binding_->surface->pause();
    return true;
}

bool PlaybackController::togglePlayPause() {
    return store_.snapshot().state == PlaybackState::Playing ? pause() : play();
}

bool PlaybackController::seek(double fraction) {
    auto snap = store_.snapshot();
    if (!binding_ || !hasMedia(snap.state)) return false;

    double t = std::clamp(fraction, 0.0, 1.0) * snap.totalDuration;
    binding_->surface->seekTo(t);
    store_.update([t](PlaybackSession& s) { s.currentTime = t; });
    return true;
}

void PlaybackController::setVolume(double volume) {
    double v = std::clamp(volume, 0.0, 1.0);
    store_.update([v](PlaybackSession& s) { s.volume = v; });
    if (binding_) {
        binding_->surface->setVolume(v);
        binding_->surface->setMuted(v <= 0.0);
    }
}

bool PlaybackController::toggleLoop() {
    bool enabled = false;
    store_.update([&](PlaybackSession& s) {
        s.loopEnabled = !s.loopEnabled;
        enabled = s.loopEnabled;
    });
    return enabled;
}

void PlaybackController::setLoop(bool enabled) {
    store_.update([enabled](PlaybackSession& s) { s.loopEnabled = enabled; });
}

std::vector<float> PlaybackController::peaks() const {
    return binding_ ? binding_->surface->peaks() : std::vector<float>{};
}
