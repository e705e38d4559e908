#include "audio/AudioCanonicalizer.hpp"
#include "audio/PortAudioCapture.hpp"
#include "audio/SyntheticAudioCapture.hpp"
#include "capture/CaptureService.hpp"
#include "capture/HttpCaptureBridge.hpp"
#include "capture/LocalMicrophoneBackend.hpp"
#include "capture/SystemAudioBackend.hpp"
#include "core/AppConfig.hpp"
#include "core/EventLoop.hpp"
#include "core/Logging.hpp"
#include "playback/MediaFetcher.hpp"
#include "playback/PlaybackController.hpp"
#include "playback/PortAudioWaveformSurface.hpp"
#include "ui/StudioUI.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <csignal>
#include <fstream>
#include <memory>
#include <thread>

static EventLoop* g_loop = nullptr;

static void signalHandler(int /*sig*/) {
    if (g_loop) g_loop->quit();
}

static CaptureOptions captureOptions(const AppConfig& config, BackendKind kind) {
    CaptureOptions opts;
    opts.tickIntervalMs    = config.capture.tickIntervalMs;
    opts.finalizeTimeoutMs = config.capture.finalizeTimeoutMs;
    if (kind == BackendKind::Local) {
        const auto& local = config.capture.local;
        opts.maxDurationSeconds           = local.maxDurationSeconds;
        opts.constraints.echoCancellation = local.echoCancellation;
        opts.constraints.noiseSuppression = local.noiseSuppression;
        opts.constraints.autoGainControl  = local.autoGainControl;
    } else {
        opts.maxDurationSeconds = config.capture.system.maxDurationSeconds;
    }
    return opts;
}

// Record → write the clip → optionally play it back, then exit.
static int runHeadless(const AppConfig& config, EventLoop& loop,
                       CaptureService& capture, PlaybackController& playback,
                       const std::vector<BackendKind>& available) {
    const auto& script = config.script;
    BackendKind kind = script.backend == "system" ? BackendKind::System
                                                  : BackendKind::Local;

    if (std::find(available.begin(), available.end(), kind) == available.end()) {
        spdlog::error("{} capture is not available on this host", toString(kind));
        return 1;
    }

    auto session = capture.createSession(kind);
    if (!session) return 1;

    int exitCode = 0;
    PlaybackStore::ListenerId listener = 0;

    session->onComplete = [&](const CapturedClip& clip) {
        std::ofstream out(script.outputPath, std::ios::binary);
        if (!out.is_open()) {
            spdlog::error("Cannot write {}", script.outputPath);
            exitCode = 1;
            loop.quit();
            return;
        }
        out.write(reinterpret_cast<const char*>(clip.bytes.data()),
                  static_cast<std::streamsize>(clip.bytes.size()));
        spdlog::info("Wrote {:.2f}s of {} to {}", clip.durationSeconds, clip.mime,
                     script.outputPath);

        if (!script.playBack) {
            loop.quit();
            return;
        }

        listener = playback.store().subscribe([&](const PlaybackSession& s) {
            bool finished = s.state == PlaybackState::Paused &&
                            s.totalDuration > 0 && s.currentTime >= s.totalDuration;
            if (s.state == PlaybackState::Error) exitCode = 1;
            if (finished || s.state == PlaybackState::Error) loop.quit();
        });
        playback.assignClip(clip, script.outputPath);
    };
    session->onError = [&](const AudioError&) {
        exitCode = 1;
        loop.quit();
    };

    if (!session->start()) return 1;

    auto recordFor = std::chrono::milliseconds(
        static_cast<int64_t>(script.recordSeconds * 1000.0));
    loop.callAfter(recordFor, [session]() {
        if (session->state() == CaptureState::Recording) session->stop();
    });

    spdlog::info("Recording {:.1f}s from {} audio", script.recordSeconds, toString(kind));
    loop.run();

    if (listener) playback.store().unsubscribe(listener);
    if (!isTerminal(session->state())) {
        session->cancel();
        exitCode = 1;
    }
    return exitCode;
}

int main(int argc, char* argv[]) {
    // Load .env file
    loadDotEnv(".env");

    std::string configPath = "config/voxdeck.json";
    if (argc > 1) configPath = argv[1];

    AppConfig config;
    try {
        config = AppConfig::load(configPath);
    } catch (const std::exception& e) {
        spdlog::error("Cannot load config {}: {}", configPath, e.what());
        return 1;
    }
    applyEnvironment(config);

    // The terminal UI owns stdout
    if (!config.headless) config.log.console = false;
    setupLogging(config.log);

    spdlog::info("voxdeck v0.1.0 starting ({})", configPath);

    EventLoop loop;
    g_loop = &loop;
    std::signal(SIGINT,  signalHandler);
    std::signal(SIGTERM, signalHandler);

    // ── Capture ──────────────────────────────────────────────────
    auto canonicalizer = std::make_shared<WavCanonicalizer>();
    CaptureService capture(loop, canonicalizer);

    std::string device = config.capture.local.device;
    LocalMicrophoneBackend::DeviceFactory deviceFactory =
        [device]() -> std::unique_ptr<IAudioCapture> {
            if (device == "synthetic")
                return std::make_unique<SyntheticAudioCapture>();
            return std::make_unique<PortAudioCapture>();
        };

    capture.registerBackend(
        std::make_shared<LocalMicrophoneBackend>(loop, deviceFactory, config.capture.local,
                                                 config.capture.tickIntervalMs),
        captureOptions(config, BackendKind::Local));
    capture.registerBackend(
        std::make_shared<SystemAudioBackend>(
            loop, std::make_shared<HttpCaptureBridge>(config.capture.system)),
        captureOptions(config, BackendKind::System));

    auto available = capture.availableBackends();
    for (auto kind : available)
        spdlog::info("Capture backend offered: {}", toString(kind));

    // ── Playback ─────────────────────────────────────────────────
    auto registry = std::make_shared<ObjectUrlRegistry>();
    auto fetcher  = std::make_shared<MediaFetcher>(registry, config.capture.system.timeoutMs);
    auto surfaces = std::make_shared<PortAudioSurfaceFactory>(loop, fetcher);

    SurfaceConfig surfaceConfig;
    surfaceConfig.bars   = config.playback.waveformBars;
    surfaceConfig.height = config.playback.height;

    PlaybackStore store;
    PlaybackController playback(store, surfaces, registry, surfaceConfig);
    playback.setVolume(config.playback.volume);
    playback.setLoop(config.playback.loop);

    int exitCode = 0;
    if (config.headless) {
        exitCode = runHeadless(config, loop, capture, playback, available);
    } else {
        StudioUI ui(loop, capture, playback, available);
        std::thread loopThread([&loop]() { loop.run(); });

        ui.run();

        loop.quit();
        loopThread.join();
    }

    // Drop whatever is still bound before the loop goes away
    playback.assignSource(std::nullopt);
    g_loop = nullptr;

    spdlog::info("voxdeck exited cleanly");
    return exitCode;
}
