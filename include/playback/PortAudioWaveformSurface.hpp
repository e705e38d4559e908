#pragma once
#include "IWaveformSurface.hpp"
#include "MediaFetcher.hpp"
#include "PlayCursor.hpp"
#include "audio/PcmBuffer.hpp"
#include "core/EventLoop.hpp"
#include <atomic>
#include <memory>

// Forward declare PortAudio types to avoid including portaudio.h in header
typedef void PaStream;

// Native waveform surface.
//
//   load():  playback worker: fetch → decodeAudio → computePeaks; a load
//            superseded before the worker reaches it is skipped
//   play():  PortAudio output stream; the callback copies from the decoded
//            buffer at a PlayCursor, scaled by an atomic gain
//   poll:    loop timer reads the cursor, emits timeupdate / finish
//
// The real-time callback never allocates, locks or posts.
class PortAudioWaveformSurface : public IWaveformSurface {
public:
    PortAudioWaveformSurface(EventLoop& loop, std::shared_ptr<MediaFetcher> fetcher,
                             const SurfaceConfig& config, int deviceId = -1);
    ~PortAudioWaveformSurface() override;

    PortAudioWaveformSurface(const PortAudioWaveformSurface&) = delete;
    PortAudioWaveformSurface& operator=(const PortAudioWaveformSurface&) = delete;

    void load(const std::string& url, Completion done) override;
    void play(Completion done) override;
    void pause() override;
    void seekTo(double seconds) override;
    void setVolume(double volume) override;
    void setMuted(bool muted) override;

    bool   isPlaying() const override { return playing_; }
    double duration() const override;
    double currentTime() const override;

    void empty() override;
    void destroy() override;

    std::vector<float> peaks() const override { return peaks_; }

private:
    static int paCallback(const void* input, void* output,
                          unsigned long frameCount,
                          const void* timeInfo,
                          unsigned long statusFlags,
                          void* userData);

    std::optional<AudioError> openOutput();
    void closeOutput();
    void stopOutput();
    void poll();
    void applyGain();
    void postCompletion(Completion done, std::optional<AudioError> result);

    EventLoop&                    loop_;
    std::shared_ptr<MediaFetcher> fetcher_;
    SurfaceConfig                 config_;
    int                           deviceId_;

    // Cleared by destroy(); posted completions check it first
    std::shared_ptr<bool> alive_;
    // Bumped by load() and empty(); read by the worker
    std::shared_ptr<std::atomic<uint64_t>> loadToken_;

    std::shared_ptr<const PcmBuffer> pcm_;
    std::vector<float>               peaks_;
    PlayCursor                       cursor_;      // frames
    std::atomic<float>               gain_{1.0f};
    std::atomic<bool>                playing_{false};

    double volume_ = 1.0;
    bool   muted_  = false;

    PaStream*          stream_ = nullptr;
    bool               paInitialized_ = false;
    EventLoop::TimerId pollTimer_ = 0;
};

class PortAudioSurfaceFactory : public IWaveformSurfaceFactory {
public:
    PortAudioSurfaceFactory(EventLoop& loop, std::shared_ptr<MediaFetcher> fetcher,
                            int deviceId = -1)
        : loop_(loop), fetcher_(std::move(fetcher)), deviceId_(deviceId) {}

    std::unique_ptr<IWaveformSurface> create(const SurfaceConfig& config) override {
        return std::make_unique<PortAudioWaveformSurface>(loop_, fetcher_, config, deviceId_);
    }

private:
    EventLoop&                    loop_;
    std::shared_ptr<MediaFetcher> fetcher_;
    int                           deviceId_;
};
