#pragma once
#include "core/AudioError.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct SurfaceConfig {
    int  bars     = 96;     // peak bins rendered
    int  height   = 80;
    bool normalize = true;
};

// Decodes a URL, renders its waveform and exposes transport primitives.
//
// Completions and events are delivered on later loop turns. After
// destroy() no callback or event fires.
class IWaveformSurface {
public:
    virtual ~IWaveformSurface() = default;

    using Completion = std::function<void(std::optional<AudioError>)>;

    virtual void load(const std::string& url, Completion done) = 0;
    // May be rejected (host policy, device failure) through `done`.
    virtual void play(Completion done) = 0;
    virtual void pause() = 0;
    virtual void seekTo(double seconds) = 0;
    virtual void setVolume(double volume) = 0;
    virtual void setMuted(bool muted) = 0;

    virtual bool   isPlaying() const = 0;
    virtual double duration() const = 0;
    virtual double currentTime() const = 0;

    // Clears the source and frees decode buffers
    virtual void empty() = 0;
    virtual void destroy() = 0;

    virtual std::vector<float> peaks() const = 0;

    // Events
    std::function<void(double)>            onReady;       // duration
    std::function<void(double)>            onTimeUpdate;
    std::function<void()>                  onPlay;
    std::function<void()>                  onPause;
    std::function<void()>                  onFinish;
    std::function<void(const AudioError&)> onError;
    std::function<void(int)>               onLoading;     // percent
};

class IWaveformSurfaceFactory {
public:
    virtual ~IWaveformSurfaceFactory() = default;

    // Throws or returns nullptr when the renderer cannot be initialised.
    virtual std::unique_ptr<IWaveformSurface> create(const SurfaceConfig& config) = 0;
};
