#include "playback/PortAudioWaveformSurface.hpp"
#include "audio/AudioCanonicalizer.hpp"
#include "playback/WaveformPeaks.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>

#ifdef HAS_PORTAUDIO
#include <portaudio.h>
#endif

namespace {
constexpr int kPollIntervalMs = 50;
}

PortAudioWaveformSurface::PortAudioWaveformSurface(EventLoop& loop,
                                                   std::shared_ptr<MediaFetcher> fetcher,
                                                   const SurfaceConfig& config,
                                                   int deviceId)
    : loop_(loop), fetcher_(std::move(fetcher)), config_(config),
      deviceId_(deviceId), alive_(std::make_shared<bool>(true)),
      loadToken_(std::make_shared<std::atomic<uint64_t>>(0))
{
#ifdef HAS_PORTAUDIO
    PaError err = Pa_Initialize();
    if (err != paNoError)
        throw AudioException(ErrorKind::RendererInitFailure,
                             std::string("PortAudio init failed: ") + Pa_GetErrorText(err));
    paInitialized_ = true;
#endif
}

PortAudioWaveformSurface::~PortAudioWaveformSurface() {
    destroy();
#ifdef HAS_PORTAUDIO
    if (paInitialized_)
        Pa_Terminate();
#endif
}

void PortAudioWaveformSurface::postCompletion(Completion done,
                                              std::optional<AudioError> result) {
    auto alive = alive_;
    loop_.post([alive, done, result]() {
        if (*alive && done) done(result);
    });
}

void PortAudioWaveformSurface::load(const std::string& url, Completion done) {
    empty();
    uint64_t token = ++*loadToken_;

    auto alive   = alive_;
    auto current = loadToken_;
    auto fetcher = fetcher_;
    auto* loop   = &loop_;
    int bars     = config_.bars;
    bool norm    = config_.normalize;

    loop_.offload([this, alive, current, fetcher, loop, url, token, bars, norm, done]() {
        if (token != current->load()) {
            spdlog::debug("Surface load of {} superseded before fetch", url);
            return;
        }

        auto progress = [loop, alive, current, this, token](int pct) {
            loop->post([this, alive, current, token, pct]() {
                if (*alive && token == current->load() && onLoading) onLoading(pct);
            });
        };

        std::shared_ptr<PcmBuffer> pcm;
        std::vector<float> peaks;
        std::optional<AudioError> failure;
        try {
            auto media = fetcher->fetch(url, progress);
            if (token != current->load()) return;
            pcm = std::make_shared<PcmBuffer>(decodeAudio(media.bytes, media.mime));
            if (pcm->empty())
                throw AudioException(ErrorKind::DecodeFailure, url + " has no samples");
            peaks = computePeaks(*pcm, bars, norm);
        } catch (const AudioException& e) {
            failure = e.error();
        }

        loop->post([this, alive, current, token, pcm, peaks, failure, done]() {
            // Superseded by a newer load() or an empty()
            if (!*alive || token != current->load()) return;
            if (failure) {
                spdlog::warn("Surface load failed: {}", failure->describe());
                if (done) done(failure);
                return;
            }
            pcm_   = pcm;
            peaks_ = peaks;
            cursor_.seek(0);
            if (done) done(std::nullopt);
            // done() may have destroyed this surface
            if (*alive && onReady) onReady(duration());
        });
    }, EventLoop::WorkLane::Playback);
}

std::optional<AudioError> PortAudioWaveformSurface::openOutput() {
#ifdef HAS_PORTAUDIO
    if (stream_) return std::nullopt;

    PaStreamParameters out;
    out.device = deviceId_ >= 0 ? deviceId_ : Pa_GetDefaultOutputDevice();
    if (out.device == paNoDevice)
        return AudioError{ErrorKind::PlaybackFailure, "no default audio output device"};

    const PaDeviceInfo* info = Pa_GetDeviceInfo(out.device);
    if (!info)
        return AudioError{ErrorKind::PlaybackFailure,
                          "invalid output device " + std::to_string(out.device)};

    out.channelCount = pcm_->channels;
    out.sampleFormat = paFloat32;
    out.suggestedLatency = info->defaultLowOutputLatency;
    out.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_OpenStream(&stream_, nullptr, &out, pcm_->sampleRate,
                                paFramesPerBufferUnspecified, paClipOff,
                                &PortAudioWaveformSurface::paCallback, this);
    if (err != paNoError) {
        stream_ = nullptr;
        return AudioError{ErrorKind::PlaybackFailure,
                          std::string("Pa_OpenStream failed: ") + Pa_GetErrorText(err)};
    }
    spdlog::debug("Playback output open: '{}', {} ch, {} Hz", info->name,
                  pcm_->channels, pcm_->sampleRate);
    return std::nullopt;
#else
    return AudioError{ErrorKind::PlaybackFailure, "built without PortAudio (HAS_PORTAUDIO)"};
#endif
}

void PortAudioWaveformSurface::stopOutput() {
#ifdef HAS_PORTAUDIO
    if (stream_ && Pa_IsStreamActive(stream_) == 1)
        Pa_StopStream(stream_);
#endif
}

void PortAudioWaveformSurface::closeOutput() {
#ifdef HAS_PORTAUDIO
    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
#endif
}

void PortAudioWaveformSurface::play(Completion done) {
    if (!pcm_) {
        postCompletion(done, AudioError{ErrorKind::PlaybackFailure, "nothing loaded"});
        return;
    }
    if (playing_) {
        postCompletion(done, std::nullopt);
        return;
    }
    if (cursor_.position() >= pcm_->frames()) cursor_.seek(0);

    if (auto err = openOutput()) {
        postCompletion(done, err);
        return;
    }

#ifdef HAS_PORTAUDIO
    PaError err = Pa_StartStream(stream_);
    if (err != paNoError) {
        postCompletion(done, AudioError{ErrorKind::PlaybackFailure,
            std::string("Pa_StartStream failed: ") + Pa_GetErrorText(err)});
        return;
    }
#endif

    playing_ = true;
    applyGain();
    auto alive = alive_;
    pollTimer_ = loop_.callEvery(std::chrono::milliseconds(kPollIntervalMs), [this, alive]() {
        if (*alive) poll();
    });

    loop_.post([this, alive, done]() {
        if (!*alive) return;
        if (onPlay) onPlay();
        if (done) done(std::nullopt);
    });
}

void PortAudioWaveformSurface::pause() {
    if (!playing_) return;
    playing_ = false;
    stopOutput();
    loop_.cancelTimer(pollTimer_);
    pollTimer_ = 0;

    auto alive = alive_;
    loop_.post([this, alive]() {
        if (*alive && onPause) onPause();
    });
}

void PortAudioWaveformSurface::poll() {
    if (!playing_ || !pcm_) return;

    size_t frames = pcm_->frames();
    if (cursor_.position() < frames) {
        if (onTimeUpdate) onTimeUpdate(currentTime());
        return;
    }

    playing_ = false;
    stopOutput();
    loop_.cancelTimer(pollTimer_);
    pollTimer_ = 0;
    if (onTimeUpdate) onTimeUpdate(duration());
    if (onFinish) onFinish();
}

void PortAudioWaveformSurface::seekTo(double seconds) {
    if (!pcm_) return;
    double t = std::clamp(seconds, 0.0, duration());
    cursor_.seek(std::min(static_cast<size_t>(t * pcm_->sampleRate), pcm_->frames()));

    auto alive = alive_;
    loop_.post([this, alive, t]() {
        if (*alive && onTimeUpdate) onTimeUpdate(t);
    });
}

void PortAudioWaveformSurface::setVolume(double volume) {
    volume_ = std::clamp(volume, 0.0, 1.0);
    applyGain();
}

void PortAudioWaveformSurface::setMuted(bool muted) {
    muted_ = muted;
    applyGain();
}

void PortAudioWaveformSurface::applyGain() {
    gain_ = muted_ ? 0.0f : static_cast<float>(volume_);
}

double PortAudioWaveformSurface::duration() const {
    return pcm_ ? pcm_->durationSeconds() : 0.0;
}

double PortAudioWaveformSurface::currentTime() const {
    if (!pcm_ || pcm_->sampleRate <= 0) return 0.0;
    return std::min(duration(), static_cast<double>(cursor_.position()) / pcm_->sampleRate);
}

void PortAudioWaveformSurface::empty() {
    playing_ = false;
    loop_.cancelTimer(pollTimer_);
    pollTimer_ = 0;
    closeOutput();

    ++*loadToken_;    // abandons an in-flight or queued load
    pcm_.reset();
    peaks_.clear();
    cursor_.seek(0);
}

void PortAudioWaveformSurface::destroy() {
    if (!*alive_) return;
    *alive_ = false;
    empty();

    onReady = nullptr;
    onTimeUpdate = nullptr;
    onPlay = nullptr;
    onPause = nullptr;
    onFinish = nullptr;
    onError = nullptr;
    onLoading = nullptr;
}

int PortAudioWaveformSurface::paCallback(
    const void* /*input*/, void* output,
    unsigned long frameCount,
    const void* /*timeInfo*/,
    unsigned long /*statusFlags*/,
    void* userData)
{
    auto* self = static_cast<PortAudioWaveformSurface*>(userData);
    auto* out  = static_cast<float*>(output);
    const PcmBuffer& pcm = *self->pcm_;
    const size_t ch = static_cast<size_t>(pcm.channels);

    size_t total  = pcm.frames();
    size_t cursor = self->cursor_.beginBlock();
    size_t n = self->playing_ && cursor < total
             ? std::min<size_t>(frameCount, total - cursor) : 0;

    float gain = self->gain_.load(std::memory_order_relaxed);
    const float* src = pcm.samples.data() + cursor * ch;
    for (size_t i = 0; i < n * ch; i++)
        out[i] = src[i] * gain;
    std::memset(out + n * ch, 0, (frameCount - n) * ch * sizeof(float));

    // A seekTo() during this block keeps its position
    self->cursor_.endBlock(cursor, n);
    return 0;  // paContinue
}
