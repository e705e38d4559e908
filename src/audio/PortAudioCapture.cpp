#include "audio/PortAudioCapture.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

#ifdef HAS_PORTAUDIO
#include <portaudio.h>
#endif

PortAudioCapture::PortAudioCapture() {
#ifdef HAS_PORTAUDIO
    PaError err = Pa_Initialize();
    if (err == paNoError) {
        paInitialized_ = true;
    } else {
        spdlog::error("PortAudio init failed: {}", Pa_GetErrorText(err));
    }
#endif
}

PortAudioCapture::~PortAudioCapture() {
    stop();
#ifdef HAS_PORTAUDIO
    if (paInitialized_)
        Pa_Terminate();
#endif
}

bool PortAudioCapture::fail(ErrorKind kind, const std::string& message) {
    lastError_ = {kind, message};
    spdlog::error("PortAudio capture: {}", message);
    return false;
}

bool PortAudioCapture::open(const Config& config) {
#ifdef HAS_PORTAUDIO
    if (!paInitialized_)
        return fail(ErrorKind::UnsupportedPlatform, "PortAudio failed to initialise");
    if (stream_)
        return fail(ErrorKind::DeviceUnavailable, "capture stream already open");

    config_ = config;

    PaStreamParameters inputParams;
    inputParams.channelCount = config.channelCount;
    inputParams.sampleFormat = paFloat32;    // interleaved
    inputParams.hostApiSpecificStreamInfo = nullptr;

    if (config.deviceId >= 0) {
        inputParams.device = config.deviceId;
    } else {
        inputParams.device = Pa_GetDefaultInputDevice();
        if (inputParams.device == paNoDevice)
            return fail(ErrorKind::DeviceUnavailable, "no default audio input device");
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(inputParams.device);
    if (!devInfo)
        return fail(ErrorKind::DeviceUnavailable,
                    "invalid audio device ID " + std::to_string(inputParams.device));

    if (devInfo->maxInputChannels < 1)
        return fail(ErrorKind::DeviceUnavailable,
                    std::string("device '") + devInfo->name + "' has no inputs");

    if (devInfo->maxInputChannels < config.channelCount) {
        spdlog::warn("Device '{}' has {} inputs, requested {} — clamping",
                     devInfo->name, devInfo->maxInputChannels, config.channelCount);
        config_.channelCount = devInfo->maxInputChannels;
        inputParams.channelCount = config_.channelCount;
    }
    inputParams.suggestedLatency = devInfo->defaultLowInputLatency;

    if (config.echoCancellation)
        spdlog::debug("Echo cancellation requested — host API '{}' has none, "
                      "capturing unprocessed",
                      Pa_GetHostApiInfo(devInfo->hostApi)->name);

    // 2 seconds of interleaved samples
    ring_ = std::make_unique<RingBuffer>(
        static_cast<size_t>(config_.sampleRate * 2) * config_.channelCount);

    spdlog::info("Opening capture: device='{}', {} ch, {}Hz, {} frames/block",
                 devInfo->name, config_.channelCount,
                 config_.sampleRate, config_.framesPerBlock);

    PaError err = Pa_OpenStream(
        &stream_,
        &inputParams,
        nullptr,  // no output
        config_.sampleRate,
        config_.framesPerBlock,
        paClipOff,
        &PortAudioCapture::paCallback,
        this
    );

    if (err != paNoError) {
        stream_ = nullptr;
        ErrorKind kind = ErrorKind::DeviceUnavailable;
        std::string detail = Pa_GetErrorText(err);
        if (err == paUnanticipatedHostError) {
            // Denied microphone access surfaces as a host error on
            // Core Audio / WASAPI / PulseAudio
            const PaHostErrorInfo* host = Pa_GetLastHostErrorInfo();
            kind = ErrorKind::PermissionDenied;
            if (host && host->errorText) detail += std::string(": ") + host->errorText;
        }
        return fail(kind, "Pa_OpenStream failed: " + detail);
    }

    lastError_ = {};
    return true;
#else
    config_ = config;
    return fail(ErrorKind::UnsupportedPlatform, "built without PortAudio (HAS_PORTAUDIO)");
#endif
}

bool PortAudioCapture::start() {
#ifdef HAS_PORTAUDIO
    if (!stream_)
        return fail(ErrorKind::DeviceUnavailable, "start() before open()");
    PaError err = Pa_StartStream(stream_);
    if (err != paNoError)
        return fail(ErrorKind::DeviceUnavailable,
                    std::string("Pa_StartStream failed: ") + Pa_GetErrorText(err));
    running_ = true;
    spdlog::info("Audio capture started");
    return true;
#else
    return fail(ErrorKind::UnsupportedPlatform, "built without PortAudio (HAS_PORTAUDIO)");
#endif
}

void PortAudioCapture::stop() {
#ifdef HAS_PORTAUDIO
    running_ = false;
    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        spdlog::info("Audio capture stopped");
    }
#endif
}

size_t PortAudioCapture::read(std::vector<float>& out, size_t maxFrames) {
    if (!ring_ || config_.channelCount <= 0) return 0;
    size_t ch = static_cast<size_t>(config_.channelCount);
    // Only whole frames
    size_t avail = ring_->available() / ch;
    size_t want  = std::min(avail, maxFrames);
    return ring_->readInto(out, want * ch) / ch;
}

std::vector<IAudioCapture::DeviceInfo> PortAudioCapture::listDevices() const {
    std::vector<DeviceInfo> result;
#ifdef HAS_PORTAUDIO
    if (!paInitialized_) return result;

    int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0) {
            result.push_back({
                i,
                info->name,
                info->maxInputChannels,
                info->defaultSampleRate
            });
        }
    }
#endif
    return result;
}

int PortAudioCapture::paCallback(
    const void* input, void* /*output*/,
    unsigned long frameCount,
    const void* /*timeInfo*/,
    unsigned long /*statusFlags*/,
    void* userData)
{
    auto* self = static_cast<PortAudioCapture*>(userData);
    if (input && self->ring_) {
        self->ring_->write(static_cast<const float*>(input),
                           frameCount * static_cast<size_t>(self->config_.channelCount));
    }
    return 0;  // paContinue
}
