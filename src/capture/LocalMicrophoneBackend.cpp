#include "capture/LocalMicrophoneBackend.hpp"
#include "audio/StreamEncoder.hpp"
#include <spdlog/spdlog.h>

LocalMicrophoneBackend::LocalMicrophoneBackend(EventLoop& loop,
                                               DeviceFactory factory,
                                               const LocalCaptureConfig& config,
                                               int tickIntervalMs)
    : loop_(loop), factory_(std::move(factory)), config_(config),
      tickIntervalMs_(tickIntervalMs), shared_(std::make_shared<Shared>()) {}

LocalMicrophoneBackend::~LocalMicrophoneBackend() {
    std::map<CaptureHandle, std::shared_ptr<Stream>> streams;
    {
        std::lock_guard lock(shared_->mtx);
        streams.swap(shared_->streams);
    }
    for (auto& [handle, stream] : streams) {
        loop_.cancelTimer(stream->drainTimer);
        stream->device->stop();
        spdlog::debug("Microphone: released handle {} on shutdown", handle);
    }
}

bool LocalMicrophoneBackend::isSupported() {
    if (!supported_) {
        auto probe = factory_ ? factory_() : nullptr;
        supported_ = probe && !probe->listDevices().empty();
        spdlog::info("Microphone capture {}", *supported_ ? "available" : "unavailable");
    }
    return *supported_;
}

void LocalMicrophoneBackend::acquire(const CaptureRequest& request,
                                     AcquireCallback cb) {
    IAudioCapture::Config devConfig;
    devConfig.deviceId         = config_.deviceId;
    devConfig.channelCount     = config_.channels;
    devConfig.sampleRate       = config_.sampleRate;
    devConfig.framesPerBlock   = config_.sampleRate / 100;
    devConfig.echoCancellation = request.constraints.echoCancellation;
    devConfig.noiseSuppression = request.constraints.noiseSuppression;
    devConfig.autoGainControl  = request.constraints.autoGainControl;

    auto* loop = &loop_;
    auto shared = shared_;
    auto factory = factory_;
    auto preferredMime = config_.preferredMime;

    // Device open may block on a permission prompt
    loop_.offload([loop, shared, factory, devConfig, preferredMime, cb]() {
        AcquireResult result;
        std::unique_ptr<IAudioCapture> device = factory ? factory() : nullptr;
        if (!device) {
            result.error = {ErrorKind::UnsupportedPlatform, "no capture device available"};
        } else if (!device->open(devConfig)) {
            result.error = device->lastError();
            if (!result.error.isError())
                result.error = {ErrorKind::DeviceUnavailable, "device open failed"};
        } else {
            // The device may have clamped the requested format
            const auto& actual = device->config();
            int rate = static_cast<int>(actual.sampleRate);

            auto stream = std::make_shared<Stream>();
            SignalConditioner::Settings settings;
            settings.noiseSuppression = actual.noiseSuppression;
            settings.autoGainControl  = actual.autoGainControl;
            stream->conditioner = std::make_unique<SignalConditioner>(actual.channelCount, settings);
            stream->encoder     = makeStreamEncoder(preferredMime, rate, actual.channelCount);
            spdlog::info("Microphone: {} via {} ({} ch, {} Hz)",
                         stream->encoder->mime(), device->backendName(),
                         actual.channelCount, rate);
            stream->device = std::move(device);

            std::lock_guard lock(shared->mtx);
            result.ok     = true;
            result.handle = shared->nextHandle++;
            shared->streams[result.handle] = std::move(stream);
        }

        if (!result.ok)
            spdlog::warn("Microphone acquire failed: {}", result.error.describe());
        loop->post([cb, result]() { cb(result); });
    });
}

std::optional<AudioError> LocalMicrophoneBackend::beginStreaming(CaptureHandle handle) {
    std::shared_ptr<Stream> stream;
    {
        std::lock_guard lock(shared_->mtx);
        auto it = shared_->streams.find(handle);
        if (it != shared_->streams.end()) stream = it->second;
    }
    if (!stream)
        return AudioError{ErrorKind::DeviceUnavailable,
                          "unknown capture handle " + std::to_string(handle)};

    if (!stream->device->start()) {
        auto err = stream->device->lastError();
        if (!err.isError()) err = {ErrorKind::DeviceUnavailable, "device start failed"};
        return err;
    }

    std::weak_ptr<Stream> weak = stream;
    stream->drainTimer = loop_.callEvery(std::chrono::milliseconds(tickIntervalMs_),
        [weak]() {
            if (auto s = weak.lock()) drain(*s);
        });
    return std::nullopt;
}

void LocalMicrophoneBackend::drain(Stream& stream) {
    const auto& cfg = stream.device->config();
    size_t maxFrames = static_cast<size_t>(cfg.sampleRate) * 2;

    stream.scratch.clear();
    size_t frames = stream.device->read(stream.scratch, maxFrames);
    if (frames == 0) return;

    stream.conditioner->process(stream.scratch.data(), frames);
    stream.encoder->push(stream.scratch.data(), frames);
    stream.framesCaptured += frames;
}

std::shared_ptr<LocalMicrophoneBackend::Stream>
LocalMicrophoneBackend::take(CaptureHandle handle) {
    std::lock_guard lock(shared_->mtx);
    auto it = shared_->streams.find(handle);
    if (it == shared_->streams.end()) return nullptr;
    auto stream = std::move(it->second);
    shared_->streams.erase(it);
    return stream;
}

void LocalMicrophoneBackend::finalize(CaptureHandle handle, FinalizeCallback cb) {
    auto stream = take(handle);
    if (!stream) {
        FinalizeResult result;
        result.error = {ErrorKind::DeviceUnavailable,
                        "unknown capture handle " + std::to_string(handle)};
        loop_.post([cb, result]() { cb(result); });
        return;
    }

    loop_.cancelTimer(stream->drainTimer);
    stream->drainTimer = 0;
    drain(*stream);
    stream->device->stop();
    drain(*stream);   // whatever the device buffered before it stopped

    spdlog::debug("Microphone: finalizing handle {} ({} frames, {} bytes)",
                  handle, stream->framesCaptured, stream->encoder->bytesEncoded());

    auto* loop = &loop_;
    loop_.offload([loop, stream, cb]() {
        FinalizeResult result;
        try {
            result.mime  = stream->encoder->mime();
            result.bytes = stream->encoder->finish();
            result.ok    = true;
        } catch (const AudioException& e) {
            result.error = {ErrorKind::DeviceUnavailable,
                            std::string("stream encoder failed: ") + e.what()};
        }
        loop->post([cb, result = std::move(result)]() { cb(result); });
    });
}

void LocalMicrophoneBackend::release(CaptureHandle handle) {
    auto stream = take(handle);
    if (!stream) return;
    loop_.cancelTimer(stream->drainTimer);
    stream->device->stop();
    spdlog::debug("Microphone: released handle {}, discarded {} frames",
                  handle, stream->framesCaptured);
}

size_t LocalMicrophoneBackend::openStreams() const {
    std::lock_guard lock(shared_->mtx);
    return shared_->streams.size();
}
