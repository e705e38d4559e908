#pragma once
#include "ICaptureBackend.hpp"
#include "audio/IAudioCapture.hpp"
#include "audio/IStreamEncoder.hpp"
#include "audio/SignalConditioner.hpp"
#include "core/AppConfig.hpp"
#include "core/EventLoop.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

// Local "user media" capture.
//
//   acquire()        worker: factory() → device.open(constraints)
//   beginStreaming() loop:   device.start(), drain timer every tick
//   drain            loop:   device.read → SignalConditioner → encoder.push
//   finalize()       loop:   stop + final drain, worker: encoder.finish()
//
// The encoder is negotiated per stream: preferred compressed codec when
// the stream format supports it, otherwise the L16 fallback.
class LocalMicrophoneBackend : public ICaptureBackend {
public:
    using DeviceFactory = std::function<std::unique_ptr<IAudioCapture>()>;

    LocalMicrophoneBackend(EventLoop& loop, DeviceFactory factory,
                           const LocalCaptureConfig& config,
                           int tickIntervalMs = 100);
    ~LocalMicrophoneBackend() override;

    BackendKind kind() const override { return BackendKind::Local; }
    bool isSupported() override;

    void acquire(const CaptureRequest& request, AcquireCallback cb) override;
    std::optional<AudioError> beginStreaming(CaptureHandle handle) override;
    void finalize(CaptureHandle handle, FinalizeCallback cb) override;
    void release(CaptureHandle handle) override;

    std::string backendName() const override { return "microphone"; }

    // Handles currently holding a device
    size_t openStreams() const;

private:
    struct Stream {
        std::unique_ptr<IAudioCapture>     device;
        std::unique_ptr<SignalConditioner> conditioner;
        std::unique_ptr<IStreamEncoder>    encoder;
        EventLoop::TimerId                 drainTimer = 0;
        std::vector<float>                 scratch;
        size_t                             framesCaptured = 0;
    };

    // Outlives the backend while offloaded work or timers still refer to it
    struct Shared {
        mutable std::mutex                          mtx;
        std::map<CaptureHandle, std::shared_ptr<Stream>> streams;
        CaptureHandle                               nextHandle = 1;
    };

    static void drain(Stream& stream);
    std::shared_ptr<Stream> take(CaptureHandle handle);

    EventLoop&              loop_;
    DeviceFactory           factory_;
    LocalCaptureConfig      config_;
    int                     tickIntervalMs_;
    std::shared_ptr<Shared> shared_;
    std::optional<bool>     supported_;
};
