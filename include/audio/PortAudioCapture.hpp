#pragma once
#include "IAudioCapture.hpp"
#include "RingBuffer.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

// PortAudio input stream. Supports ALSA/PulseAudio (Linux), Core Audio
// (macOS), WASAPI (Windows). Link with -lportaudio.
//
//   PortAudio callback (real-time thread)
//       → interleaved RingBuffer (2s)
//           → read() on the event loop, once per capture tick
//
// Host APIs expose no echo canceller; when requested it is logged and the
// stream is captured unprocessed. Noise suppression and auto gain are
// applied downstream by SignalConditioner.

// Forward declare PortAudio types to avoid including portaudio.h in header
typedef void PaStream;

class PortAudioCapture : public IAudioCapture {
public:
    PortAudioCapture();
    ~PortAudioCapture() override;

    bool open(const Config& config) override;
    bool start() override;
    void stop() override;
    bool isRunning() const override { return running_; }

    size_t read(std::vector<float>& out, size_t maxFrames) override;

    const Config& config() const override { return config_; }
    AudioError lastError() const override { return lastError_; }

    std::vector<DeviceInfo> listDevices() const override;
    std::string backendName() const override { return "PortAudio"; }

private:
    // PortAudio stream callback (static → forwards to instance)
    static int paCallback(const void* input, void* output,
                          unsigned long frameCount,
                          const void* timeInfo,
                          unsigned long statusFlags,
                          void* userData);

    bool fail(ErrorKind kind, const std::string& message);

    Config                      config_;
    PaStream*                   stream_ = nullptr;
    std::atomic<bool>           running_{false};
    std::unique_ptr<RingBuffer> ring_;
    AudioError                  lastError_;
    bool                        paInitialized_ = false;
};
