#pragma once
#include "core/AudioError.hpp"
#include <string>
#include <vector>

// Abstract capture device.
// Implementations: PortAudioCapture (host input), SyntheticAudioCapture
// (wall-clock paced tone generator).
class IAudioCapture {
public:
    virtual ~IAudioCapture() = default;

    struct DeviceInfo {
        int         id;
        std::string name;
        int         maxInputChannels;
        double      defaultSampleRate;
    };

    struct Config {
        int    deviceId       = -1;    // -1 = default device
        int    channelCount   = 1;
        double sampleRate     = 48000;
        int    framesPerBlock = 480;   // 10ms at 48kHz

        // "user media" constraints
        bool echoCancellation = true;
        bool noiseSuppression = true;
        bool autoGainControl  = true;
    };

    // Lifecycle. open() acquires the device, stop() releases it.
    virtual bool open(const Config& config) = 0;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

    // Consumer side: appends up to maxFrames interleaved frames captured
    // since the previous call. Returns frames appended.
    virtual size_t read(std::vector<float>& out, size_t maxFrames) = 0;

    virtual const Config& config() const = 0;

    // Why the last open()/start() failed
    virtual AudioError lastError() const = 0;

    virtual std::vector<DeviceInfo> listDevices() const = 0;

    // Name for logging
    virtual std::string backendName() const = 0;
};
