#pragma once
#include "core/AudioError.hpp"
#include <string>

struct BridgeResult {
    bool        ok = false;
    std::string payload;    // stop: base64 audio
    AudioError  error;
};

// Out-of-process native system-audio capture. Calls block; the backend
// runs them on the loop's worker.
class ICaptureBridge {
public:
    virtual ~ICaptureBridge() = default;

    virtual bool isSupported() = 0;
    virtual BridgeResult startCapture(int maxDurationSeconds) = 0;
    virtual BridgeResult stopCapture() = 0;

    virtual std::string endpoint() const = 0;
};

// Maps a bridge error string onto the capture taxonomy.
ErrorKind categorizeBridgeError(const std::string& message);
