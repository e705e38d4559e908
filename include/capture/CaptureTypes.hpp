#pragma once
#include "core/AudioError.hpp"
#include <cstdint>
#include <string>
#include <vector>

enum class BackendKind { Local, System };

inline std::string toString(BackendKind k) {
    return k == BackendKind::Local ? "local" : "system";
}

enum class CaptureState {
    Idle,
    RequestingAccess,
    Recording,
    Stopping,
    Finalizing,
    Completed,
    Cancelled,
    Error
};

inline std::string toString(CaptureState s) {
    switch (s) {
        case CaptureState::Idle:             return "Idle";
        case CaptureState::RequestingAccess: return "RequestingAccess";
        case CaptureState::Recording:        return "Recording";
        case CaptureState::Stopping:         return "Stopping";
        case CaptureState::Finalizing:       return "Finalizing";
        case CaptureState::Completed:        return "Completed";
        case CaptureState::Cancelled:        return "Cancelled";
        case CaptureState::Error:            return "Error";
    }
    return "Unknown";
}

inline bool isTerminal(CaptureState s) {
    return s == CaptureState::Completed || s == CaptureState::Cancelled ||
           s == CaptureState::Error;
}

// "user media" constraints forwarded to the local device
struct CaptureConstraints {
    bool echoCancellation = true;
    bool noiseSuppression = true;
    bool autoGainControl  = true;
};

struct CaptureRequest {
    CaptureConstraints constraints;
    double maxDurationSeconds = 30;
};

struct CaptureOptions {
    double maxDurationSeconds = 30;
    int    tickIntervalMs     = 100;
    int    finalizeTimeoutMs  = 10000;
    CaptureConstraints constraints;
};

struct CapturedClip {
    std::vector<uint8_t> bytes;
    std::string mime;
    double      durationSeconds = 0;   // wall clock, start to stop
    uint64_t    sessionId = 0;
    bool        canonical = false;     // false when conversion fell back to raw
};

// Opaque backend stream handle; 0 is never issued.
using CaptureHandle = uint64_t;

struct AcquireResult {
    bool          ok = false;
    CaptureHandle handle = 0;
    AudioError    error;
};

struct FinalizeResult {
    bool                 ok = false;
    std::vector<uint8_t> bytes;
    std::string          mime;
    AudioError           error;
};
