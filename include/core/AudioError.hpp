#pragma once
#include <stdexcept>
#include <string>

// Error taxonomy shared by the capture and playback state machines.
enum class ErrorKind {
    None,
    PermissionDenied,
    DeviceUnavailable,
    UnsupportedPlatform,
    BackendBusy,          // another session of the same kind holds the device
    FinalizeTimeout,
    EncodeFailure,        // recovered locally, never surfaced
    LoadFailure,
    DecodeFailure,
    PlaybackFailure,
    RendererInitFailure
};

inline std::string toString(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:                return "None";
        case ErrorKind::PermissionDenied:    return "PermissionDenied";
        case ErrorKind::DeviceUnavailable:   return "DeviceUnavailable";
        case ErrorKind::UnsupportedPlatform: return "UnsupportedPlatform";
        case ErrorKind::BackendBusy:         return "BackendBusy";
        case ErrorKind::FinalizeTimeout:     return "FinalizeTimeout";
        case ErrorKind::EncodeFailure:       return "EncodeFailure";
        case ErrorKind::LoadFailure:         return "LoadFailure";
        case ErrorKind::DecodeFailure:       return "DecodeFailure";
        case ErrorKind::PlaybackFailure:     return "PlaybackFailure";
        case ErrorKind::RendererInitFailure: return "RendererInitFailure";
    }
    return "Unknown";
}

struct AudioError {
    ErrorKind   kind = ErrorKind::None;
    std::string message;

    bool isError() const { return kind != ErrorKind::None; }

    std::string describe() const {
        if (!isError()) return "ok";
        return toString(kind) + ": " + message;
    }
};

// Thrown by the synchronous codec helpers; async paths carry AudioError.
class AudioException : public std::runtime_error {
public:
    AudioException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    AudioError error() const { return {kind_, what()}; }

private:
    ErrorKind kind_;
};
