#pragma once
#include "core/AudioError.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

enum class PlaybackState { Empty, Loading, Ready, Playing, Paused, Error };

inline std::string toString(PlaybackState s) {
    switch (s) {
        case PlaybackState::Empty:   return "Empty";
        case PlaybackState::Loading: return "Loading";
        case PlaybackState::Ready:   return "Ready";
        case PlaybackState::Playing: return "Playing";
        case PlaybackState::Paused:  return "Paused";
        case PlaybackState::Error:   return "Error";
    }
    return "Unknown";
}

// Transport commands are accepted once the media is decoded
inline bool hasMedia(PlaybackState s) {
    return s == PlaybackState::Ready || s == PlaybackState::Playing ||
           s == PlaybackState::Paused;
}

// App-lifetime playback state; the bound source is swapped in place.
struct PlaybackSession {
    std::optional<std::string> sourceUrl;
    std::string   sourceId;     // opaque, display only
    std::string   title;
    PlaybackState state = PlaybackState::Empty;
    double        currentTime   = 0;
    double        totalDuration = 0;
    double        volume        = 1.0;
    bool          loopEnabled   = false;
    uint64_t      loadGeneration = 0;
    int           loadingPercent = 0;
    AudioError    error;

    bool muted() const { return volume <= 0.0; }

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"source",          sourceUrl ? nlohmann::json(*sourceUrl) : nlohmann::json()},
            {"source_id",       sourceId},
            {"title",           title},
            {"state",           toString(state)},
            {"current_time",    currentTime},
            {"duration",        totalDuration},
            {"volume",          volume},
            {"muted",           muted()},
            {"loop",            loopEnabled},
            {"load_generation", loadGeneration},
            {"loading_percent", loadingPercent}
        };
        if (error.isError()) j["error"] = error.describe();
        return j;
    }
};
