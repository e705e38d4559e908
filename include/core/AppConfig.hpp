#pragma once
#include <nlohmann/json.hpp>
#include <string>

struct LogConfig {
    std::string level = "info";          // debug|info|warn|error
    std::string file  = "voxdeck.log";
    bool        console = true;          // off while the terminal UI owns stdout
};

struct LocalCaptureConfig {
    double      maxDurationSeconds = 29;
    std::string device         = "portaudio";   // portaudio|synthetic
    int         deviceId       = -1;            // -1 = default input
    int         sampleRate     = 48000;
    int         channels       = 1;
    bool        echoCancellation = true;
    bool        noiseSuppression = true;
    bool        autoGainControl  = true;
    std::string preferredMime  = "audio/x-opus-frames";
};

struct SystemCaptureConfig {
    double      maxDurationSeconds = 30;
    std::string bridgeUrl = "http://127.0.0.1:17493";
    int         timeoutMs = 5000;
};

struct CaptureConfig {
    int tickIntervalMs    = 100;
    int finalizeTimeoutMs = 10000;
    LocalCaptureConfig  local;
    SystemCaptureConfig system;
};

struct PlaybackConfig {
    double volume       = 1.0;
    bool   loop         = false;
    int    waveformBars = 96;
    int    height       = 80;
};

// Scripted run used when headless = true
struct ScriptConfig {
    std::string backend       = "local";   // local|system
    double      recordSeconds = 3;
    std::string outputPath    = "capture.wav";
    bool        playBack      = true;
};

struct AppConfig {
    LogConfig      log;
    CaptureConfig  capture;
    PlaybackConfig playback;
    ScriptConfig   script;
    bool           headless = false;

    // Every key is optional; out-of-range values are clamped with a warning.
    static AppConfig fromJson(const nlohmann::json& j);

    // Missing file yields defaults. Malformed JSON throws std::runtime_error.
    static AppConfig load(const std::string& path);

    nlohmann::json toJson() const;
};

// VOXDECK_LOG_LEVEL, VOXDECK_BRIDGE_URL
void applyEnvironment(AppConfig& config);

// KEY=VALUE lines; existing environment wins.
void loadDotEnv(const std::string& path);

std::string getEnv(const std::string& key, const std::string& defaultVal = "");
