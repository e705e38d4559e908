#include "core/AppConfig.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace {

template <typename T>
T clampWarn(const char* key, T value, T lo, T hi) {
    T clamped = std::clamp(value, lo, hi);
    if (clamped != value)
        spdlog::warn("Config '{}' = {} out of range — clamped to {}",
                     key, value, clamped);
    return clamped;
}

const nlohmann::json& section(const nlohmann::json& j, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return empty;
    return *it;
}

} // namespace

AppConfig AppConfig::fromJson(const nlohmann::json& j) {
    AppConfig c;

    auto& log = section(j, "log");
    c.log.level = log.value("level", c.log.level);
    c.log.file  = log.value("file", c.log.file);

    auto& cap = section(j, "capture");
    c.capture.tickIntervalMs = clampWarn("capture.tick_interval_ms",
        cap.value("tick_interval_ms", c.capture.tickIntervalMs), 10, 1000);
    c.capture.finalizeTimeoutMs = clampWarn("capture.finalize_timeout_ms",
        cap.value("finalize_timeout_ms", c.capture.finalizeTimeoutMs), 100, 600000);

    auto& local = section(cap, "local");
    auto& lc = c.capture.local;
    lc.maxDurationSeconds = clampWarn("capture.local.max_duration_seconds",
        local.value("max_duration_seconds", lc.maxDurationSeconds), 1.0, 3600.0);
    lc.device     = local.value("device", lc.device);
    lc.deviceId   = local.value("device_id", lc.deviceId);
    lc.sampleRate = clampWarn("capture.local.sample_rate",
        local.value("sample_rate", lc.sampleRate), 8000, 192000);
    lc.channels   = clampWarn("capture.local.channels",
        local.value("channels", lc.channels), 1, 8);
    lc.echoCancellation = local.value("echo_cancellation", lc.echoCancellation);
    lc.noiseSuppression = local.value("noise_suppression", lc.noiseSuppression);
    lc.autoGainControl  = local.value("auto_gain_control", lc.autoGainControl);
    lc.preferredMime    = local.value("preferred_mime", lc.preferredMime);

    auto& sys = section(cap, "system");
    auto& sc = c.capture.system;
    sc.maxDurationSeconds = clampWarn("capture.system.max_duration_seconds",
        sys.value("max_duration_seconds", sc.maxDurationSeconds), 1.0, 3600.0);
    sc.bridgeUrl = sys.value("bridge_url", sc.bridgeUrl);
    sc.timeoutMs = clampWarn("capture.system.timeout_ms",
        sys.value("timeout_ms", sc.timeoutMs), 100, 120000);

    auto& pb = section(j, "playback");
    c.playback.volume = clampWarn("playback.volume",
        pb.value("volume", c.playback.volume), 0.0, 1.0);
    c.playback.loop   = pb.value("loop", c.playback.loop);
    c.playback.waveformBars = clampWarn("playback.waveform_bars",
        pb.value("waveform_bars", c.playback.waveformBars), 8, 1024);
    c.playback.height = clampWarn("playback.height",
        pb.value("height", c.playback.height), 8, 1024);

    auto& sc2 = section(j, "script");
    c.script.backend       = sc2.value("backend", c.script.backend);
    c.script.recordSeconds = clampWarn("script.record_seconds",
        sc2.value("record_seconds", c.script.recordSeconds), 0.1, 3600.0);
    c.script.outputPath    = sc2.value("output_path", c.script.outputPath);
    c.script.playBack      = sc2.value("play_back", c.script.playBack);

    c.headless = j.value("headless", c.headless);
    return c;
}

AppConfig AppConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file '{}' not found — using defaults", path);
        return AppConfig{};
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed config '" + path + "': " + e.what());
    }
    return fromJson(j);
}

nlohmann::json AppConfig::toJson() const {
    return {
        {"log", {{"level", log.level}, {"file", log.file}}},
        {"capture", {
            {"tick_interval_ms",    capture.tickIntervalMs},
            {"finalize_timeout_ms", capture.finalizeTimeoutMs},
            {"local", {
                {"max_duration_seconds", capture.local.maxDurationSeconds},
                {"device",            capture.local.device},
                {"device_id",         capture.local.deviceId},
                {"sample_rate",       capture.local.sampleRate},
                {"channels",          capture.local.channels},
                {"echo_cancellation", capture.local.echoCancellation},
                {"noise_suppression", capture.local.noiseSuppression},
                {"auto_gain_control", capture.local.autoGainControl},
                {"preferred_mime",    capture.local.preferredMime}
            }},
            {"system", {
                {"max_duration_seconds", capture.system.maxDurationSeconds},
                {"bridge_url", capture.system.bridgeUrl},
                {"timeout_ms", capture.system.timeoutMs}
            }}
        }},
        {"playback", {
            {"volume", playback.volume},
            {"loop",   playback.loop},
            {"waveform_bars", playback.waveformBars},
            {"height", playback.height}
        }},
        {"script", {
            {"backend",        script.backend},
            {"record_seconds", script.recordSeconds},
            {"output_path",    script.outputPath},
            {"play_back",      script.playBack}
        }},
        {"headless", headless}
    };
}

std::string getEnv(const std::string& key, const std::string& defaultVal) {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

void applyEnvironment(AppConfig& config) {
    config.log.level = getEnv("VOXDECK_LOG_LEVEL", config.log.level);
    config.capture.system.bridgeUrl =
        getEnv("VOXDECK_BRIDGE_URL", config.capture.system.bridgeUrl);
}

void loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
            val = val.substr(1, val.size() - 2);
        setenv(key.c_str(), val.c_str(), 0);
    }
}
