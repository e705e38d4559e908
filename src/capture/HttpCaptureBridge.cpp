#include "capture/HttpCaptureBridge.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

ErrorKind categorizeBridgeError(const std::string& message) {
    std::string m = message;
    std::transform(m.begin(), m.end(), m.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (m.find("permission") != std::string::npos ||
        m.find("denied") != std::string::npos ||
        m.find("not authorized") != std::string::npos)
        return ErrorKind::PermissionDenied;
    if (m.find("unsupported") != std::string::npos ||
        m.find("not supported") != std::string::npos)
        return ErrorKind::UnsupportedPlatform;
    return ErrorKind::DeviceUnavailable;
}

namespace {

void applyTimeouts(httplib::Client& cli, int timeoutMs) {
    cli.set_connection_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
    cli.set_read_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
    cli.set_write_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
}

BridgeResult failure(ErrorKind kind, const std::string& message) {
    BridgeResult r;
    r.error = {kind, message};
    return r;
}

} // namespace

HttpCaptureBridge::HttpCaptureBridge(const SystemCaptureConfig& config)
    : config_(config) {}

bool HttpCaptureBridge::isSupported() {
    httplib::Client cli(config_.bridgeUrl);
    applyTimeouts(cli, config_.timeoutMs);

    auto res = cli.Get("/capture/supported");
    if (!res || res->status != 200) {
        spdlog::debug("Capture bridge {} not reachable ({})", config_.bridgeUrl,
                      res ? std::to_string(res->status) : httplib::to_string(res.error()));
        return false;
    }

    try {
        auto j = nlohmann::json::parse(res->body);
        return j.value("supported", false);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Capture bridge sent malformed probe reply: {}", e.what());
        return false;
    }
}

BridgeResult HttpCaptureBridge::post(const std::string& path,
                                     const nlohmann::json& body) {
    httplib::Client cli(config_.bridgeUrl);
    applyTimeouts(cli, config_.timeoutMs);

    auto res = cli.Post(path, body.dump(), "application/json");
    if (!res)
        return failure(ErrorKind::DeviceUnavailable,
                       "capture bridge unreachable: " + httplib::to_string(res.error()));

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(res->body);
    } catch (const nlohmann::json::exception&) {
        return failure(ErrorKind::DeviceUnavailable,
                       "capture bridge error " + std::to_string(res->status) +
                       ": " + res->body.substr(0, 200));
    }

    if (j.contains("error") && j["error"].is_string()) {
        auto msg = j["error"].get<std::string>();
        return failure(categorizeBridgeError(msg), msg);
    }
    if (res->status != 200)
        return failure(ErrorKind::DeviceUnavailable,
                       "capture bridge error " + std::to_string(res->status));

    BridgeResult r;
    r.ok      = true;
    r.payload = std::move(res->body);
    return r;
}

BridgeResult HttpCaptureBridge::startCapture(int maxDurationSeconds) {
    return post("/capture/start", {{"max_duration_secs", maxDurationSeconds}});
}

BridgeResult HttpCaptureBridge::stopCapture() {
    auto r = post("/capture/stop", nlohmann::json::object());
    if (!r.ok) return r;

    try {
        auto j = nlohmann::json::parse(r.payload);
        if (!j.contains("audio_base64") || !j["audio_base64"].is_string())
            return failure(ErrorKind::DeviceUnavailable,
                           "capture bridge stop reply has no audio_base64");
        r.payload = j["audio_base64"].get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        return failure(ErrorKind::DeviceUnavailable,
                       std::string("capture bridge stop reply: ") + e.what());
    }
    return r;
}
