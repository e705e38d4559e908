#pragma once
#include "ICaptureBridge.hpp"
#include "core/AppConfig.hpp"
#include <nlohmann/json.hpp>
#include <optional>

// Native capture helper reached over loopback HTTP:
//
//   GET  /capture/supported                 → {"supported": bool}
//   POST /capture/start {"max_duration_secs"} → {"ok": true} | {"error": "..."}
//   POST /capture/stop                      → {"audio_base64": "..."} | {"error": "..."}
class HttpCaptureBridge : public ICaptureBridge {
public:
    explicit HttpCaptureBridge(const SystemCaptureConfig& config);

    bool isSupported() override;
    BridgeResult startCapture(int maxDurationSeconds) override;
    BridgeResult stopCapture() override;

    std::string endpoint() const override { return config_.bridgeUrl; }

private:
    // POST with JSON body; result.payload holds the response body on success
    BridgeResult post(const std::string& path, const nlohmann::json& body);

    SystemCaptureConfig config_;
};
