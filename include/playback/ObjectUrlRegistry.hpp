#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Temporary in-memory object URLs ("blob:voxdeck/<n>") for clips that
// never touched disk. Every create() must be paired with a revoke();
// PlaybackController revokes the URLs owned by a binding when it tears
// the binding down.
class ObjectUrlRegistry {
public:
    struct Blob {
        std::shared_ptr<const std::vector<uint8_t>> bytes;
        std::string mime;
    };

    static constexpr const char* kScheme = "blob:voxdeck/";

    std::string create(std::vector<uint8_t> bytes, const std::string& mime);

    // Thread-safe; fetchers resolve on the worker.
    std::optional<Blob> resolve(const std::string& url) const;

    // False if the URL was unknown or already revoked.
    bool revoke(const std::string& url);

    size_t size() const;

    static bool isObjectUrl(const std::string& url);

private:
    mutable std::mutex          mtx_;
    std::map<std::string, Blob> blobs_;
    uint64_t                    next_ = 1;
};
