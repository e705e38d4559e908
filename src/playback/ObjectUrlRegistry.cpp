#include "playback/ObjectUrlRegistry.hpp"
#include <spdlog/spdlog.h>

std::string ObjectUrlRegistry::create(std::vector<uint8_t> bytes,
                                      const std::string& mime) {
    std::lock_guard lock(mtx_);
    std::string url = kScheme + std::to_string(next_++);
    size_t n = bytes.size();
    blobs_[url] = {std::make_shared<const std::vector<uint8_t>>(std::move(bytes)), mime};
    spdlog::debug("Object URL {} created ({} bytes, {})", url, n, mime);
    return url;
}

std::optional<ObjectUrlRegistry::Blob>
ObjectUrlRegistry::resolve(const std::string& url) const {
    std::lock_guard lock(mtx_);
    auto it = blobs_.find(url);
    if (it == blobs_.end()) return std::nullopt;
    return it->second;
}

bool ObjectUrlRegistry::revoke(const std::string& url) {
    std::lock_guard lock(mtx_);
    if (blobs_.erase(url) == 0) return false;
    spdlog::debug("Object URL {} revoked", url);
    return true;
}

size_t ObjectUrlRegistry::size() const {
    std::lock_guard lock(mtx_);
    return blobs_.size();
}

bool ObjectUrlRegistry::isObjectUrl(const std::string& url) {
    return url.rfind(kScheme, 0) == 0;
}
