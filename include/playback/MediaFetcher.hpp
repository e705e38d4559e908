#pragma once
#include "ObjectUrlRegistry.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct FetchedMedia {
    std::vector<uint8_t> bytes;
    std::string          mime;
};

// Resolves a playback URL to bytes. Blocking; run it on the worker.
//
//   blob:voxdeck/<n>     ObjectUrlRegistry
//   http:// https://     cpp-httplib GET, progress as percent
//   file:///path, path   local file, mime from the extension
//
// Failures throw AudioException(LoadFailure).
class MediaFetcher {
public:
    using Progress = std::function<void(int)>;

    explicit MediaFetcher(std::shared_ptr<ObjectUrlRegistry> registry,
                          int timeoutMs = 10000);

    FetchedMedia fetch(const std::string& url, const Progress& progress = {}) const;

    static std::string mimeForPath(const std::string& path);

private:
    FetchedMedia fetchHttp(const std::string& url, const Progress& progress) const;
    FetchedMedia fetchFile(const std::string& path) const;

    std::shared_ptr<ObjectUrlRegistry> registry_;
    int timeoutMs_;
};
