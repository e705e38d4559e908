#include "playback/MediaFetcher.hpp"
#include "core/AudioError.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

MediaFetcher::MediaFetcher(std::shared_ptr<ObjectUrlRegistry> registry, int timeoutMs)
    : registry_(std::move(registry)), timeoutMs_(timeoutMs) {}

std::string MediaFetcher::mimeForPath(const std::string& path) {
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos) return "application/octet-stream";
    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (ext == "wav" || ext == "wave") return "audio/wav";
    if (ext == "flac")                 return "audio/flac";
    if (ext == "ogg" || ext == "oga")  return "audio/ogg";
    if (ext == "aif" || ext == "aiff") return "audio/aiff";
    if (ext == "vxop")                 return "audio/x-opus-frames";
    return "application/octet-stream";
}

FetchedMedia MediaFetcher::fetch(const std::string& url, const Progress& progress) const {
    if (url.empty())
        throw AudioException(ErrorKind::LoadFailure, "empty source URL");

    if (ObjectUrlRegistry::isObjectUrl(url)) {
        auto blob = registry_ ? registry_->resolve(url) : std::nullopt;
        if (!blob)
            throw AudioException(ErrorKind::LoadFailure, "object URL revoked or unknown: " + url);
        if (progress) progress(100);
        return {*blob->bytes, blob->mime};
    }

    if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0)
        return fetchHttp(url, progress);

    std::string path = url.rfind("file://", 0) == 0 ? url.substr(7) : url;
    auto media = fetchFile(path);
    if (progress) progress(100);
    return media;
}

FetchedMedia MediaFetcher::fetchHttp(const std::string& url, const Progress& progress) const {
    // Split "scheme://host[:port]" from the path
    auto hostStart = url.find("://") + 3;
    auto pathStart = url.find('/', hostStart);
    std::string origin = pathStart == std::string::npos ? url : url.substr(0, pathStart);
    std::string path   = pathStart == std::string::npos ? "/" : url.substr(pathStart);

    httplib::Client cli(origin);
    cli.set_connection_timeout(timeoutMs_ / 1000, (timeoutMs_ % 1000) * 1000);
    cli.set_read_timeout(timeoutMs_ / 1000, (timeoutMs_ % 1000) * 1000);
    cli.set_follow_location(true);

    int lastPercent = -1;
    auto res = cli.Get(path, [&](uint64_t current, uint64_t total) {
        if (progress && total > 0) {
            int pct = static_cast<int>(current * 100 / total);
            if (pct != lastPercent) {
                lastPercent = pct;
                progress(pct);
            }
        }
        return true;
    });

    if (!res)
        throw AudioException(ErrorKind::LoadFailure,
                             "GET " + url + ": " + httplib::to_string(res.error()));
    if (res->status != 200)
        throw AudioException(ErrorKind::LoadFailure,
                             "GET " + url + ": HTTP " + std::to_string(res->status));

    FetchedMedia media;
    media.bytes.assign(res->body.begin(), res->body.end());
    media.mime = res->get_header_value("Content-Type");
    if (media.mime.empty() || media.mime == "application/octet-stream")
        media.mime = mimeForPath(path.substr(0, path.find('?')));
    if (progress && lastPercent != 100) progress(100);

    spdlog::debug("Fetched {} ({} bytes, {})", url, media.bytes.size(), media.mime);
    return media;
}

FetchedMedia MediaFetcher::fetchFile(const std::string& path) const {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
        throw AudioException(ErrorKind::LoadFailure, "cannot open " + path);

    FetchedMedia media;
    media.bytes.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    media.mime = mimeForPath(path);
    return media;
}
