#include "audio/StreamEncoder.hpp"
#include "audio/MimeType.hpp"
#include "audio/OpusFrameCodec.hpp"
#include "core/AudioError.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

std::string L16StreamEncoder::mime() const {
    return "audio/L16;rate=" + std::to_string(sampleRate_) +
           ";channels=" + std::to_string(channels_);
}

void L16StreamEncoder::push(const float* interleaved, size_t frames) {
    size_t n = frames * channels_;
    out_.reserve(out_.size() + n * 2);
    for (size_t i = 0; i < n; i++) {
        float s = std::clamp(interleaved[i], -1.0f, 1.0f);
        auto v = static_cast<int16_t>(s < 0 ? s * 32768.0f : s * 32767.0f);
        auto u = static_cast<uint16_t>(v);
        out_.push_back(static_cast<uint8_t>(u >> 8));     // network byte order
        out_.push_back(static_cast<uint8_t>(u & 0xFF));
    }
}

PcmBuffer decodeL16(const std::vector<uint8_t>& bytes, int sampleRate, int channels) {
    if (sampleRate <= 0 || channels <= 0)
        throw AudioException(ErrorKind::DecodeFailure,
                             "audio/L16 requires rate and channels");
    if (bytes.size() % (2 * static_cast<size_t>(channels)) != 0)
        throw AudioException(ErrorKind::DecodeFailure,
                             "audio/L16 payload is not frame aligned");

    PcmBuffer pcm;
    pcm.sampleRate = sampleRate;
    pcm.channels   = channels;
    pcm.samples.reserve(bytes.size() / 2);
    for (size_t i = 0; i + 1 < bytes.size(); i += 2) {
        auto v = static_cast<int16_t>((bytes[i] << 8) | bytes[i + 1]);
        pcm.samples.push_back(v < 0 ? v / 32768.0f : v / 32767.0f);
    }
    return pcm;
}

bool isTypeSupported(const std::string& mime, int sampleRate, int channels) {
    auto m = MimeType::parse(mime);
    if (m.essence() == OpusStreamEncoder::kMime)
        return OpusStreamEncoder::supports(sampleRate, channels);
    if (m.type == "audio" && m.subtype == "l16")
        return sampleRate > 0 && channels > 0;
    return false;
}

std::unique_ptr<IStreamEncoder> makeStreamEncoder(const std::string& preferredMime,
                                                  int sampleRate, int channels) {
    if (!preferredMime.empty() && isTypeSupported(preferredMime, sampleRate, channels)) {
        auto m = MimeType::parse(preferredMime);
        if (m.essence() == OpusStreamEncoder::kMime) {
            try {
                return std::make_unique<OpusStreamEncoder>(sampleRate, channels);
            } catch (const AudioException& e) {
                spdlog::warn("Opus encoder unavailable ({}) — falling back to L16",
                             e.what());
            }
        }
    } else if (!preferredMime.empty()) {
        spdlog::info("'{}' not supported for {}Hz/{}ch — using platform default",
                     preferredMime, sampleRate, channels);
    }
    return std::make_unique<L16StreamEncoder>(sampleRate, channels);
}
