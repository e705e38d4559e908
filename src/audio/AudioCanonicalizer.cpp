#include "audio/AudioCanonicalizer.hpp"
#include "audio/MimeType.hpp"
#include "audio/OpusFrameCodec.hpp"
#include "audio/StreamEncoder.hpp"
#include "audio/WavCodec.hpp"
#include "core/AudioError.hpp"
#include <spdlog/spdlog.h>

PcmBuffer decodeAudio(const std::vector<uint8_t>& bytes, const std::string& mime) {
    if (bytes.empty())
        throw AudioException(ErrorKind::DecodeFailure, "empty audio payload");

    auto m = MimeType::parse(mime);
    if (m.type == "audio" && m.subtype == "l16")
        return decodeL16(bytes, m.intParam("rate", 0), m.intParam("channels", 1));
    if (m.essence() == OpusStreamEncoder::kMime)
        return decodeOpusFrames(bytes);
    return WavCodec::decode(bytes);
}

std::vector<uint8_t> WavCanonicalizer::convert(const std::vector<uint8_t>& bytes,
                                               const std::string& mime) {
    if (bytes.empty())
        throw AudioException(ErrorKind::EncodeFailure, "nothing to convert");

    auto m = MimeType::parse(mime);
    if ((m.isWav() || mime.empty()) && WavCodec::isPcm16Wav(bytes)) {
        spdlog::debug("Canonicalizer: input already PCM-16 WAV ({} bytes)", bytes.size());
        return bytes;
    }

    PcmBuffer pcm;
    try {
        pcm = decodeAudio(bytes, mime);
    } catch (const AudioException& e) {
        throw AudioException(ErrorKind::EncodeFailure,
                             "cannot decode '" + mime + "': " + e.what());
    }
    if (pcm.empty())
        throw AudioException(ErrorKind::EncodeFailure,
                             "'" + mime + "' decoded to zero samples");

    auto wav = WavCodec::encodePcm16(pcm);
    spdlog::debug("Canonicalizer: {} ({} bytes) -> audio/wav ({} bytes, {:.2f}s)",
                  m.essence(), bytes.size(), wav.size(), pcm.durationSeconds());
    return wav;
}
