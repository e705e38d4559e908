#pragma once
#include "PcmBuffer.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Decodes any payload the core produces or accepts:
// audio/L16, audio/x-opus-frames, and whatever libsndfile reads.
// Throws AudioException(DecodeFailure).
PcmBuffer decodeAudio(const std::vector<uint8_t>& bytes, const std::string& mime);

// Canonicalizer contract: convert(bytes, mime) -> canonical bytes.
// Must be idempotent on already-canonical input. Throws on failure;
// the capture pipeline then delivers the raw bytes instead.
class IAudioCanonicalizer {
public:
    virtual ~IAudioCanonicalizer() = default;

    virtual std::vector<uint8_t> convert(const std::vector<uint8_t>& bytes,
                                         const std::string& mime) = 0;

    virtual std::string canonicalMime() const = 0;
};

// Canonical format: 16-bit PCM WAV.
class WavCanonicalizer : public IAudioCanonicalizer {
public:
    std::vector<uint8_t> convert(const std::vector<uint8_t>& bytes,
                                 const std::string& mime) override;

    std::string canonicalMime() const override { return "audio/wav"; }
};
