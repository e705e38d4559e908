#pragma once
#include "PcmBuffer.hpp"
#include <cstdint>
#include <vector>

// In-memory WAV encode/decode through libsndfile virtual I/O.
// decode() accepts anything libsndfile reads (WAV, FLAC, Ogg/Vorbis, AIFF).
class WavCodec {
public:
    // RIFF/WAVE, 16-bit PCM, little-endian. Samples are clipped to [-1, 1].
    static std::vector<uint8_t> encodePcm16(const PcmBuffer& pcm);

    static PcmBuffer decode(const std::vector<uint8_t>& bytes);

    static bool isPcm16Wav(const std::vector<uint8_t>& bytes);
};
