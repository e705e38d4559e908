#pragma once
#include <cstddef>
#include <vector>

// Decoded audio: interleaved float samples in [-1, 1].
struct PcmBuffer {
    std::vector<float> samples;
    int sampleRate = 0;
    int channels   = 0;

    size_t frames() const {
        return channels > 0 ? samples.size() / channels : 0;
    }

    double durationSeconds() const {
        return sampleRate > 0 ? static_cast<double>(frames()) / sampleRate : 0.0;
    }

    bool empty() const { return samples.empty(); }
};
