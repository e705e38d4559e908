#pragma once
#include "audio/PcmBuffer.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

// Peak envelope for waveform rendering: `bars` bins, each the maximum
// absolute sample (any channel) in its span. normalize scales the loudest
// bin to 1.
inline std::vector<float> computePeaks(const PcmBuffer& pcm, int bars, bool normalize = true) {
    std::vector<float> peaks(bars > 0 ? bars : 0, 0.0f);
    size_t frames = pcm.frames();
    if (peaks.empty() || frames == 0) return peaks;

    for (int b = 0; b < bars; b++) {
        size_t begin = frames * b / bars;
        size_t end   = std::max(begin + 1, frames * (b + 1) / bars);
        end = std::min(end, frames);
        float peak = 0.0f;
        for (size_t f = begin; f < end; f++)
            for (int c = 0; c < pcm.channels; c++)
                peak = std::max(peak, std::fabs(pcm.samples[f * pcm.channels + c]));
        peaks[b] = peak;
    }

    if (normalize) {
        float loudest = *std::max_element(peaks.begin(), peaks.end());
        if (loudest > 0.0f)
            for (auto& p : peaks) p /= loudest;
    }
    return peaks;
}
