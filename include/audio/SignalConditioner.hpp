#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

// Capture-side processing applied to each drained chunk before encoding.
//
//   DC blocker (always on)
//     → noise gate / downward expander   (noiseSuppression)
//       → smoothed RMS auto gain         (autoGainControl)
//         → hard clip to [-1, 1]
//
// Gains are ramped linearly across the block to avoid zipper noise.
class SignalConditioner {
public:
    struct Settings {
        bool  noiseSuppression = true;
        bool  autoGainControl  = true;
        float gateThresholdDb  = -55.0f;
        float gateFloor        = 0.1f;    // linear gain applied below threshold
        float targetRmsDb      = -20.0f;
        float maxGainDb        = 18.0f;
        float gainSmoothing    = 0.9f;    // per-block one-pole coefficient
    };

    SignalConditioner(int channels, const Settings& settings)
        : channels_(std::max(1, channels)), settings_(settings),
          prevIn_(channels_, 0.0f), prevOut_(channels_, 0.0f) {}

    // In place, interleaved.
    void process(float* samples, size_t frames) {
        if (frames == 0) return;

        removeDc(samples, frames);

        float rms = blockRms(samples, frames);
        float rmsDb = toDb(rms);

        if (settings_.noiseSuppression) {
            float target = rmsDb < settings_.gateThresholdDb ? settings_.gateFloor : 1.0f;
            applyRamp(samples, frames, gateGain_, target);
            gateGain_ = target;
        }

        if (settings_.autoGainControl) {
            float desired = currentGainDb_;
            // Silence and gated blocks hold the gain instead of pumping it up
            if (rmsDb > settings_.gateThresholdDb) {
                desired = std::clamp(settings_.targetRmsDb - rmsDb,
                                     -settings_.maxGainDb, settings_.maxGainDb);
            }
            float next = settings_.gainSmoothing * currentGainDb_ +
                         (1.0f - settings_.gainSmoothing) * desired;
            applyRamp(samples, frames, fromDb(currentGainDb_), fromDb(next));
            currentGainDb_ = next;
        }

        for (size_t i = 0; i < frames * channels_; i++)
            samples[i] = std::clamp(samples[i], -1.0f, 1.0f);
    }

    void process(std::vector<float>& samples) {
        process(samples.data(), samples.size() / channels_);
    }

    float currentGainDb() const { return currentGainDb_; }
    float gateGain() const { return gateGain_; }
    const Settings& settings() const { return settings_; }

    void reset() {
        std::fill(prevIn_.begin(), prevIn_.end(), 0.0f);
        std::fill(prevOut_.begin(), prevOut_.end(), 0.0f);
        currentGainDb_ = 0.0f;
        gateGain_ = 1.0f;
    }

    static float toDb(float linear) {
        return 20.0f * std::log10(std::max(linear, 1e-10f));
    }

    static float fromDb(float db) { return std::pow(10.0f, db / 20.0f); }

private:
    // y[n] = x[n] - x[n-1] + R * y[n-1]
    void removeDc(float* samples, size_t frames) {
        for (size_t f = 0; f < frames; f++) {
            for (int c = 0; c < channels_; c++) {
                float& s = samples[f * channels_ + c];
                float y = s - prevIn_[c] + kDcPole * prevOut_[c];
                prevIn_[c]  = s;
                prevOut_[c] = y;
                s = y;
            }
        }
    }

    float blockRms(const float* samples, size_t frames) const {
        double sum = 0.0;
        size_t n = frames * channels_;
        for (size_t i = 0; i < n; i++)
            sum += static_cast<double>(samples[i]) * samples[i];
        return static_cast<float>(std::sqrt(sum / n));
    }

    void applyRamp(float* samples, size_t frames, float from, float to) const {
        if (from == 1.0f && to == 1.0f) return;
        float step = (to - from) / static_cast<float>(frames);
        float g = from;
        for (size_t f = 0; f < frames; f++) {
            g += step;
            for (int c = 0; c < channels_; c++)
                samples[f * channels_ + c] *= g;
        }
    }

    static constexpr float kDcPole = 0.995f;

    int      channels_;
    Settings settings_;
    std::vector<float> prevIn_;
    std::vector<float> prevOut_;
    float currentGainDb_ = 0.0f;
    float gateGain_      = 1.0f;
};
