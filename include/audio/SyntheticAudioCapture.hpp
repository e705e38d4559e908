#pragma once
#include "IAudioCapture.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <optional>

// Tone generator standing in for a microphone. Samples are produced on
// read() in proportion to the wall-clock time since the previous read, so
// a drained stream has the same length as a real device would deliver.
// open() can be made to fail to exercise permission/device errors.
class SyntheticAudioCapture : public IAudioCapture {
public:
    explicit SyntheticAudioCapture(double frequencyHz = 440.0,
                                   float amplitude = 0.25f)
        : frequency_(frequencyHz), amplitude_(amplitude) {}

    void failOpenWith(const AudioError& error) { injected_ = error; }

    bool open(const Config& config) override {
        config_ = config;
        if (injected_) {
            lastError_ = *injected_;
            return false;
        }
        opened_ = true;
        lastError_ = {};
        return true;
    }

    bool start() override {
        if (!opened_) {
            lastError_ = {ErrorKind::DeviceUnavailable, "start() before open()"};
            return false;
        }
        running_  = true;
        lastRead_ = std::chrono::steady_clock::now();
        return true;
    }

    void stop() override {
        running_ = false;
        opened_  = false;
        stopCount_++;
    }

    bool isRunning() const override { return running_; }

    size_t read(std::vector<float>& out, size_t maxFrames) override {
        if (!running_) return 0;
        auto now = std::chrono::steady_clock::now();
        double secs = std::chrono::duration<double>(now - lastRead_).count();
        auto frames = static_cast<size_t>(secs * config_.sampleRate);
        frames = std::min(frames, maxFrames);
        if (frames == 0) return 0;
        lastRead_ += std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(frames / config_.sampleRate));

        const double step = kTwoPi * frequency_ / config_.sampleRate;
        for (size_t f = 0; f < frames; f++) {
            float s = amplitude_ * static_cast<float>(std::sin(phase_));
            phase_ += step;
            for (int c = 0; c < config_.channelCount; c++)
                out.push_back(s);
        }
        if (phase_ > kTwoPi) phase_ = std::fmod(phase_, kTwoPi);
        return frames;
    }

    const Config& config() const override { return config_; }
    AudioError lastError() const override { return lastError_; }

    std::vector<DeviceInfo> listDevices() const override {
        return {{0, "Synthetic tone", 2, 48000}};
    }

    std::string backendName() const override { return "synthetic"; }

    int stopCount() const { return stopCount_; }

private:
    static constexpr double kTwoPi = 6.283185307179586;

    double frequency_;
    float  amplitude_;
    double phase_ = 0.0;
    bool   opened_  = false;
    bool   running_ = false;
    int    stopCount_ = 0;
    Config config_;
    AudioError lastError_;
    std::optional<AudioError> injected_;
    std::chrono::steady_clock::time_point lastRead_;
};
