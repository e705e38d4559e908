#include <gtest/gtest.h>
#include "audio/SignalConditioner.hpp"
#include <cmath>
#include <vector>

namespace {

std::vector<float> tone(size_t frames, float amp, float dc = 0.0f) {
    std::vector<float> out(frames);
    for (size_t i = 0; i < frames; i++)
        out[i] = dc + amp * static_cast<float>(std::sin(2.0 * M_PI * 1000.0 * i / 48000.0));
    return out;
}

float rms(const std::vector<float>& s) {
    double sum = 0;
    for (float v : s) sum += v * v;
    return static_cast<float>(std::sqrt(sum / s.size()));
}

float mean(const std::vector<float>& s) {
    double sum = 0;
    for (float v : s) sum += v;
    return static_cast<float>(sum / s.size());
}

} // namespace

TEST(SignalConditionerTest, DbConversions) {
    EXPECT_NEAR(SignalConditioner::toDb(1.0f), 0.0f, 1e-5);
    EXPECT_NEAR(SignalConditioner::toDb(0.1f), -20.0f, 1e-4);
    EXPECT_NEAR(SignalConditioner::fromDb(-6.0206f), 0.5f, 1e-4);
    EXPECT_LT(SignalConditioner::toDb(0.0f), -150.0f);
}

TEST(SignalConditionerTest, RemovesDcOffset) {
    SignalConditioner::Settings s;
    s.noiseSuppression = false;
    s.autoGainControl  = false;
    SignalConditioner cond(1, s);

    std::vector<float> block;
    for (int i = 0; i < 20; i++) {
        block = tone(4800, 0.2f, 0.3f);
        cond.process(block);
    }
    EXPECT_NEAR(mean(block), 0.0f, 0.01f);
    EXPECT_NEAR(rms(block), 0.2f / std::sqrt(2.0f), 0.02f);
}

TEST(SignalConditionerTest, GateAttenuatesQuietBlocks) {
    SignalConditioner::Settings s;
    s.autoGainControl = false;
    SignalConditioner cond(1, s);

    auto quiet = tone(480, 0.0005f);    // about -69 dBFS
    cond.process(quiet);
    EXPECT_FLOAT_EQ(cond.gateGain(), s.gateFloor);

    auto loud = tone(480, 0.3f);
    cond.process(loud);
    EXPECT_FLOAT_EQ(cond.gateGain(), 1.0f);
}

TEST(SignalConditionerTest, AutoGainMovesTowardTarget) {
    SignalConditioner::Settings s;
    s.noiseSuppression = false;
    SignalConditioner cond(1, s);

    // -40 dBFS input, target -20: gain climbs toward +18 (capped)
    for (int i = 0; i < 100; i++) {
        auto block = tone(480, 0.01f * std::sqrt(2.0f));
        cond.process(block);
    }
    EXPECT_GT(cond.currentGainDb(), 15.0f);
    EXPECT_LE(cond.currentGainDb(), s.maxGainDb);
}

TEST(SignalConditionerTest, AutoGainHoldsDuringSilence) {
    SignalConditioner::Settings s;
    s.noiseSuppression = false;
    SignalConditioner cond(1, s);

    for (int i = 0; i < 20; i++) {
        auto block = tone(480, 0.02f);
        cond.process(block);
    }
    // Let the DC blocker tail die out first
    for (int i = 0; i < 4; i++) {
        std::vector<float> silence(480, 0.0f);
        cond.process(silence);
    }
    float held = cond.currentGainDb();

    for (int i = 0; i < 20; i++) {
        std::vector<float> silence(480, 0.0f);
        cond.process(silence);
    }
    EXPECT_NEAR(cond.currentGainDb(), held, 1e-4);
}

TEST(SignalConditionerTest, OutputIsClipped) {
    SignalConditioner::Settings s;
    s.noiseSuppression = false;
    s.autoGainControl  = false;
    SignalConditioner cond(2, s);

    std::vector<float> block = {3.0f, -3.0f, 0.0f, 0.0f};
    cond.process(block);
    for (float v : block) {
        EXPECT_LE(v, 1.0f);
        EXPECT_GE(v, -1.0f);
    }
}

TEST(SignalConditionerTest, ResetRestoresUnityGain) {
    SignalConditioner cond(1, SignalConditioner::Settings{});
    auto quiet = tone(480, 0.0001f);
    cond.process(quiet);
    cond.reset();
    EXPECT_FLOAT_EQ(cond.gateGain(), 1.0f);
    EXPECT_FLOAT_EQ(cond.currentGainDb(), 0.0f);
}
