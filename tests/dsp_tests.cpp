#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "dsp/Filter.h"
#include "dsp/Limiter.h"
#include "dsp/Reverb.h"

namespace {

constexpr float kTwoPi = 6.28318530717958647692f;

float maxAbs(const std::vector<float>& buffer, std::size_t begin, std::size_t end) {
    float peak = 0.0f;
    for (std::size_t i = begin; i < end && i < buffer.size(); ++i) {
        peak = std::max(peak, std::abs(buffer[i]));
    }
    return peak;
}

}  // namespace

TEST_CASE("OnePoleLowPass alpha=1 直通, 滤波器链按顺序处理", "[dsp][filter]") {
    dsp::OnePoleLowPass passthrough(1.0f);
    REQUIRE(passthrough.process(0.3f) == Catch::Approx(0.3f));
    REQUIRE(passthrough.process(-0.7f) == Catch::Approx(-0.7f));

    REQUIRE(dsp::OnePoleLowPass(1.5f).alpha() == 1.0f);
    REQUIRE(dsp::OnePoleLowPass(-0.5f).alpha() == 0.0f);

    dsp::OnePoleLowPass smoother(0.5f);
    REQUIRE(smoother.process(1.0f) == Catch::Approx(0.5f));
    REQUIRE(smoother.process(1.0f) == Catch::Approx(0.75f));
    smoother.reset();
    REQUIRE(smoother.process(0.0f) == 0.0f);

    dsp::FilterChain chain;
    REQUIRE(chain.empty());
    REQUIRE(chain.process(0.25f) == 0.25f);
    chain.addFilter(std::make_unique<dsp::OnePoleLowPass>(0.5f));
    chain.addFilter(std::make_unique<dsp::OnePoleLowPass>(0.5f));
    REQUIRE(chain.size() == 2);
    REQUIRE(chain.process(1.0f) == Catch::Approx(0.25f));
}

TEST_CASE("Comb and allpass impulse responses", "[dsp][filter]") {
    dsp::CombFilter comb(3, 0.5f, 0.0f);
    std::vector<float> combOut;
    for (int i = 0; i < 8; ++i) {
        combOut.push_back(comb.process(i == 0 ? 1.0f : 0.0f));
    }
    REQUIRE(combOut[0] == 0.0f);
    REQUIRE(combOut[2] == 0.0f);
    REQUIRE(combOut[3] == Catch::Approx(1.0f));
    REQUIRE(combOut[6] == Catch::Approx(0.5f));

    dsp::AllPassFilter allPass(2, 0.5f);
    REQUIRE(allPass.process(1.0f) == Catch::Approx(-0.5f));
    REQUIRE(allPass.process(0.0f) == Catch::Approx(0.0f));
    REQUIRE(allPass.process(0.0f) == Catch::Approx(1.0f));
    REQUIRE(allPass.process(0.0f) == Catch::Approx(0.0f));
    REQUIRE(allPass.process(0.0f) == Catch::Approx(0.5f));

    allPass.reset();
    REQUIRE(allPass.process(0.0f) == 0.0f);
    REQUIRE(allPass.process(0.0f) == 0.0f);
}

TEST_CASE("Reverb 延迟长度按采样率换算", "[dsp][reverb]") {
    REQUIRE(dsp::Reverb::DelaySamples(29.7f, 44100.0f) == 1310);
    REQUIRE(dsp::Reverb::DelaySamples(1.7f, 48000.0f) == 82);
    REQUIRE(dsp::Reverb::DelaySamples(0.001f, 100.0f) == 1);

    dsp::Reverb reverb(44100.0f);
    REQUIRE(reverb.combs().size() == dsp::Reverb::kNumCombs);
    REQUIRE(reverb.combs()[0].delaySamples() == 1310);
    REQUIRE(reverb.combs()[3].delaySamples() == 1927);
}

TEST_CASE("Reverb defaults keep the fixed comb constants until a setter runs", "[dsp][reverb]") {
    dsp::Reverb reverb(44100.0f);
    REQUIRE(reverb.roomSize() == Catch::Approx(0.5f));
    REQUIRE(reverb.damping() == Catch::Approx(0.5f));
    REQUIRE(reverb.wetLevel() == Catch::Approx(0.33f));
    REQUIRE(reverb.dryLevel() == Catch::Approx(0.4f));
    REQUIRE(reverb.width() == Catch::Approx(1.0f));
    for (const auto& comb : reverb.combs()) {
        REQUIRE(comb.feedback() == Catch::Approx(0.84f));
        REQUIRE(comb.damping() == Catch::Approx(0.2f));
    }

    reverb.setRoomSize(0.5f);
    for (const auto& comb : reverb.combs()) {
        REQUIRE(comb.feedback() == Catch::Approx(0.7f));
        REQUIRE(comb.damping() == Catch::Approx(0.5f));
    }
}

TEST_CASE("Reverb setters clamp to [0, 1]", "[dsp][reverb]") {
    dsp::Reverb reverb(48000.0f);
    reverb.setRoomSize(3.0f);
    reverb.setDamping(-1.0f);
    reverb.setWetLevel(2.0f);
    reverb.setDryLevel(-0.5f);
    reverb.setWidth(7.0f);
    REQUIRE(reverb.roomSize() == 1.0f);
    REQUIRE(reverb.damping() == 0.0f);
    REQUIRE(reverb.wetLevel() == 1.0f);
    REQUIRE(reverb.dryLevel() == 0.0f);
    REQUIRE(reverb.width() == 1.0f);
    REQUIRE(reverb.combs()[0].feedback() == Catch::Approx(1.0f));
}

TEST_CASE("wet=0 dry=1 时脉冲原样通过", "[dsp][reverb]") {
    dsp::Reverb reverb(44100.0f);
    reverb.setWetLevel(0.0f);
    reverb.setDryLevel(1.0f);

    std::vector<float> input(4096, 0.0f);
    input[0] = 1.0f;
    std::vector<float> output(input.size(), 0.0f);
    reverb.processBlock(input.data(), output.data(), input.size());

    REQUIRE(output[0] == Catch::Approx(1.0f).margin(1e-2));
    REQUIRE(maxAbs(output, 1, output.size()) < 1e-2f);
}

TEST_CASE("混响尾音在静音输入下衰减", "[dsp][reverb]") {
    const float sampleRate = 44100.0f;
    dsp::Reverb reverb(sampleRate);
    for (int i = 0; i < 441; ++i) {
        reverb.process(std::sin(kTwoPi * 440.0f * static_cast<float>(i) / sampleRate));
    }

    std::vector<float> tail(2 * 44100 + 4410, 0.0f);
    for (auto& sample : tail) {
        sample = reverb.process(0.0f);
        REQUIRE(std::isfinite(sample));
    }
    const float early = maxAbs(tail, 0, 4410);
    const float late = maxAbs(tail, 2 * 44100, tail.size());
    REQUIRE(early > 0.0f);
    REQUIRE(late < early * 0.1f);

    reverb.reset();
    REQUIRE(reverb.process(0.0f) == 0.0f);
}

TEST_CASE("Reverb stays finite for bounded input", "[dsp][reverb]") {
    dsp::Reverb reverb(44100.0f);
    reverb.setRoomSize(1.0f);
    reverb.setDamping(0.0f);
    reverb.setWetLevel(1.0f);
    std::uint32_t seed = 12345;
    for (int i = 0; i < 10000; ++i) {
        seed = seed * 1664525u + 1013904223u;
        const float input = static_cast<float>(seed >> 8) / 8388608.0f - 1.0f;
        const float output = reverb.process(input);
        REQUIRE(std::isfinite(output));
        REQUIRE(std::abs(output) < 50.0f);
    }
}

TEST_CASE("Limiter 低于阈值时不做增益衰减", "[dsp][limiter]") {
    dsp::Limiter limiter(44100.0f);
    REQUIRE(limiter.thresholdDb() == Catch::Approx(-3.0f));
    for (int i = 0; i < 4410; ++i) {
        const float input = 0.5f * std::sin(kTwoPi * 220.0f * static_cast<float>(i) / 44100.0f);
        REQUIRE(limiter.process(input) == Catch::Approx(input));
        REQUIRE(limiter.gainReduction() == 1.0f);
    }
    REQUIRE(limiter.gainReductionDb() == Catch::Approx(0.0f).margin(1e-6));
}

TEST_CASE("Limiter approaches the threshold gradually for a step input", "[dsp][limiter]") {
    dsp::Limiter limiter(44100.0f);
    const float threshold = std::pow(10.0f, -3.0f / 20.0f);

    // The follower starts at zero, so the first sample passes untouched.
    REQUIRE(limiter.process(1.0f) == Catch::Approx(1.0f));

    float previous = 1.0f;
    float output = 1.0f;
    for (int i = 0; i < 44100; ++i) {
        output = limiter.process(1.0f);
        REQUIRE(output <= previous + 1e-6f);
        previous = output;
    }
    REQUIRE(output == Catch::Approx(threshold).margin(1e-3));
    REQUIRE(limiter.envelope() == Catch::Approx(1.0f).margin(1e-3));
    REQUIRE(limiter.gainReductionDb() == Catch::Approx(-3.0f).margin(0.01));

    limiter.reset();
    REQUIRE(limiter.envelope() == 0.0f);
    REQUIRE(limiter.gainReduction() == 1.0f);
}

TEST_CASE("Limiter setters clamp and makeup gain applies", "[dsp][limiter]") {
    dsp::Limiter limiter(48000.0f);
    limiter.setThresholdDb(-100.0f);
    limiter.setAttackSeconds(0.0f);
    limiter.setReleaseSeconds(10.0f);
    limiter.setMakeupGainDb(50.0f);
    REQUIRE(limiter.thresholdDb() == -60.0f);
    REQUIRE(limiter.attackSeconds() == Catch::Approx(0.001f));
    REQUIRE(limiter.releaseSeconds() == 3.0f);
    REQUIRE(limiter.makeupGainDb() == 30.0f);

    dsp::Limiter makeup(48000.0f);
    makeup.setThresholdDb(0.0f);
    makeup.setMakeupGainDb(6.0f);
    REQUIRE(makeup.process(0.1f) == Catch::Approx(0.1f * std::pow(10.0f, 0.3f)));
}

TEST_CASE("Limiter processBlock matches per-sample processing", "[dsp][limiter]") {
    dsp::Limiter a(44100.0f);
    dsp::Limiter b(44100.0f);
    std::vector<float> input(512);
    for (std::size_t i = 0; i < input.size(); ++i) {
        input[i] = 2.0f * std::sin(kTwoPi * static_cast<float>(i) / 64.0f);
    }
    std::vector<float> output(input.size());
    a.processBlock(input.data(), output.data(), input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        REQUIRE(output[i] == Catch::Approx(b.process(input[i])));
    }
}
