#include "dsp/Reverb.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <memory>

namespace dsp {

namespace {
constexpr float kFallbackSampleRate = 44100.0f;

constexpr std::array<float, Reverb::kNumCombs> kCombDelaysMs = {29.7f, 37.1f, 41.1f, 43.7f};
constexpr float kCombFeedback = 0.84f;
constexpr float kCombDamping = 0.2f;

constexpr std::array<float, Reverb::kNumAllPasses> kAllPassDelaysMs = {5.0f, 1.7f};
constexpr float kAllPassFeedback = 0.5f;

constexpr float kRoomScale = 0.6f;
constexpr float kRoomOffset = 0.4f;

float clamp01(float value) {
    return std::clamp(value, 0.0f, 1.0f);
}
}  // namespace

std::size_t Reverb::DelaySamples(float milliseconds, float sampleRate) {
    const long samples = std::lround(milliseconds * 0.001f * sampleRate);
    return static_cast<std::size_t>(std::max(1L, samples));
}

Reverb::Reverb(float sampleRate)
    : sampleRate_(sampleRate > 0.0f ? sampleRate : kFallbackSampleRate) {
    combs_.reserve(kNumCombs);
    for (float ms : kCombDelaysMs) {
        combs_.emplace_back(DelaySamples(ms, sampleRate_), kCombFeedback, kCombDamping);
    }
    for (float ms : kAllPassDelaysMs) {
        allPasses_.addFilter(
            std::make_unique<AllPassFilter>(DelaySamples(ms, sampleRate_), kAllPassFeedback));
    }
}

float Reverb::process(float input) {
    float sum = 0.0f;
    for (auto& comb : combs_) {
        sum += comb.process(input);
    }
    const float wet = allPasses_.process(sum / static_cast<float>(combs_.size()));
    return dry_ * input + wet_ * wet;
}

void Reverb::processBlock(const float* in, float* out, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        out[i] = process(in[i]);
    }
}

void Reverb::reset() {
    for (auto& comb : combs_) {
        comb.reset();
    }
    allPasses_.reset();
}

void Reverb::setRoomSize(float roomSize) {
    roomSize_ = clamp01(roomSize);
    updateCombs();
}

void Reverb::setDamping(float damping) {
    damping_ = clamp01(damping);
    updateCombs();
}

void Reverb::setWetLevel(float wet) {
    wet_ = clamp01(wet);
}

void Reverb::setDryLevel(float dry) {
    dry_ = clamp01(dry);
}

void Reverb::setWidth(float width) {
    width_ = clamp01(width);
}

void Reverb::updateCombs() {
    const float feedback = roomSize_ * kRoomScale + kRoomOffset;
    for (auto& comb : combs_) {
        comb.setFeedback(feedback);
        comb.setDamping(damping_);
    }
}

}  // namespace dsp
