#include "dsp/Limiter.h"

#include <algorithm>
#include <cmath>

namespace dsp {

namespace {
constexpr float kFallbackSampleRate = 44100.0f;

float DbToLinear(float db) {
    return std::pow(10.0f, db / 20.0f);
}

float TimeCoefficient(float seconds, float sampleRate) {
    return std::exp(-1.0f / (sampleRate * seconds));
}
}  // namespace

Limiter::Limiter(float sampleRate)
    : sampleRate_(sampleRate > 0.0f ? sampleRate : kFallbackSampleRate) {
    threshold_ = DbToLinear(thresholdDb_);
    makeup_ = DbToLinear(makeupDb_);
    attackCoef_ = TimeCoefficient(attackSeconds_, sampleRate_);
    releaseCoef_ = TimeCoefficient(releaseSeconds_, sampleRate_);
}

float Limiter::process(float input) {
    const float level = std::fabs(input);
    const float coef = level > envelope_ ? attackCoef_ : releaseCoef_;
    envelope_ = coef * (envelope_ - level) + level;

    gainReduction_ = envelope_ > threshold_ ? threshold_ / envelope_ : 1.0f;
    return input * gainReduction_ * makeup_;
}

void Limiter::processBlock(const float* in, float* out, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        out[i] = process(in[i]);
    }
}

void Limiter::reset() {
    envelope_ = 0.0f;
    gainReduction_ = 1.0f;
}

void Limiter::setThresholdDb(float thresholdDb) {
    thresholdDb_ = std::clamp(thresholdDb, -60.0f, 0.0f);
    threshold_ = DbToLinear(thresholdDb_);
}

void Limiter::setAttackSeconds(float seconds) {
    attackSeconds_ = std::clamp(seconds, 0.001f, 1.0f);
    attackCoef_ = TimeCoefficient(attackSeconds_, sampleRate_);
}

void Limiter::setReleaseSeconds(float seconds) {
    releaseSeconds_ = std::clamp(seconds, 0.001f, 3.0f);
    releaseCoef_ = TimeCoefficient(releaseSeconds_, sampleRate_);
}

void Limiter::setMakeupGainDb(float gainDb) {
    makeupDb_ = std::clamp(gainDb, 0.0f, 30.0f);
    makeup_ = DbToLinear(makeupDb_);
}

float Limiter::gainReductionDb() const {
    return 20.0f * std::log10(gainReduction_);
}

}  // namespace dsp
