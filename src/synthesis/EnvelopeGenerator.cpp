#include "synthesis/EnvelopeGenerator.h"

namespace synthesis {

namespace {
constexpr float kInstantEpsilon = 1e-6f;
constexpr float kMinLevel = 0.0f;
constexpr float kMaxLevel = 1.0f;
constexpr float kReleaseFloor = 0.0001f;  // -80 dB
constexpr float kReleaseKneeLevel = 0.1f;
constexpr float kReleaseInitialFactor = 2.5f;

std::optional<float> RateFor(float seconds, float span, float sampleRate) {
    if (seconds <= kInstantEpsilon) {
        return std::nullopt;
    }
    return span / (sampleRate * seconds);
}
}  // namespace

EnvelopeGenerator::EnvelopeGenerator(float attackSeconds,
                                     float decaySeconds,
                                     float sustainLevel,
                                     float releaseSeconds,
                                     float sampleRate)
    : sustainLevel_(sustainLevel),
      attackRate_(RateFor(attackSeconds, 1.0f, sampleRate)),
      decayRate_(RateFor(decaySeconds, 1.0f - sustainLevel, sampleRate)),
      releaseRate_(RateFor(releaseSeconds, 1.0f, sampleRate)) {}

void EnvelopeGenerator::trigger() {
    state_ = EnvelopeState::Attack;
}

void EnvelopeGenerator::release() {
    state_ = EnvelopeState::Release;
}

float EnvelopeGenerator::process() {
    switch (state_) {
        case EnvelopeState::Idle:
            currentLevel_ = kMinLevel;
            break;
        case EnvelopeState::Attack:
            if (attackRate_) {
                currentLevel_ += *attackRate_;
                if (currentLevel_ >= kMaxLevel) {
                    currentLevel_ = kMaxLevel;
                    state_ = EnvelopeState::Decay;
                }
            } else {
                currentLevel_ = kMaxLevel;
                state_ = EnvelopeState::Decay;
            }
            break;
        case EnvelopeState::Decay:
            if (decayRate_) {
                currentLevel_ -= *decayRate_;
                if (currentLevel_ <= sustainLevel_) {
                    currentLevel_ = sustainLevel_;
                    state_ = EnvelopeState::Sustain;
                }
            } else {
                currentLevel_ = sustainLevel_;
                state_ = EnvelopeState::Sustain;
            }
            break;
        case EnvelopeState::Sustain:
            currentLevel_ -= sustainDecayRate_;
            if (currentLevel_ <= kMinLevel) {
                currentLevel_ = kMinLevel;
                state_ = EnvelopeState::Idle;
            }
            break;
        case EnvelopeState::Release:
            if (releaseRate_) {
                const float factor =
                    currentLevel_ > kReleaseKneeLevel ? kReleaseInitialFactor : 1.0f;
                currentLevel_ -= *releaseRate_ * currentLevel_ * factor;
                if (currentLevel_ <= kReleaseFloor) {
                    currentLevel_ = kMinLevel;
                    state_ = EnvelopeState::Idle;
                }
            } else {
                currentLevel_ = kMinLevel;
                state_ = EnvelopeState::Idle;
            }
            break;
    }
    return currentLevel_ * velocityLevel_;
}

}  // namespace synthesis
