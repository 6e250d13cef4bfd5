#pragma once

#include <optional>

namespace synthesis {

enum class EnvelopeState { Idle, Attack, Decay, Sustain, Release };

// ADSR with a piano-style sustain: the level keeps falling while the key is
// held, and the release drops faster above -20 dB than in its tail.
class EnvelopeGenerator {
public:
    // Times in seconds, sustain in [0, 1]. A time of (almost) zero makes that
    // stage instantaneous.
    EnvelopeGenerator(float attackSeconds,
                      float decaySeconds,
                      float sustainLevel,
                      float releaseSeconds,
                      float sampleRate);

    // Re-enters Attack from the current level (legato, no reset to zero).
    void trigger();
    void release();

    void setSustainDecayRate(float rate) { sustainDecayRate_ = rate; }
    void setVelocity(float velocity) { velocityLevel_ = velocity; }

    // Advances one sample; returns level scaled by velocity.
    float process();

    bool isActive() const { return state_ != EnvelopeState::Idle; }
    EnvelopeState state() const { return state_; }
    float currentLevel() const { return currentLevel_; }
    float sustainLevel() const { return sustainLevel_; }
    float sustainDecayRate() const { return sustainDecayRate_; }
    float velocityLevel() const { return velocityLevel_; }

private:
    float sustainLevel_;
    float currentLevel_ = 0.0f;
    EnvelopeState state_ = EnvelopeState::Idle;
    float sustainDecayRate_ = 0.0f;
    std::optional<float> attackRate_;
    std::optional<float> decayRate_;
    std::optional<float> releaseRate_;
    float velocityLevel_ = 1.0f;
};

}  // namespace synthesis
