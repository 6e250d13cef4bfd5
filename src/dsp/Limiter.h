#pragma once

#include <cstddef>

namespace dsp {

// Feed-forward peak limiter with an attack/release envelope follower.
class Limiter {
public:
    explicit Limiter(float sampleRate);

    float process(float input);
    void processBlock(const float* in, float* out, std::size_t count);
    void reset();

    void setThresholdDb(float thresholdDb);   // [-60, 0]
    void setAttackSeconds(float seconds);     // [0.001, 1]
    void setReleaseSeconds(float seconds);    // [0.001, 3]
    void setMakeupGainDb(float gainDb);       // [0, 30]

    float thresholdDb() const { return thresholdDb_; }
    float attackSeconds() const { return attackSeconds_; }
    float releaseSeconds() const { return releaseSeconds_; }
    float makeupGainDb() const { return makeupDb_; }

    // Linear gain applied to the last sample, 1 when idle.
    float gainReduction() const { return gainReduction_; }
    float gainReductionDb() const;
    float envelope() const { return envelope_; }

private:
    float sampleRate_;

    float thresholdDb_ = -3.0f;
    float attackSeconds_ = 0.005f;
    float releaseSeconds_ = 0.05f;
    float makeupDb_ = 0.0f;

    float threshold_ = 1.0f;
    float makeup_ = 1.0f;
    float attackCoef_ = 0.0f;
    float releaseCoef_ = 0.0f;

    float envelope_ = 0.0f;
    float gainReduction_ = 1.0f;
};

}  // namespace dsp
