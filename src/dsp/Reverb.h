#pragma once

#include <cstddef>
#include <vector>

#include "dsp/Filter.h"

namespace dsp {

// Schroeder room: four parallel damped combs averaged, then two allpasses in series.
class Reverb {
public:
    static constexpr std::size_t kNumCombs = 4;
    static constexpr std::size_t kNumAllPasses = 2;

    explicit Reverb(float sampleRate);

    float process(float input);
    void processBlock(const float* in, float* out, std::size_t count);
    void reset();

    void setRoomSize(float roomSize);
    void setDamping(float damping);
    void setWetLevel(float wet);
    void setDryLevel(float dry);
    // Stored only; the engine renders one mono bus.
    void setWidth(float width);

    float roomSize() const { return roomSize_; }
    float damping() const { return damping_; }
    float wetLevel() const { return wet_; }
    float dryLevel() const { return dry_; }
    float width() const { return width_; }
    float sampleRate() const { return sampleRate_; }

    const std::vector<CombFilter>& combs() const { return combs_; }

    // max(1, round(ms * sr / 1000))
    static std::size_t DelaySamples(float milliseconds, float sampleRate);

private:
    void updateCombs();

    float sampleRate_;
    std::vector<CombFilter> combs_;
    FilterChain allPasses_;

    float roomSize_ = 0.5f;
    float damping_ = 0.5f;
    float wet_ = 0.33f;
    float dry_ = 0.4f;
    float width_ = 1.0f;
};

}  // namespace dsp
