#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace engine {

// Audio callback seam. output holds sampleCount interleaved samples
// (sampleCount / channels frames). Implementations must fill every sample.
class Synth {
public:
    virtual ~Synth() = default;
    virtual void play(std::uint32_t sampleRate,
                      std::size_t channels,
                      float* output,
                      std::size_t sampleCount) = 0;
};

class SilentSynth : public Synth {
public:
    void play(std::uint32_t, std::size_t, float* output, std::size_t sampleCount) override {
        std::fill(output, output + sampleCount, 0.0f);
        ++callCount_;
    }

    std::size_t callCount() const { return callCount_; }

private:
    std::size_t callCount_ = 0;
};

}  // namespace engine
