#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace dsp {

class Filter {
public:
    virtual ~Filter() = default;
    virtual float process(float input) = 0;
    virtual void reset() {}
};

// y += alpha * (x - y). alpha = 1 passes the input straight through.
class OnePoleLowPass : public Filter {
public:
    explicit OnePoleLowPass(float alpha = 0.5f);

    void setAlpha(float alpha);
    float alpha() const { return alpha_; }
    float process(float input) override;
    void reset() override;

private:
    float alpha_;
    float state_;
};

// Fixed-length delay line. The length is set once and never changes.
class DelayLine {
public:
    explicit DelayLine(std::size_t length);

    float read() const { return buffer_[index_]; }
    // Overwrites the slot just read and moves to the next one.
    void writeAndAdvance(float value);
    void clear();
    std::size_t length() const { return buffer_.size(); }

private:
    std::vector<float> buffer_;
    std::size_t index_ = 0;
};

// Feedback comb with a one-pole low-pass in the loop (Freeverb style damping).
class CombFilter : public Filter {
public:
    CombFilter(std::size_t delaySamples, float feedback, float damping);

    void setFeedback(float feedback) { feedback_ = feedback; }
    void setDamping(float damping);
    float feedback() const { return feedback_; }
    float damping() const { return damping_; }
    std::size_t delaySamples() const { return delay_.length(); }

    float process(float input) override;
    void reset() override;

private:
    DelayLine delay_;
    OnePoleLowPass damper_;
    float feedback_;
    float damping_;
};

// Schroeder allpass: flat magnitude, smears phase.
class AllPassFilter : public Filter {
public:
    AllPassFilter(std::size_t delaySamples, float feedback);

    float feedback() const { return feedback_; }
    std::size_t delaySamples() const { return delay_.length(); }

    float process(float input) override;
    void reset() override;

private:
    DelayLine delay_;
    float feedback_;
};

class FilterChain {
public:
    void addFilter(std::unique_ptr<Filter> filter);
    void reset();
    bool empty() const;
    std::size_t size() const { return filters_.size(); }
    float process(float input);

private:
    std::vector<std::unique_ptr<Filter>> filters_;
};

}  // namespace dsp
