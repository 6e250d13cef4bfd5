#include "dsp/Filter.h"

#include <algorithm>

namespace dsp {

namespace {
float clamp01(float value) {
    return std::max(0.0f, std::min(1.0f, value));
}
}  // namespace

OnePoleLowPass::OnePoleLowPass(float alpha)
    : alpha_(clamp01(alpha)), state_(0.0f) {}

void OnePoleLowPass::setAlpha(float alpha) {
    alpha_ = clamp01(alpha);
}

float OnePoleLowPass::process(float input) {
    state_ = alpha_ * input + (1.0f - alpha_) * state_;
    return state_;
}

void OnePoleLowPass::reset() {
    state_ = 0.0f;
}

DelayLine::DelayLine(std::size_t length) : buffer_(std::max<std::size_t>(1, length), 0.0f) {}

void DelayLine::writeAndAdvance(float value) {
    buffer_[index_] = value;
    if (++index_ == buffer_.size()) {
        index_ = 0;
    }
}

void DelayLine::clear() {
    std::fill(buffer_.begin(), buffer_.end(), 0.0f);
    index_ = 0;
}

CombFilter::CombFilter(std::size_t delaySamples, float feedback, float damping)
    : delay_(delaySamples), feedback_(feedback), damping_(damping) {
    setDamping(damping);
}

void CombFilter::setDamping(float damping) {
    damping_ = clamp01(damping);
    // damping is the weight of the previous state, i.e. 1 - alpha.
    damper_.setAlpha(1.0f - damping_);
}

float CombFilter::process(float input) {
    const float output = delay_.read();
    const float damped = damper_.process(output);
    delay_.writeAndAdvance(input + damped * feedback_);
    return output;
}

void CombFilter::reset() {
    delay_.clear();
    damper_.reset();
}

AllPassFilter::AllPassFilter(std::size_t delaySamples, float feedback)
    : delay_(delaySamples), feedback_(feedback) {}

float AllPassFilter::process(float input) {
    const float delayed = delay_.read();
    const float output = -input * feedback_ + delayed;
    delay_.writeAndAdvance(input + delayed * feedback_);
    return output;
}

void AllPassFilter::reset() {
    delay_.clear();
}

void FilterChain::addFilter(std::unique_ptr<Filter> filter) {
    filters_.emplace_back(std::move(filter));
}

void FilterChain::reset() {
    for (auto& filter : filters_) {
        filter->reset();
    }
}

bool FilterChain::empty() const {
    return filters_.empty();
}

float FilterChain::process(float input) {
    float value = input;
    for (auto& filter : filters_) {
        value = filter->process(value);
    }
    return value;
}

}  // namespace dsp
