#include "synthesis/PianoVoice.h"

#include <algorithm>
#include <cmath>

#include "synthesis/Inharmonicity.h"

namespace synthesis {

namespace {
constexpr float kTwoPi = 6.28318530717958647692f;
constexpr float kFallbackSampleRate = 44100.0f;

constexpr float kVelocityCurve = 0.8f;
constexpr float kBaseSustainDecay = 0.00001f;  // per sample at 44.1 kHz
constexpr float kReferenceRate = 44100.0f;
constexpr float kDecayReferenceFrequency = 110.0f;
constexpr float kVelocityDecayScale = 0.3f;
constexpr float kAttackTransientRate = 50.0f;  // 1 / 20 ms

// Fundamental, 2nd, 3rd.
constexpr std::array<float, 3> kBodyAmplitudes = {0.6f, 0.4f, 0.15f};
// 4th, 5th; scaled by brightness and boosted during the attack.
constexpr std::array<float, 2> kBrightAmplitudes = {0.2f, 0.14f};
// 6th..8th; only present while the hammer transient lasts.
constexpr std::array<float, 3> kPingAmplitudes = {0.05f, 0.03f, 0.02f};

constexpr float kAttackGate = 0.01f;
constexpr float kDetunedAmplitude = 0.1f;
constexpr float kHammerNoiseAmplitude = 0.2f;
constexpr float kThumpAmplitude = 0.5f;
constexpr float kHeadroom = 0.3f;

float Wrap(float phase) {
    return phase - std::floor(phase);
}

float Sine(float phase) {
    return std::sin(kTwoPi * phase);
}
}  // namespace

PianoKey PianoKey::FromMidiNote(std::uint8_t midiNote) {
    PianoKey key;
    key.midiNote = midiNote;
    key.frequency = 440.0f * std::pow(2.0f, (static_cast<float>(midiNote) - 69.0f) / 12.0f);
    return key;
}

PianoVoice::PianoVoice(float sampleRate, const VoiceConfig& config)
    : sampleRate_(sampleRate > 0.0f ? sampleRate : kFallbackSampleRate),
      config_(config),
      envelope_(config.attackSeconds,
                config.decaySeconds,
                config.sustainLevel,
                config.releaseSeconds,
                sampleRate_) {}

void PianoVoice::noteOn(const PianoKey& key, std::uint8_t velocity) {
    currentKey_ = key;
    updatePhaseDeltas();

    const float normalized = static_cast<float>(std::min<std::uint8_t>(velocity, 127)) / 127.0f;
    velocity_ = std::pow(normalized, kVelocityCurve);
    envelope_.setVelocity(velocity_);

    attackPhase_ = 0.0f;
    notePhase_ = 0.0f;

    // Thin treble strings lose energy faster; hard strikes ring a little longer.
    const float baseRate = kBaseSustainDecay * (kReferenceRate / sampleRate_);
    const float frequencyFactor = std::sqrt(key.frequency / kDecayReferenceFrequency);
    const float velocityFactor = 1.0f - velocity_ * kVelocityDecayScale;
    envelope_.setSustainDecayRate(baseRate * frequencyFactor * velocityFactor);

    envelope_.trigger();
    active_ = true;
}

void PianoVoice::noteOff() {
    envelope_.release();
}

void PianoVoice::updatePhaseDeltas() {
    if (!currentKey_) {
        return;
    }
    const float f0 = currentKey_->frequency;
    phaseDelta_ = f0 / sampleRate_;

    const auto strings = PianoStringParameters::ForMidiNote(currentKey_->midiNote);
    const InharmonicityModel model(strings.diameter, strings.length, strings.tension);
    for (std::size_t i = 0; i < kNumPartials; ++i) {
        const auto n = static_cast<unsigned int>(i + 1);
        const float frequency = config_.inharmonic ? model.partialFrequency(f0, n)
                                                   : static_cast<float>(n) * f0;
        const float delta = frequency / sampleRate_;
        if (delta < 0.5f) {
            partialDeltas_[i] = delta;
        } else {
            // Past Nyquist: park the phase at zero so the partial adds sin(0) = 0.
            partialDeltas_[i] = 0.0f;
            partialPhases_[i] = 0.0f;
        }
    }
}

float PianoVoice::process() {
    if (!active_ && !envelope_.isActive()) {
        return 0.0f;
    }

    const float envValue = envelope_.process();
    if (!envelope_.isActive()) {
        active_ = false;
        return 0.0f;
    }

    if (envelope_.state() == EnvelopeState::Attack || attackPhase_ < 1.0f) {
        const float rate = kAttackTransientRate / sampleRate_;
        attackPhase_ += rate * (1.0f - attackPhase_);
        attackPhase_ = std::min(attackPhase_, 1.0f);
    }

    for (std::size_t i = 0; i < kNumPartials; ++i) {
        partialPhases_[i] = Wrap(partialPhases_[i] + partialDeltas_[i]);
    }
    detunedPhase_ = Wrap(detunedPhase_ + phaseDelta_ * config_.detuning);
    notePhase_ += phaseDelta_;

    const float attackIntensity = (1.0f - attackPhase_) * velocity_;
    const float dynamicBrightness = config_.brightness * (0.7f + 0.3f * velocity_);
    const float attackBoost = 1.0f + attackIntensity * 2.0f;

    float sample = 0.0f;
    for (std::size_t i = 0; i < kBodyAmplitudes.size(); ++i) {
        sample += kBodyAmplitudes[i] * Sine(partialPhases_[i]);
    }
    for (std::size_t i = 0; i < kBrightAmplitudes.size(); ++i) {
        sample += dynamicBrightness * kBrightAmplitudes[i] * attackBoost *
                  Sine(partialPhases_[3 + i]);
    }

    if (attackIntensity > kAttackGate) {
        for (std::size_t i = 0; i < kPingAmplitudes.size(); ++i) {
            sample += dynamicBrightness * kPingAmplitudes[i] * attackIntensity *
                      Sine(partialPhases_[5 + i]);
        }
    }

    sample += kDetunedAmplitude * Sine(detunedPhase_);

    if (attackIntensity > kAttackGate) {
        // Hammer felt noise: driven by the decaying attack intensity so it evolves
        // instead of repeating with the string period.
        const float noise1 = Sine(attackIntensity * 3.71f);
        const float noise2 = std::cos(kTwoPi * attackIntensity * 5.83f);
        const float noise3 = Sine((notePhase_ * 0.5f + attackIntensity * 0.5f) * 8.91f);
        sample += noise1 * noise2 * noise3 * attackIntensity * velocity_ * kHammerNoiseAmplitude;

        sample += attackIntensity * velocity_ * kThumpAmplitude * Sine(attackIntensity * 5.0f);
    }

    return sample * kHeadroom * envValue;
}

void PianoVoice::processBlock(float* out, std::size_t frames) {
    for (std::size_t i = 0; i < frames; ++i) {
        out[i] += process();
    }
}

}  // namespace synthesis
