#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "synthesis/EnvelopeGenerator.h"

namespace synthesis {

struct PianoKey {
    float frequency = 440.0f;
    std::uint8_t midiNote = 69;

    // Equal temperament, A4 (69) = 440 Hz.
    static PianoKey FromMidiNote(std::uint8_t midiNote);
};

struct VoiceConfig {
    float attackSeconds = 0.01f;
    float decaySeconds = 0.1f;
    float sustainLevel = 0.7f;
    float releaseSeconds = 0.3f;
    float detuning = 1.003f;    // Chorus oscillator ratio.
    float brightness = 0.8f;    // Weight of partials 4..8.
    bool inharmonic = true;     // Stretch partials with the string stiffness model.
};

class PianoVoice {
public:
    static constexpr std::size_t kNumPartials = 8;

    PianoVoice(float sampleRate, const VoiceConfig& config = {});

    void noteOn(const PianoKey& key, std::uint8_t velocity);
    // Starts the release tail; the voice stays active until the envelope ends.
    void noteOff();

    float process();
    // Adds this voice's output into out[0..frames).
    void processBlock(float* out, std::size_t frames);

    bool isActive() const { return active_; }
    const std::optional<PianoKey>& currentKey() const { return currentKey_; }
    const EnvelopeGenerator& envelope() const { return envelope_; }
    float velocity() const { return velocity_; }
    float attackPhase() const { return attackPhase_; }
    float partialDelta(std::size_t partialIndex) const { return partialDeltas_[partialIndex]; }
    float partialPhase(std::size_t partialIndex) const { return partialPhases_[partialIndex]; }

private:
    void updatePhaseDeltas();

    float sampleRate_;
    VoiceConfig config_;
    EnvelopeGenerator envelope_;
    std::optional<PianoKey> currentKey_;
    bool active_ = false;

    float detunedPhase_ = 0.0f;
    float notePhase_ = 0.0f;
    float phaseDelta_ = 0.0f;
    std::array<float, kNumPartials> partialPhases_{};
    std::array<float, kNumPartials> partialDeltas_{};

    float velocity_ = 1.0f;
    float attackPhase_ = 0.0f;
};

}  // namespace synthesis
