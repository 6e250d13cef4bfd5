#pragma once

#include <cstddef>
#include <optional>

#include "synthesis/EnvelopeGenerator.h"

namespace engine {

struct VoiceStatus {
    bool active = false;
    synthesis::EnvelopeState state = synthesis::EnvelopeState::Idle;
    float level = 0.0f;
    int midiNote = -1;
};

// Index of the first inactive voice, if any.
std::optional<std::size_t> FindFreeVoice(const VoiceStatus* voices, std::size_t count);

// Quietest releasing voice, else quietest sustaining voice, else quietest overall.
// Ties keep the lowest index. count must be > 0.
std::size_t SelectVoiceToSteal(const VoiceStatus* voices, std::size_t count);

}  // namespace engine
