#include "engine/VoiceAllocator.h"

namespace engine {

namespace {
std::optional<std::size_t> QuietestInState(const VoiceStatus* voices,
                                           std::size_t count,
                                           synthesis::EnvelopeState state) {
    std::optional<std::size_t> best;
    for (std::size_t i = 0; i < count; ++i) {
        if (voices[i].state != state) {
            continue;
        }
        if (!best || voices[i].level < voices[*best].level) {
            best = i;
        }
    }
    return best;
}
}  // namespace

std::optional<std::size_t> FindFreeVoice(const VoiceStatus* voices, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        if (!voices[i].active) {
            return i;
        }
    }
    return std::nullopt;
}

std::size_t SelectVoiceToSteal(const VoiceStatus* voices, std::size_t count) {
    if (auto index = QuietestInState(voices, count, synthesis::EnvelopeState::Release)) {
        return *index;
    }
    if (auto index = QuietestInState(voices, count, synthesis::EnvelopeState::Sustain)) {
        return *index;
    }

    std::size_t quietest = 0;
    for (std::size_t i = 1; i < count; ++i) {
        if (voices[i].level < voices[quietest].level) {
            quietest = i;
        }
    }
    return quietest;
}

}  // namespace engine
