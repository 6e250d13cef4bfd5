#pragma once

#include <algorithm>
#include <cstdint>

namespace engine {

enum class NoteEventType : std::uint8_t {
    NoteOn,
    NoteOff,
};

struct NoteEvent {
    NoteEventType type = NoteEventType::NoteOn;
    std::uint8_t channel = 0;   // 0..15
    std::uint8_t note = 60;     // 0..127
    std::uint8_t velocity = 0;  // 0..127

    static NoteEvent On(int note, int velocity, int channel = 0) {
        return Make(NoteEventType::NoteOn, note, velocity, channel);
    }

    static NoteEvent Off(int note, int velocity = 0, int channel = 0) {
        return Make(NoteEventType::NoteOff, note, velocity, channel);
    }

    bool operator==(const NoteEvent& other) const = default;

private:
    static NoteEvent Make(NoteEventType type, int note, int velocity, int channel) {
        NoteEvent event;
        event.type = type;
        event.channel = static_cast<std::uint8_t>(std::clamp(channel, 0, 15));
        event.note = static_cast<std::uint8_t>(std::clamp(note, 0, 127));
        event.velocity = static_cast<std::uint8_t>(std::clamp(velocity, 0, 127));
        return event;
    }
};

// A note event scheduled at an absolute time, as read from a file or a note list.
struct TimedNoteEvent {
    double timeSeconds = 0.0;
    NoteEvent event;
};

}  // namespace engine
