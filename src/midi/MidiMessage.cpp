#include "midi/MidiMessage.h"

namespace midi {

namespace {
constexpr std::uint8_t kNoteOff = 0x80;
constexpr std::uint8_t kNoteOn = 0x90;
}  // namespace

bool DecodeMessage(const std::uint8_t* bytes, std::size_t size, engine::NoteEvent& event) {
    if (!bytes || size < 3) {
        return false;
    }
    const std::uint8_t status = bytes[0];
    const std::uint8_t type = status & 0xF0u;
    if (type != kNoteOff && type != kNoteOn) {
        return false;
    }
    if ((bytes[1] & 0x80u) || (bytes[2] & 0x80u)) {
        return false;
    }

    const int channel = status & 0x0Fu;
    const int note = bytes[1];
    const int velocity = bytes[2];
    if (type == kNoteOn && velocity > 0) {
        event = engine::NoteEvent::On(note, velocity, channel);
    } else {
        event = engine::NoteEvent::Off(note, velocity, channel);
    }
    return true;
}

std::array<std::uint8_t, 3> EncodeMessage(const engine::NoteEvent& event) {
    const std::uint8_t type =
        event.type == engine::NoteEventType::NoteOn ? kNoteOn : kNoteOff;
    return {static_cast<std::uint8_t>(type | (event.channel & 0x0Fu)),
            static_cast<std::uint8_t>(event.note & 0x7Fu),
            static_cast<std::uint8_t>(event.velocity & 0x7Fu)};
}

}  // namespace midi
