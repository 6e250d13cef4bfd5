#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "engine/NoteEvent.h"

namespace midi {

// Decodes a raw channel message. Only note-on (0x9n) and note-off (0x8n) are
// accepted; a note-on with velocity 0 becomes a note-off. Returns false for
// anything else, including truncated messages and stray data bytes.
bool DecodeMessage(const std::uint8_t* bytes, std::size_t size, engine::NoteEvent& event);

std::array<std::uint8_t, 3> EncodeMessage(const engine::NoteEvent& event);

}  // namespace midi
