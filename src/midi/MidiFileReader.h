#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "engine/NoteEvent.h"

namespace midi {

struct MidiSequence {
    // Sorted by time; at equal times note-offs come first.
    std::vector<engine::TimedNoteEvent> events;
    double lengthSeconds = 0.0;
    std::uint16_t ticksPerQuarter = 480;
};

// Reads a format 0 or 1 Standard MIDI File with a PPQ time division.
bool LoadMidiFile(const std::filesystem::path& path,
                  MidiSequence& outSequence,
                  std::string& errorMessage);

// Same as LoadMidiFile, from an in-memory image.
bool ParseMidiData(const std::vector<std::uint8_t>& data,
                   MidiSequence& outSequence,
                   std::string& errorMessage);

}  // namespace midi
