#include "midi/MidiFileReader.h"

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <iterator>

#include "midi/MidiMessage.h"

namespace midi {

namespace {

constexpr std::uint32_t kDefaultTempo = 500000;  // us per quarter, 120 BPM

struct TickEvent {
    std::uint64_t tick = 0;
    engine::NoteEvent event;
};

struct TempoChange {
    std::uint64_t tick = 0;
    std::uint32_t microsecondsPerQuarter = kDefaultTempo;
};

// Bounds-checked big-endian cursor over a byte buffer.
class ByteReader {
public:
    ByteReader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    bool atEnd() const { return pos_ >= size_; }
    std::size_t remaining() const { return size_ - pos_; }
    const std::uint8_t* current() const { return data_ + pos_; }

    bool peek(std::uint8_t& value) const {
        if (atEnd()) {
            return false;
        }
        value = data_[pos_];
        return true;
    }

    bool readU8(std::uint8_t& value) {
        if (!peek(value)) {
            return false;
        }
        ++pos_;
        return true;
    }

    bool readU16(std::uint16_t& value) {
        if (remaining() < 2) {
            return false;
        }
        value = static_cast<std::uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return true;
    }

    bool readU32(std::uint32_t& value) {
        if (remaining() < 4) {
            return false;
        }
        value = (static_cast<std::uint32_t>(data_[pos_]) << 24) |
                (static_cast<std::uint32_t>(data_[pos_ + 1]) << 16) |
                (static_cast<std::uint32_t>(data_[pos_ + 2]) << 8) |
                static_cast<std::uint32_t>(data_[pos_ + 3]);
        pos_ += 4;
        return true;
    }

    // At most four bytes, seven bits each.
    bool readVarLen(std::uint32_t& value) {
        value = 0;
        for (int i = 0; i < 4; ++i) {
            std::uint8_t byte = 0;
            if (!readU8(byte)) {
                return false;
            }
            value = (value << 7) | (byte & 0x7Fu);
            if ((byte & 0x80u) == 0) {
                return true;
            }
        }
        return false;
    }

    bool skip(std::size_t count) {
        if (remaining() < count) {
            return false;
        }
        pos_ += count;
        return true;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_ = 0;
};

bool ReadChunk(ByteReader& reader, const char* expectedId, ByteReader& chunk,
               std::string& errorMessage) {
    if (reader.remaining() < 8) {
        errorMessage = std::string("Unexpected end of file before ") + expectedId + " chunk.";
        return false;
    }
    const auto* id = reader.current();
    if (!std::equal(id, id + 4, expectedId)) {
        errorMessage = std::string("Expected ") + expectedId + " chunk.";
        return false;
    }
    std::uint32_t length = 0;
    if (!reader.skip(4) || !reader.readU32(length) || reader.remaining() < length) {
        errorMessage = std::string(expectedId) + " chunk length exceeds file size.";
        return false;
    }
    chunk = ByteReader(reader.current(), length);
    reader.skip(length);
    return true;
}

bool ParseTrack(ByteReader track,
                std::vector<TickEvent>& notes,
                std::vector<TempoChange>& tempos,
                std::uint64_t& endTick,
                std::string& errorMessage) {
    std::uint64_t tick = 0;
    std::uint8_t runningStatus = 0;

    while (!track.atEnd()) {
        std::uint32_t delta = 0;
        if (!track.readVarLen(delta)) {
            errorMessage = "Malformed delta time.";
            return false;
        }
        tick += delta;

        std::uint8_t status = 0;
        if (!track.peek(status)) {
            break;
        }
        if (status & 0x80u) {
            track.skip(1);
        } else if (runningStatus != 0) {
            status = runningStatus;
        } else {
            errorMessage = "Running status used before any status byte.";
            return false;
        }

        if (status == 0xFF) {
            std::uint8_t type = 0;
            std::uint32_t length = 0;
            if (!track.readU8(type) || !track.readVarLen(length) || track.remaining() < length) {
                errorMessage = "Malformed meta event.";
                return false;
            }
            if (type == 0x2F) {
                break;
            }
            if (type == 0x51 && length == 3) {
                const auto* p = track.current();
                tempos.push_back({tick, (static_cast<std::uint32_t>(p[0]) << 16) |
                                            (static_cast<std::uint32_t>(p[1]) << 8) |
                                            static_cast<std::uint32_t>(p[2])});
            }
            track.skip(length);
            continue;
        }

        if (status == 0xF0 || status == 0xF7) {
            std::uint32_t length = 0;
            if (!track.readVarLen(length) || !track.skip(length)) {
                errorMessage = "Malformed SysEx event.";
                return false;
            }
            continue;
        }

        if (status >= 0xF0) {
            errorMessage = "Unsupported system message in track.";
            return false;
        }

        runningStatus = status;
        const std::uint8_t type = status & 0xF0u;
        const std::size_t dataBytes = (type == 0xC0 || type == 0xD0) ? 1 : 2;
        if (track.remaining() < dataBytes) {
            errorMessage = "Truncated channel message.";
            return false;
        }

        std::uint8_t message[3] = {status, track.current()[0], 0};
        if (dataBytes == 2) {
            message[2] = track.current()[1];
        }
        track.skip(dataBytes);

        engine::NoteEvent event;
        if (DecodeMessage(message, sizeof(message), event)) {
            notes.push_back({tick, event});
        }
    }

    endTick = tick;
    return true;
}

// Converts absolute ticks to seconds using the merged tempo map.
class TempoMap {
public:
    TempoMap(std::vector<TempoChange> changes, std::uint16_t ticksPerQuarter)
        : ticksPerQuarter_(ticksPerQuarter) {
        std::stable_sort(changes.begin(), changes.end(),
                         [](const TempoChange& a, const TempoChange& b) { return a.tick < b.tick; });
        segments_.push_back({0, 0.0, kDefaultTempo});
        for (const auto& change : changes) {
            const Segment& last = segments_.back();
            const double start = last.seconds + span(last, change.tick);
            if (change.tick == last.tick) {
                segments_.back().microsecondsPerQuarter = change.microsecondsPerQuarter;
            } else {
                segments_.push_back({change.tick, start, change.microsecondsPerQuarter});
            }
        }
    }

    double seconds(std::uint64_t tick) const {
        auto it = std::upper_bound(segments_.begin(), segments_.end(), tick,
                                   [](std::uint64_t t, const Segment& s) { return t < s.tick; });
        const Segment& segment = *std::prev(it);
        return segment.seconds + span(segment, tick);
    }

private:
    struct Segment {
        std::uint64_t tick;
        double seconds;
        std::uint32_t microsecondsPerQuarter;
    };

    double span(const Segment& from, std::uint64_t tick) const {
        return static_cast<double>(tick - from.tick) * from.microsecondsPerQuarter * 1e-6 /
               static_cast<double>(ticksPerQuarter_);
    }

    std::uint16_t ticksPerQuarter_;
    std::vector<Segment> segments_;
};

// Within one tick, a note-off moves ahead of the note-ons unless its own key
// was struck earlier in the same tick (a zero-length note keeps on -> off).
void HoistNoteOffs(std::vector<TickEvent>::iterator first, std::vector<TickEvent>::iterator last) {
    std::vector<TickEvent> hoisted;
    std::vector<TickEvent> rest;
    for (auto it = first; it != last; ++it) {
        const auto& event = it->event;
        const bool keepInPlace =
            event.type == engine::NoteEventType::NoteOn ||
            std::any_of(rest.begin(), rest.end(), [&](const TickEvent& earlier) {
                return earlier.event.type == engine::NoteEventType::NoteOn &&
                       earlier.event.note == event.note &&
                       earlier.event.channel == event.channel;
            });
        (keepInPlace ? rest : hoisted).push_back(*it);
    }
    auto out = std::copy(hoisted.begin(), hoisted.end(), first);
    std::copy(rest.begin(), rest.end(), out);
}

}  // namespace

bool ParseMidiData(const std::vector<std::uint8_t>& data,
                   MidiSequence& outSequence,
                   std::string& errorMessage) {
    ByteReader file(data.data(), data.size());
    ByteReader header(nullptr, 0);
    if (!ReadChunk(file, "MThd", header, errorMessage)) {
        return false;
    }

    std::uint16_t format = 0;
    std::uint16_t trackCount = 0;
    std::uint16_t division = 0;
    if (!header.readU16(format) || !header.readU16(trackCount) || !header.readU16(division)) {
        errorMessage = "MIDI header is too short.";
        return false;
    }
    if (format > 1) {
        errorMessage = "Only MIDI format 0 or 1 files are supported.";
        return false;
    }
    if (division & 0x8000u) {
        errorMessage = "SMPTE time division is not supported.";
        return false;
    }
    if (division == 0) {
        errorMessage = "Invalid ticks-per-quarter value.";
        return false;
    }

    std::vector<TickEvent> notes;
    std::vector<TempoChange> tempos;
    std::uint64_t lastTick = 0;
    for (std::uint16_t i = 0; i < trackCount; ++i) {
        ByteReader track(nullptr, 0);
        if (!ReadChunk(file, "MTrk", track, errorMessage)) {
            return false;
        }
        std::uint64_t endTick = 0;
        if (!ParseTrack(track, notes, tempos, endTick, errorMessage)) {
            errorMessage = "Track " + std::to_string(i) + ": " + errorMessage;
            return false;
        }
        lastTick = std::max(lastTick, endTick);
    }

    std::stable_sort(notes.begin(), notes.end(),
                     [](const TickEvent& a, const TickEvent& b) { return a.tick < b.tick; });
    for (auto first = notes.begin(); first != notes.end();) {
        const auto last = std::find_if(first, notes.end(), [&](const TickEvent& e) {
            return e.tick != first->tick;
        });
        HoistNoteOffs(first, last);
        first = last;
    }

    const TempoMap tempoMap(std::move(tempos), division);
    MidiSequence sequence;
    sequence.ticksPerQuarter = division;
    sequence.events.reserve(notes.size());
    for (const auto& note : notes) {
        sequence.events.push_back({tempoMap.seconds(note.tick), note.event});
    }
    sequence.lengthSeconds = tempoMap.seconds(lastTick);

    outSequence = std::move(sequence);
    return true;
}

bool LoadMidiFile(const std::filesystem::path& path,
                  MidiSequence& outSequence,
                  std::string& errorMessage) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        errorMessage = "Failed to open MIDI file: " + path.string();
        return false;
    }
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(stream)),
                                   std::istreambuf_iterator<char>());
    if (stream.bad()) {
        errorMessage = "Failed to read MIDI file: " + path.string();
        return false;
    }
    return ParseMidiData(data, outSequence, errorMessage);
}

}  // namespace midi
