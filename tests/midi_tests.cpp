#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "midi/MidiFileReader.h"
#include "midi/MidiMessage.h"

using engine::NoteEvent;
using engine::NoteEventType;

namespace {

void WriteVarLen(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
    std::uint8_t bytes[4];
    int count = 0;
    bytes[count++] = static_cast<std::uint8_t>(value & 0x7Fu);
    while ((value >>= 7u) != 0u) {
        bytes[count++] = static_cast<std::uint8_t>(0x80u | (value & 0x7Fu));
    }
    for (int i = count - 1; i >= 0; --i) {
        buffer.push_back(bytes[i]);
    }
}

struct TempFile {
    explicit TempFile(std::filesystem::path p) : path(std::move(p)) {}
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
    std::filesystem::path path;
};

class SmfBuilder {
public:
    SmfBuilder(std::uint16_t format, std::uint16_t division) {
        appendTag("MThd");
        appendU32(6);
        appendU16(format);
        trackCountOffset_ = bytes_.size();
        appendU16(0);
        appendU16(division);
    }

    void addTrack(const std::vector<std::uint8_t>& track) {
        appendTag("MTrk");
        appendU32(static_cast<std::uint32_t>(track.size()));
        bytes_.insert(bytes_.end(), track.begin(), track.end());
        ++trackCount_;
        bytes_[trackCountOffset_] = static_cast<std::uint8_t>(trackCount_ >> 8);
        bytes_[trackCountOffset_ + 1] = static_cast<std::uint8_t>(trackCount_ & 0xFFu);
    }

    const std::vector<std::uint8_t>& bytes() const { return bytes_; }

private:
    void appendTag(const char* tag) { bytes_.insert(bytes_.end(), tag, tag + 4); }
    void appendU16(std::uint16_t value) {
        bytes_.push_back(static_cast<std::uint8_t>(value >> 8));
        bytes_.push_back(static_cast<std::uint8_t>(value & 0xFFu));
    }
    void appendU32(std::uint32_t value) {
        appendU16(static_cast<std::uint16_t>(value >> 16));
        appendU16(static_cast<std::uint16_t>(value & 0xFFFFu));
    }

    std::vector<std::uint8_t> bytes_;
    std::size_t trackCountOffset_ = 0;
    std::uint16_t trackCount_ = 0;
};

class TrackBuilder {
public:
    TrackBuilder& event(std::uint32_t delta, std::initializer_list<std::uint8_t> data) {
        WriteVarLen(bytes_, delta);
        bytes_.insert(bytes_.end(), data.begin(), data.end());
        return *this;
    }

    TrackBuilder& tempo(std::uint32_t delta, std::uint32_t usPerQuarter) {
        return event(delta, {0xFF, 0x51, 0x03, static_cast<std::uint8_t>(usPerQuarter >> 16),
                             static_cast<std::uint8_t>((usPerQuarter >> 8) & 0xFFu),
                             static_cast<std::uint8_t>(usPerQuarter & 0xFFu)});
    }

    std::vector<std::uint8_t> end() {
        event(0, {0xFF, 0x2F, 0x00});
        return bytes_;
    }

private:
    std::vector<std::uint8_t> bytes_;
};

}  // namespace

TEST_CASE("DecodeMessage 解析 note on / note off", "[midi][message]") {
    NoteEvent event;

    const std::uint8_t on[] = {0x90, 60, 100};
    REQUIRE(midi::DecodeMessage(on, 3, event));
    REQUIRE(event == NoteEvent::On(60, 100, 0));

    const std::uint8_t zeroVelocity[] = {0x93, 60, 0};
    REQUIRE(midi::DecodeMessage(zeroVelocity, 3, event));
    REQUIRE(event.type == NoteEventType::NoteOff);
    REQUIRE(event.channel == 3);

    const std::uint8_t off[] = {0x85, 61, 20};
    REQUIRE(midi::DecodeMessage(off, 3, event));
    REQUIRE(event == NoteEvent::Off(61, 20, 5));
}

TEST_CASE("DecodeMessage rejects other and malformed messages", "[midi][message]") {
    NoteEvent event;
    const std::uint8_t controlChange[] = {0xB0, 64, 127};
    REQUIRE_FALSE(midi::DecodeMessage(controlChange, 3, event));

    const std::uint8_t truncated[] = {0x90, 60};
    REQUIRE_FALSE(midi::DecodeMessage(truncated, 2, event));

    const std::uint8_t badData[] = {0x90, 0x80, 1};
    REQUIRE_FALSE(midi::DecodeMessage(badData, 3, event));

    const std::uint8_t dataOnly[] = {0x40, 0x40, 0x40};
    REQUIRE_FALSE(midi::DecodeMessage(dataOnly, 3, event));
    REQUIRE_FALSE(midi::DecodeMessage(nullptr, 3, event));
}

TEST_CASE("EncodeMessage 写出状态字节与数据字节", "[midi][message]") {
    const auto bytes = midi::EncodeMessage(NoteEvent::On(64, 90, 2));
    REQUIRE(bytes[0] == 0x92);
    REQUIRE(bytes[1] == 64);
    REQUIRE(bytes[2] == 90);

    NoteEvent decoded;
    const auto offBytes = midi::EncodeMessage(NoteEvent::Off(10, 0, 15));
    REQUIRE(offBytes[0] == 0x8F);
    REQUIRE(midi::DecodeMessage(offBytes.data(), offBytes.size(), decoded));
    REQUIRE(decoded == NoteEvent::Off(10, 0, 15));
}

TEST_CASE("MIDI 文件: running status, 速度变化与同刻排序", "[midi][file]") {
    TrackBuilder track;
    track.event(0, {0x90, 60, 100})       // on 60
        .event(480, {64, 80})             // running status: on 64
        .event(0, {60, 0})                // running status, velocity 0: off 60
        .tempo(0, 1000000)                // 60 BPM from tick 480
        .event(480, {0x80, 64, 0});       // off 64

    SmfBuilder smf(0, 480);
    smf.addTrack(track.end());

    midi::MidiSequence sequence;
    std::string error;
    REQUIRE(midi::ParseMidiData(smf.bytes(), sequence, error));
    REQUIRE(error.empty());
    REQUIRE(sequence.ticksPerQuarter == 480);
    REQUIRE(sequence.events.size() == 4);

    REQUIRE(sequence.events[0].timeSeconds == Catch::Approx(0.0));
    REQUIRE(sequence.events[0].event == NoteEvent::On(60, 100));

    // Same tick: the release sorts ahead of the new strike.
    REQUIRE(sequence.events[1].timeSeconds == Catch::Approx(0.5));
    REQUIRE(sequence.events[1].event.type == NoteEventType::NoteOff);
    REQUIRE(sequence.events[1].event.note == 60);
    REQUIRE(sequence.events[2].timeSeconds == Catch::Approx(0.5));
    REQUIRE(sequence.events[2].event == NoteEvent::On(64, 80));

    REQUIRE(sequence.events[3].timeSeconds == Catch::Approx(1.5));
    REQUIRE(sequence.events[3].event.type == NoteEventType::NoteOff);
    REQUIRE(sequence.lengthSeconds == Catch::Approx(1.5));
}

TEST_CASE("同刻零长度音符保持 on -> off 顺序", "[midi][file]") {
    TrackBuilder track;
    track.event(0, {0x90, 60, 100})   // on 60
        .event(480, {0x90, 62, 90})   // on 62 (zero length)
        .event(0, {0x80, 62, 0})      // off 62
        .event(0, {0x80, 60, 0});     // off 60, ends the earlier note

    SmfBuilder smf(0, 480);
    smf.addTrack(track.end());

    midi::MidiSequence sequence;
    std::string error;
    REQUIRE(midi::ParseMidiData(smf.bytes(), sequence, error));
    REQUIRE(sequence.events.size() == 4);
    REQUIRE(sequence.events[1].event == NoteEvent::Off(60));
    REQUIRE(sequence.events[2].event == NoteEvent::On(62, 90));
    REQUIRE(sequence.events[3].event == NoteEvent::Off(62));
    for (std::size_t i = 1; i < 4; ++i) {
        REQUIRE(sequence.events[i].timeSeconds == Catch::Approx(0.5));
    }
}

TEST_CASE("Format 1 tempo track applies to every track", "[midi][file]") {
    SmfBuilder smf(1, 480);
    smf.addTrack(TrackBuilder().tempo(0, 1000000).end());
    smf.addTrack(TrackBuilder()
                     .event(960, {0x91, 72, 127})
                     .event(0, {0xB1, 64, 127})  // pedal is ignored
                     .event(480, {0x81, 72, 64})
                     .end());

    midi::MidiSequence sequence;
    std::string error;
    REQUIRE(midi::ParseMidiData(smf.bytes(), sequence, error));
    REQUIRE(sequence.events.size() == 2);
    REQUIRE(sequence.events[0].timeSeconds == Catch::Approx(2.0));
    REQUIRE(sequence.events[0].event == NoteEvent::On(72, 127, 1));
    REQUIRE(sequence.events[1].timeSeconds == Catch::Approx(3.0));
    REQUIRE(sequence.events[1].event == NoteEvent::Off(72, 64, 1));
}

TEST_CASE("MIDI reader rejects unsupported or broken files", "[midi][file]") {
    midi::MidiSequence sequence;
    std::string error;

    REQUIRE_FALSE(midi::ParseMidiData({}, sequence, error));
    REQUIRE_FALSE(error.empty());

    SmfBuilder format2(2, 480);
    format2.addTrack(TrackBuilder().end());
    error.clear();
    REQUIRE_FALSE(midi::ParseMidiData(format2.bytes(), sequence, error));
    REQUIRE_FALSE(error.empty());

    SmfBuilder smpte(0, 0xE728);
    smpte.addTrack(TrackBuilder().end());
    error.clear();
    REQUIRE_FALSE(midi::ParseMidiData(smpte.bytes(), sequence, error));

    SmfBuilder runningFirst(0, 480);
    runningFirst.addTrack(TrackBuilder().event(0, {60, 100}).end());
    error.clear();
    REQUIRE_FALSE(midi::ParseMidiData(runningFirst.bytes(), sequence, error));
    REQUIRE_FALSE(error.empty());

    auto truncated = SmfBuilder(0, 480);
    truncated.addTrack(TrackBuilder().event(0, {0x90, 60, 100}).end());
    auto bytes = truncated.bytes();
    bytes.resize(bytes.size() - 5);
    error.clear();
    REQUIRE_FALSE(midi::ParseMidiData(bytes, sequence, error));
}

TEST_CASE("LoadMidiFile 从磁盘读取并报告缺失文件", "[midi][file]") {
    SmfBuilder smf(0, 96);
    smf.addTrack(TrackBuilder().event(0, {0x90, 69, 100}).event(96, {0x80, 69, 0}).end());

    const auto tempPath = std::filesystem::temp_directory_path() / "dissonance-midi-test.mid";
    {
        std::ofstream out(tempPath, std::ios::binary);
        REQUIRE(out.is_open());
        out.write(reinterpret_cast<const char*>(smf.bytes().data()),
                  static_cast<std::streamsize>(smf.bytes().size()));
        REQUIRE(out.good());
    }
    TempFile cleanup(tempPath);

    midi::MidiSequence sequence;
    std::string error;
    REQUIRE(midi::LoadMidiFile(tempPath, sequence, error));
    REQUIRE(sequence.events.size() == 2);
    REQUIRE(sequence.events[1].timeSeconds == Catch::Approx(0.5));

    error.clear();
    REQUIRE_FALSE(midi::LoadMidiFile(tempPath.parent_path() / "missing-dissonance.mid", sequence,
                                     error));
    REQUIRE_FALSE(error.empty());
}
