#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace audio {

enum class SampleFormat {
    Pcm16,
    Float32,
};

struct WaveFormat {
    std::uint32_t sampleRate = 44100;
    std::uint16_t channels = 1;
    SampleFormat sampleFormat = SampleFormat::Pcm16;
};

class WaveWriter {
public:
    // samples are interleaved; their count must be a multiple of channels.
    bool write(const std::filesystem::path& path,
               const std::vector<float>& samples,
               const WaveFormat& format,
               std::string& errorMessage) const;

    // RIFF image of the file, header included.
    static std::vector<std::uint8_t> Encode(const std::vector<float>& samples,
                                            const WaveFormat& format);
};

}  // namespace audio
