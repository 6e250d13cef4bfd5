#include "audio/WaveWriter.h"

#include <algorithm>
#include <bit>
#include <cmath>
#include <fstream>

namespace audio {

namespace {
constexpr std::uint16_t kFormatPcm = 1;
constexpr std::uint16_t kFormatIeeeFloat = 3;
constexpr std::uint32_t kFmtChunkSize = 16;

void PutTag(std::vector<std::uint8_t>& out, const char (&tag)[5]) {
    out.insert(out.end(), tag, tag + 4);
}

void PutU16(std::vector<std::uint8_t>& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(value >> 8));
}

void PutU32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
    }
}

std::int16_t ToPcm16(float sample) {
    if (!std::isfinite(sample)) {
        return 0;
    }
    return static_cast<std::int16_t>(std::lround(std::clamp(sample, -1.0f, 1.0f) * 32767.0f));
}
}  // namespace

std::vector<std::uint8_t> WaveWriter::Encode(const std::vector<float>& samples,
                                             const WaveFormat& format) {
    const bool isFloat = format.sampleFormat == SampleFormat::Float32;
    const std::uint16_t bytesPerSample = isFloat ? 4 : 2;
    const std::uint16_t blockAlign = static_cast<std::uint16_t>(format.channels * bytesPerSample);
    const auto dataSize = static_cast<std::uint32_t>(samples.size() * bytesPerSample);

    std::vector<std::uint8_t> out;
    out.reserve(44 + dataSize);

    PutTag(out, "RIFF");
    PutU32(out, 4 + (8 + kFmtChunkSize) + (8 + dataSize));
    PutTag(out, "WAVE");

    PutTag(out, "fmt ");
    PutU32(out, kFmtChunkSize);
    PutU16(out, isFloat ? kFormatIeeeFloat : kFormatPcm);
    PutU16(out, format.channels);
    PutU32(out, format.sampleRate);
    PutU32(out, format.sampleRate * blockAlign);
    PutU16(out, blockAlign);
    PutU16(out, static_cast<std::uint16_t>(bytesPerSample * 8));

    PutTag(out, "data");
    PutU32(out, dataSize);
    for (float sample : samples) {
        if (isFloat) {
            PutU32(out, std::bit_cast<std::uint32_t>(sample));
        } else {
            PutU16(out, static_cast<std::uint16_t>(ToPcm16(sample)));
        }
    }
    return out;
}

bool WaveWriter::write(const std::filesystem::path& path,
                       const std::vector<float>& samples,
                       const WaveFormat& format,
                       std::string& errorMessage) const {
    errorMessage.clear();
    if (format.channels == 0 || format.sampleRate == 0) {
        errorMessage = "无效的 WAV 格式: 采样率和声道数必须大于 0";
        return false;
    }
    if (samples.size() % format.channels != 0) {
        errorMessage = "采样数不是声道数的整数倍";
        return false;
    }

    const auto bytes = Encode(samples, format);

    std::ofstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        errorMessage = "无法打开输出文件: " + path.string();
        return false;
    }
    stream.write(reinterpret_cast<const char*>(bytes.data()),
                 static_cast<std::streamsize>(bytes.size()));
    if (!stream.good()) {
        errorMessage = "写入 WAV 文件失败: " + path.string();
        return false;
    }
    return true;
}

}  // namespace audio
