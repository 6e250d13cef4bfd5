#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "audio/WaveWriter.h"
#include "engine/BlockRenderer.h"
#include "engine/EngineParams.h"
#include "engine/PianoSynthEngine.h"
#include "midi/MidiFileReader.h"

namespace {

struct ParamOverride {
    engine::ParamId id;
    float value;
};

struct AppConfig {
    std::vector<engine::TimedNoteEvent> events;
    std::filesystem::path midiPath;
    double duration = 2.0;
    double sampleRate = 44100.0;
    double channels = 2.0;
    double blockFrames = 512.0;
    double velocity = 100.0;
    synthesis::VoiceConfig voice;
    std::vector<ParamOverride> params;
    bool floatOutput = false;
    std::filesystem::path output = "dissonance_demo.wav";
};

void printUsage() {
    std::cout << "用法: dissonance [--notes 60[:start[:dur]],64] [--midi song.mid] "
                 "[--duration 2.0] [--samplerate 44100] [--channels 2] [--block 512] "
                 "[--velocity 100] [--brightness 0.8] [--release 0.3] [--harmonic] "
                 "[--param name=value ...] [--float] [--output out.wav]\n";
    std::cout << "参数:";
    for (const auto& info : engine::GetParamInfoList()) {
        std::cout << ' ' << info.name << '[' << info.minValue << ',' << info.maxValue << ']';
    }
    std::cout << "\n";
}

bool parseDouble(const std::string& value, double& dest) {
    try {
        dest = std::stod(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseFloat(const std::string& value, float& dest) {
    try {
        dest = std::stof(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// "note[:start[:dur]]" entries; notes are MIDI numbers.
bool parseNoteList(const std::string& csv,
                   double defaultDuration,
                   int velocity,
                   std::vector<engine::TimedNoteEvent>& events,
                   std::string& errorMessage) {
    std::stringstream ss(csv);
    std::string token;
    while (std::getline(ss, token, ',')) {
        if (token.empty()) {
            continue;
        }
        std::stringstream parts(token);
        std::string piece;
        std::vector<std::string> segments;
        while (std::getline(parts, piece, ':')) {
            segments.push_back(piece);
        }

        double note = 0.0;
        double start = 0.0;
        double duration = defaultDuration;
        const bool ok = !segments.empty() && parseDouble(segments[0], note) &&
                        (segments.size() < 2 || segments[1].empty() ||
                         parseDouble(segments[1], start)) &&
                        (segments.size() < 3 || segments[2].empty() ||
                         parseDouble(segments[2], duration));
        if (!ok || note < 0.0 || note > 127.0 || duration <= 0.0) {
            errorMessage = "无效的音符: " + token;
            return false;
        }

        const int midiNote = static_cast<int>(std::lround(note));
        start = std::max(0.0, start);
        events.push_back({start, engine::NoteEvent::On(midiNote, velocity)});
        events.push_back({start + duration, engine::NoteEvent::Off(midiNote)});
    }
    return true;
}

bool parseParam(const std::string& assignment, ParamOverride& dest, std::string& errorMessage) {
    const auto eq = assignment.find('=');
    if (eq == std::string::npos) {
        errorMessage = "参数格式应为 name=value: " + assignment;
        return false;
    }
    const auto* info = engine::FindParamByName(assignment.substr(0, eq));
    if (!info) {
        errorMessage = "未知参数: " + assignment.substr(0, eq);
        return false;
    }
    float value = 0.0f;
    if (!parseFloat(assignment.substr(eq + 1), value)) {
        errorMessage = "参数值无效: " + assignment;
        return false;
    }
    dest = {info->id, value};
    return true;
}

bool parseArgs(int argc, char** argv, AppConfig& config, bool& showHelp, std::string& errorMessage) {
    showHelp = false;

    std::unordered_map<std::string, std::string> kv;
    std::vector<std::string> paramArgs;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            showHelp = true;
            return true;
        }
        if (arg == "--harmonic") {
            config.voice.inharmonic = false;
            continue;
        }
        if (arg == "--float") {
            config.floatOutput = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0 || i + 1 >= argc) {
            errorMessage = "无法识别的参数: " + arg;
            return false;
        }
        if (arg == "--param") {
            paramArgs.push_back(argv[++i]);
        } else {
            kv[arg.substr(2)] = argv[++i];
        }
    }

    const auto readDouble = [&](const char* key, double& dest) {
        auto it = kv.find(key);
        if (it == kv.end() || parseDouble(it->second, dest)) {
            return true;
        }
        errorMessage = std::string("--") + key + " 的值无效: " + it->second;
        return false;
    };
    const auto readFloat = [&](const char* key, float& dest) {
        auto it = kv.find(key);
        if (it == kv.end() || parseFloat(it->second, dest)) {
            return true;
        }
        errorMessage = std::string("--") + key + " 的值无效: " + it->second;
        return false;
    };

    if (!readDouble("duration", config.duration) || !readDouble("samplerate", config.sampleRate) ||
        !readDouble("channels", config.channels) || !readDouble("block", config.blockFrames) ||
        !readDouble("velocity", config.velocity) ||
        !readFloat("brightness", config.voice.brightness) ||
        !readFloat("release", config.voice.releaseSeconds)) {
        return false;
    }
    // Negated so NaN fails too.
    if (!(config.duration > 0.0) || !(config.sampleRate >= 1.0) || !(config.channels >= 1.0) ||
        !(config.blockFrames >= 1.0)) {
        errorMessage = "时长、采样率、声道数和块大小必须为正数。";
        return false;
    }
    if (config.sampleRate > engine::RenderConfig::kMaxSampleRate ||
        config.channels > static_cast<double>(engine::RenderConfig::kMaxChannels) ||
        config.blockFrames > static_cast<double>(engine::RenderConfig::kMaxBlockFrames)) {
        errorMessage = "采样率最大 " + std::to_string(engine::RenderConfig::kMaxSampleRate) +
                       ", 声道数最大 " + std::to_string(engine::RenderConfig::kMaxChannels) +
                       ", 块大小最大 " + std::to_string(engine::RenderConfig::kMaxBlockFrames) +
                       "。";
        return false;
    }
    config.velocity = std::clamp(config.velocity, 1.0, 127.0);
    config.voice.brightness = std::clamp(config.voice.brightness, 0.0f, 1.0f);
    config.voice.releaseSeconds = std::max(0.0f, config.voice.releaseSeconds);

    if (auto it = kv.find("notes"); it != kv.end()) {
        if (!parseNoteList(it->second, config.duration, static_cast<int>(config.velocity),
                           config.events, errorMessage)) {
            return false;
        }
    }
    if (auto it = kv.find("midi"); it != kv.end()) {
        config.midiPath = it->second;
    }
    if (auto it = kv.find("output"); it != kv.end()) {
        config.output = it->second;
    }
    for (const auto& assignment : paramArgs) {
        ParamOverride param{};
        if (!parseParam(assignment, param, errorMessage)) {
            return false;
        }
        config.params.push_back(param);
    }
    return true;
}

double lastEventTime(const std::vector<engine::TimedNoteEvent>& events) {
    double last = 0.0;
    for (const auto& event : events) {
        last = std::max(last, event.timeSeconds);
    }
    return last;
}

}  // namespace

int main(int argc, char** argv) {
    AppConfig config;
    bool showHelp = false;
    std::string errorMessage;
    if (!parseArgs(argc, argv, config, showHelp, errorMessage)) {
        std::cerr << errorMessage << "\n";
        printUsage();
        return 1;
    }
    if (showHelp) {
        printUsage();
        return 0;
    }

    if (!config.midiPath.empty()) {
        midi::MidiSequence sequence;
        if (!midi::LoadMidiFile(config.midiPath, sequence, errorMessage)) {
            std::cerr << errorMessage << "\n";
            return 1;
        }
        std::cout << "已读取 MIDI 文件: " << config.midiPath.string() << " ("
                  << sequence.events.size() << " 个事件, " << sequence.lengthSeconds << " 秒)\n";
        config.events.insert(config.events.end(), sequence.events.begin(), sequence.events.end());
    }
    if (config.events.empty()) {
        const int velocity = static_cast<int>(config.velocity);
        config.events.push_back({0.0, engine::NoteEvent::On(69, velocity)});
        config.events.push_back({config.duration, engine::NoteEvent::Off(69)});
    }

    auto queue = std::make_shared<engine::NoteQueue>();
    engine::PianoSynthEngine synth(config.voice, queue);
    for (const auto& param : config.params) {
        synth.setParam(param.id, param.value);
    }

    engine::RenderConfig renderConfig;
    renderConfig.sampleRate = static_cast<std::uint32_t>(config.sampleRate);
    renderConfig.channels = static_cast<std::size_t>(config.channels);
    renderConfig.blockFrames = static_cast<std::size_t>(config.blockFrames);

    // Leave room for the release and the room tail.
    const double tailSeconds = std::max(1.0, config.voice.releaseSeconds * 4.0 + 1.0);
    const double totalSeconds = lastEventTime(config.events) + tailSeconds;

    engine::BlockRenderer renderer(synth, queue, renderConfig);
    std::vector<float> samples;
    if (!renderer.render(config.events, totalSeconds, samples, errorMessage)) {
        std::cerr << errorMessage << "\n";
        return 1;
    }

    const auto& metrics = renderer.metrics();
    std::cout << "渲染完成: " << metrics.callbackCount << " 个回调, 平均 " << metrics.callbackMsAvg
              << " ms, 最大 " << metrics.callbackMsMax << " ms\n";
    if (metrics.deferredEvents > 0) {
        std::cout << "队列已满, 延后事件: " << metrics.deferredEvents << "\n";
    }

    audio::WaveWriter writer;
    audio::WaveFormat format;
    format.sampleRate = renderConfig.sampleRate;
    format.channels = static_cast<std::uint16_t>(renderConfig.channels);
    format.sampleFormat =
        config.floatOutput ? audio::SampleFormat::Float32 : audio::SampleFormat::Pcm16;
    if (!writer.write(config.output, samples, format, errorMessage)) {
        std::cerr << errorMessage << "\n";
        return 1;
    }

    std::cout << "已生成 WAV 文件: " << std::filesystem::absolute(config.output) << "\n";
    return 0;
}
