#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "engine/NoteEvent.h"
#include "engine/NoteQueue.h"
#include "engine/Synth.h"

namespace engine {

struct RenderConfig {
    static constexpr std::uint32_t kMaxSampleRate = 384000;
    static constexpr std::size_t kMaxChannels = 64;
    static constexpr std::size_t kMaxBlockFrames = 65536;

    std::uint32_t sampleRate = 44100;
    std::size_t channels = 2;
    std::size_t blockFrames = 256;
};

struct RenderMetrics {
    std::uint64_t callbackCount = 0;
    double callbackMsAvg = 0.0;
    double callbackMsMax = 0.0;
    // Events held back one or more blocks because the queue was full.
    std::size_t deferredEvents = 0;
};

// Drives a Synth the way an audio device would: fixed-size callbacks, with the
// events due at each block start pushed into the queue just before the call.
class BlockRenderer {
public:
    BlockRenderer(Synth& synth, std::shared_ptr<NoteQueue> queue, const RenderConfig& config);

    // events need not be sorted. output receives interleaved samples.
    bool render(std::vector<TimedNoteEvent> events,
                double durationSeconds,
                std::vector<float>& output,
                std::string& errorMessage);

    const RenderMetrics& metrics() const { return metrics_; }
    const RenderConfig& config() const { return config_; }

private:
    void recordCallback(double elapsedMs);

    Synth& synth_;
    std::shared_ptr<NoteQueue> queue_;
    RenderConfig config_;
    RenderMetrics metrics_;
};

}  // namespace engine
