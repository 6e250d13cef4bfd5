#include "engine/BlockRenderer.h"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace engine {

BlockRenderer::BlockRenderer(Synth& synth,
                             std::shared_ptr<NoteQueue> queue,
                             const RenderConfig& config)
    : synth_(synth), queue_(std::move(queue)), config_(config) {}

bool BlockRenderer::render(std::vector<TimedNoteEvent> events,
                           double durationSeconds,
                           std::vector<float>& output,
                           std::string& errorMessage) {
    if (!queue_) {
        errorMessage = "Renderer has no note queue.";
        return false;
    }
    if (config_.sampleRate == 0 || config_.channels == 0 || config_.blockFrames == 0) {
        errorMessage = "Sample rate, channel count and block size must be positive.";
        return false;
    }
    if (config_.sampleRate > RenderConfig::kMaxSampleRate ||
        config_.channels > RenderConfig::kMaxChannels ||
        config_.blockFrames > RenderConfig::kMaxBlockFrames) {
        errorMessage = "Sample rate, channel count or block size is too large.";
        return false;
    }
    if (!(durationSeconds > 0.0) || !std::isfinite(durationSeconds)) {
        errorMessage = "Render duration must be positive.";
        return false;
    }

    std::stable_sort(events.begin(), events.end(),
                     [](const TimedNoteEvent& a, const TimedNoteEvent& b) {
                         return a.timeSeconds < b.timeSeconds;
                     });

    const auto totalFrames =
        static_cast<std::size_t>(std::ceil(durationSeconds * config_.sampleRate));
    output.assign(totalFrames * config_.channels, 0.0f);
    metrics_ = {};

    std::size_t next = 0;
    for (std::size_t start = 0; start < totalFrames; start += config_.blockFrames) {
        const double blockTime = static_cast<double>(start) / config_.sampleRate;
        while (next < events.size() && events[next].timeSeconds <= blockTime) {
            if (!queue_->trySend(events[next].event)) {
                ++metrics_.deferredEvents;
                break;
            }
            ++next;
        }

        const std::size_t frames = std::min(config_.blockFrames, totalFrames - start);
        const auto begin = std::chrono::steady_clock::now();
        synth_.play(config_.sampleRate, config_.channels, output.data() + start * config_.channels,
                    frames * config_.channels);
        const auto end = std::chrono::steady_clock::now();
        recordCallback(std::chrono::duration<double, std::milli>(end - begin).count());
    }
    return true;
}

void BlockRenderer::recordCallback(double elapsedMs) {
    const std::uint64_t count = ++metrics_.callbackCount;
    metrics_.callbackMsAvg =
        count <= 1 ? elapsedMs : metrics_.callbackMsAvg * 0.99 + elapsedMs * 0.01;
    metrics_.callbackMsMax = std::max(metrics_.callbackMsMax, elapsedMs);
}

}  // namespace engine
