#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "dsp/Limiter.h"
#include "dsp/Reverb.h"
#include "engine/EngineParams.h"
#include "engine/NoteQueue.h"
#include "engine/Synth.h"
#include "engine/VoiceAllocator.h"
#include "synthesis/PianoVoice.h"

namespace engine {

// Eight-voice additive piano followed by reverb and limiter. The mono result is
// copied to every output channel.
//
// Threading: play(), noteOn(), noteOff() and handleEvent() belong to the audio
// thread. Other threads send notes through noteQueue() and change effects with
// setParam(); both are picked up at the start of the next play().
class PianoSynthEngine : public Synth {
public:
    static constexpr std::size_t kNumVoices = 8;

    explicit PianoSynthEngine(const synthesis::VoiceConfig& config = {},
                              std::shared_ptr<NoteQueue> queue = nullptr);

    void play(std::uint32_t sampleRate,
              std::size_t channels,
              float* output,
              std::size_t sampleCount) override;

    void noteOn(int midiNote, int velocity);
    void noteOff(int midiNote);
    void handleEvent(const NoteEvent& event);

    std::shared_ptr<NoteQueue> noteQueue() const { return queue_; }

    void setParam(ParamId id, float value);
    float getParam(ParamId id) const;

    std::size_t activeVoiceCount() const;
    std::vector<VoiceStatus> voiceStatuses() const;
    std::uint32_t sampleRate() const { return sampleRate_; }
    const synthesis::VoiceConfig& voiceConfig() const { return config_; }

    const std::optional<dsp::Reverb>& reverb() const { return reverb_; }
    const std::optional<dsp::Limiter>& limiter() const { return limiter_; }

private:
    void prepare(std::uint32_t sampleRate);
    void drainQueue();
    void applyPendingParams();
    void applyParam(ParamId id, float value);
    VoiceStatus statusOf(const synthesis::PianoVoice& voice) const;

    synthesis::VoiceConfig config_;
    std::shared_ptr<NoteQueue> queue_;

    std::uint32_t sampleRate_ = 0;
    std::vector<synthesis::PianoVoice> voices_;
    std::array<VoiceStatus, kNumVoices> statusScratch_{};
    std::optional<dsp::Reverb> reverb_;
    std::optional<dsp::Limiter> limiter_;

    std::array<std::atomic<float>, kParamCount> paramValues_{};
    std::atomic<std::uint32_t> pendingParamMask_{0};
    // Audio thread only: params set at least once, re-applied after a rebuild.
    std::uint32_t appliedParamMask_ = 0;
};

}  // namespace engine
