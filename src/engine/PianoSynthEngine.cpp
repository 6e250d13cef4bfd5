#include "engine/PianoSynthEngine.h"

#include <algorithm>
#include <bit>
#include <utility>

#include "dsp/Denormals.h"

namespace engine {

PianoSynthEngine::PianoSynthEngine(const synthesis::VoiceConfig& config,
                                   std::shared_ptr<NoteQueue> queue)
    : config_(config), queue_(queue ? std::move(queue) : std::make_shared<NoteQueue>()) {
    for (const auto& info : GetParamInfoList()) {
        paramValues_[static_cast<std::size_t>(info.id)].store(info.defaultValue,
                                                              std::memory_order_relaxed);
    }
}

void PianoSynthEngine::play(std::uint32_t sampleRate,
                            std::size_t channels,
                            float* output,
                            std::size_t sampleCount) {
    if (!output || sampleCount == 0) {
        return;
    }
    if (sampleRate == 0 || channels == 0) {
        std::fill(output, output + sampleCount, 0.0f);
        return;
    }

    dsp::ScopedFlushDenormals noDenormals;

    if (sampleRate != sampleRate_ || voices_.empty()) {
        prepare(sampleRate);
    }
    drainQueue();
    applyPendingParams();

    const std::size_t frames = sampleCount / channels;
    for (std::size_t frame = 0; frame < frames; ++frame) {
        float sample = 0.0f;
        for (auto& voice : voices_) {
            sample += voice.process();
        }
        sample = reverb_->process(sample);
        sample = limiter_->process(sample);

        float* out = output + frame * channels;
        std::fill(out, out + channels, sample);
    }
    std::fill(output + frames * channels, output + sampleCount, 0.0f);
}

void PianoSynthEngine::prepare(std::uint32_t sampleRate) {
    sampleRate_ = sampleRate;
    const float rate = static_cast<float>(sampleRate);

    voices_.clear();
    voices_.reserve(kNumVoices);
    for (std::size_t i = 0; i < kNumVoices; ++i) {
        voices_.emplace_back(rate, config_);
    }
    reverb_.emplace(rate);
    limiter_.emplace(rate);

    std::uint32_t mask = appliedParamMask_;
    while (mask) {
        const auto index = static_cast<std::size_t>(std::countr_zero(mask));
        mask &= (mask - 1);
        applyParam(static_cast<ParamId>(index),
                   paramValues_[index].load(std::memory_order_relaxed));
    }
}

void PianoSynthEngine::drainQueue() {
    NoteEvent event;
    while (queue_->tryReceive(event)) {
        handleEvent(event);
    }
}

void PianoSynthEngine::handleEvent(const NoteEvent& event) {
    switch (event.type) {
        case NoteEventType::NoteOn:
            noteOn(event.note, event.velocity);
            break;
        case NoteEventType::NoteOff:
            noteOff(event.note);
            break;
    }
}

void PianoSynthEngine::noteOn(int midiNote, int velocity) {
    if (voices_.empty()) {
        return;
    }
    const auto key = synthesis::PianoKey::FromMidiNote(
        static_cast<std::uint8_t>(std::clamp(midiNote, 0, 127)));
    const auto vel = static_cast<std::uint8_t>(std::clamp(velocity, 0, 127));

    for (std::size_t i = 0; i < voices_.size(); ++i) {
        statusScratch_[i] = statusOf(voices_[i]);
    }
    const auto free = FindFreeVoice(statusScratch_.data(), voices_.size());
    const std::size_t index =
        free ? *free : SelectVoiceToSteal(statusScratch_.data(), voices_.size());
    voices_[index].noteOn(key, vel);
}

void PianoSynthEngine::noteOff(int midiNote) {
    for (auto& voice : voices_) {
        const auto& key = voice.currentKey();
        if (key && key->midiNote == midiNote) {
            voice.noteOff();
        }
    }
}

void PianoSynthEngine::setParam(ParamId id, float value) {
    const auto* info = GetParamInfo(id);
    if (!info) {
        return;
    }
    const auto index = static_cast<std::size_t>(id);
    paramValues_[index].store(ClampToRange(*info, value), std::memory_order_relaxed);
    pendingParamMask_.fetch_or(1u << index, std::memory_order_release);
}

float PianoSynthEngine::getParam(ParamId id) const {
    const auto index = static_cast<std::size_t>(id);
    if (index >= kParamCount) {
        return 0.0f;
    }
    return paramValues_[index].load(std::memory_order_relaxed);
}

void PianoSynthEngine::applyPendingParams() {
    std::uint32_t mask = pendingParamMask_.exchange(0, std::memory_order_acq_rel);
    appliedParamMask_ |= mask;
    while (mask) {
        const auto index = static_cast<std::size_t>(std::countr_zero(mask));
        mask &= (mask - 1);
        applyParam(static_cast<ParamId>(index),
                   paramValues_[index].load(std::memory_order_relaxed));
    }
}

void PianoSynthEngine::applyParam(ParamId id, float value) {
    switch (id) {
        case ParamId::ReverbRoomSize:
            reverb_->setRoomSize(value);
            break;
        case ParamId::ReverbDamping:
            reverb_->setDamping(value);
            break;
        case ParamId::ReverbWet:
            reverb_->setWetLevel(value);
            break;
        case ParamId::ReverbDry:
            reverb_->setDryLevel(value);
            break;
        case ParamId::ReverbWidth:
            reverb_->setWidth(value);
            break;
        case ParamId::LimiterThreshold:
            limiter_->setThresholdDb(value);
            break;
        case ParamId::LimiterAttack:
            limiter_->setAttackSeconds(value);
            break;
        case ParamId::LimiterRelease:
            limiter_->setReleaseSeconds(value);
            break;
        case ParamId::LimiterMakeupGain:
            limiter_->setMakeupGainDb(value);
            break;
        case ParamId::Count:
            break;
    }
}

VoiceStatus PianoSynthEngine::statusOf(const synthesis::PianoVoice& voice) const {
    VoiceStatus status;
    status.active = voice.isActive();
    status.state = voice.envelope().state();
    status.level = voice.envelope().currentLevel();
    status.midiNote = voice.currentKey() ? voice.currentKey()->midiNote : -1;
    return status;
}

std::size_t PianoSynthEngine::activeVoiceCount() const {
    return static_cast<std::size_t>(
        std::count_if(voices_.begin(), voices_.end(),
                      [](const synthesis::PianoVoice& voice) { return voice.isActive(); }));
}

std::vector<VoiceStatus> PianoSynthEngine::voiceStatuses() const {
    std::vector<VoiceStatus> statuses;
    statuses.reserve(voices_.size());
    for (const auto& voice : voices_) {
        statuses.push_back(statusOf(voice));
    }
    return statuses;
}

}  // namespace engine
