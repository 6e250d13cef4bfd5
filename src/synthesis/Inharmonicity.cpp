#include "synthesis/Inharmonicity.h"

#include <algorithm>
#include <cmath>

namespace synthesis {

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr float kYoungsModulusSteel = 2e11f;  // Pa

constexpr float kMidiNoteMin = 21.0f;   // A0
constexpr float kMidiNoteMax = 108.0f;  // C8

constexpr float kLengthBass = 2.0f;
constexpr float kLengthScaling = 0.95f;
constexpr float kDiameterScaling = 0.47f;
constexpr float kMillimetersToMeters = 0.001f;
constexpr float kWoundRegisterThreshold = 0.3f;
constexpr float kWoundStiffnessFactor = 1.5f;
constexpr float kTensionBass = 100.0f;
constexpr float kTensionRange = 100.0f;

float ComputeCoefficient(float diameter, float length, float tension) {
    const float numerator = kPi * kPi * kPi * std::pow(diameter, 4.0f) * kYoungsModulusSteel;
    const float denominator = 64.0f * tension * length * length;
    return numerator / denominator;
}
}  // namespace

InharmonicityModel::InharmonicityModel(float diameterMeters,
                                       float lengthMeters,
                                       float tensionNewtons)
    : coefficient_(ComputeCoefficient(diameterMeters, lengthMeters, tensionNewtons)) {}

InharmonicityModel InharmonicityModel::FromCoefficient(float coefficient) {
    InharmonicityModel model;
    model.coefficient_ = coefficient;
    return model;
}

float InharmonicityModel::partialFrequency(float fundamental,
                                           unsigned int partialNumber) const {
    if (partialNumber == 1) {
        return fundamental;
    }
    const float n = static_cast<float>(partialNumber);
    return n * fundamental * std::sqrt(std::fma(coefficient_, n * n, 1.0f));
}

PianoStringParameters PianoStringParameters::ForMidiNote(int midiNote) {
    // Keys outside the keyboard reuse the nearest end of the scale; extrapolating
    // the length line past C8 would reach zero.
    const float ratio = std::clamp(
        (static_cast<float>(midiNote) - kMidiNoteMin) / (kMidiNoteMax - kMidiNoteMin), 0.0f,
        1.0f);

    PianoStringParameters params;
    params.length = kLengthBass * (1.0f - kLengthScaling * ratio);

    const float baseDiameter = (1.0f - kDiameterScaling * ratio) * kMillimetersToMeters;
    const float winding = ratio < kWoundRegisterThreshold ? kWoundStiffnessFactor : 1.0f;
    params.diameter = baseDiameter * winding;

    params.tension = kTensionBass + kTensionRange * ratio;
    return params;
}

}  // namespace synthesis
