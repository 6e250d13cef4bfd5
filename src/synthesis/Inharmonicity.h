#pragma once

namespace synthesis {

// Stiff-string partial model. Overtones of a real piano string sit slightly
// sharp of integer multiples; B captures how sharp.
class InharmonicityModel {
public:
    InharmonicityModel(float diameterMeters, float lengthMeters, float tensionNewtons);

    static InharmonicityModel FromCoefficient(float coefficient);

    // f_n = n * f0 * sqrt(1 + B * n^2). Partial 1 is the fundamental, exactly.
    // partialNumber must be >= 1.
    float partialFrequency(float fundamental, unsigned int partialNumber) const;
    float coefficient() const { return coefficient_; }

private:
    InharmonicityModel() = default;

    float coefficient_ = 0.0f;
};

struct PianoStringParameters {
    float diameter = 0.001f;  // m
    float length = 1.0f;      // m
    float tension = 150.0f;   // N

    // Grand-piano scaling interpolated across A0 (21) .. C8 (108).
    static PianoStringParameters ForMidiNote(int midiNote);
};

}  // namespace synthesis
