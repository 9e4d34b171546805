#pragma once
#include "color.hpp"
#include "sampler.hpp"
#include <array>
#include <utility>

namespace csp {
struct ClassifierParams {
    float hue_weight = 2.0f;
    float sat_weight = 1.0f;
    float val_weight = 1.0f;
    float dark_value = 0.1f;        // v <= this is Unknown without a palette lookup
    float reject_distance = 0.6f;   // nearest distance above this is Unknown
};

/// Minimum of forward and wrap-around difference on the [0,1) hue circle.
float hue_distance(float a, float b);

/// Weighted nearest-reference classifier over a fixed six-color HSV palette.
/// Stateless after construction.
class ColorClassifier {
public:
    struct Reference { DiscreteColor color; Hsv hsv; };

    explicit ColorClassifier(const ClassifierParams& p = {});

    float distance(const Hsv& sample, const Hsv& ref) const;

    /// Palette entry with the smallest weighted distance, ignoring the gates.
    std::pair<DiscreteColor, float> nearest(const Hsv& sample) const;

    DiscreteColor classify(const ColorSample& sample) const;
    FaceReading classify(const GridSamples& samples) const;

    const std::array<Reference, 6>& palette() const { return palette_; }
    const ClassifierParams& params() const { return p_; }

private:
    ClassifierParams p_;
    std::array<Reference, 6> palette_;
};
}
