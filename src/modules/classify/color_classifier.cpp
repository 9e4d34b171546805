#include "csp/classifier.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace csp {
namespace {
constexpr std::pair<DiscreteColor, Rgb> kReferenceRgb[6] = {
  {DiscreteColor::White,  {1.f, 1.f, 1.f}},
  {DiscreteColor::Yellow, {1.f, 1.f, 0.f}},
  {DiscreteColor::Red,    {1.f, 0.f, 0.f}},
  {DiscreteColor::Orange, {1.f, .5f, 0.f}},
  {DiscreteColor::Blue,   {0.f, 0.f, 1.f}},
  {DiscreteColor::Green,  {0.f, 1.f, 0.f}},
};
}

float hue_distance(float a, float b){
  const float d = std::fabs(a - b);
  return std::min(d, 1.0f - d);
}

ColorClassifier::ColorClassifier(const ClassifierParams& p) : p_(p){
  for(std::size_t i=0;i<palette_.size();++i)
    palette_[i] = Reference{kReferenceRgb[i].first, to_hsv(kReferenceRgb[i].second)};
}

float ColorClassifier::distance(const Hsv& s, const Hsv& ref) const{
  return p_.hue_weight * hue_distance(s.h, ref.h)
       + p_.sat_weight * std::fabs(s.s - ref.s)
       + p_.val_weight * std::fabs(s.v - ref.v);
}

std::pair<DiscreteColor, float> ColorClassifier::nearest(const Hsv& s) const{
  DiscreteColor best = DiscreteColor::Unknown;
  float best_d = std::numeric_limits<float>::max();
  for(auto& ref : palette_){
    const float d = distance(s, ref.hsv);
    if(d < best_d){ best_d = d; best = ref.color; }
  }
  return {best, best_d};
}

DiscreteColor ColorClassifier::classify(const ColorSample& sample) const{
  const Hsv hsv = to_hsv(sample);
  if(hsv.v <= p_.dark_value) return DiscreteColor::Unknown;
  auto [color, d] = nearest(hsv);
  return d > p_.reject_distance ? DiscreteColor::Unknown : color;
}

FaceReading ColorClassifier::classify(const GridSamples& samples) const{
  FaceReading out;
  for(std::size_t i=0;i<samples.size();++i) out[i] = classify(samples[i]);
  return out;
}
}
