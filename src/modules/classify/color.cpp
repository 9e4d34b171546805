#include "csp/color.hpp"
#include <opencv2/imgproc.hpp>

namespace csp {
Hsv to_hsv(const Rgb& c){
  cv::Mat3f px(1, 1, cv::Vec3f(c.b, c.g, c.r));
  cv::Mat3f hsv;
  cv::cvtColor(px, hsv, cv::COLOR_BGR2HSV);   // float: H in [0,360), S,V in [0,1]
  const cv::Vec3f& v = hsv(0, 0);
  float h = v[0] / 360.0f;
  if(h >= 1.0f) h -= 1.0f;
  return Hsv{h, v[1], v[2]};
}

Hsv to_hsv(const ColorSample& c){
  if(const auto* hsv = std::get_if<Hsv>(&c)) return *hsv;
  return to_hsv(std::get<Rgb>(c));
}

char to_char(DiscreteColor c){
  static constexpr char kChars[kColorCount] = {'W','Y','R','O','B','G','?'};
  return kChars[static_cast<std::size_t>(c)];
}

const char* to_string(DiscreteColor c){
  static constexpr const char* kNames[kColorCount] = {
    "white","yellow","red","orange","blue","green","unknown"};
  return kNames[static_cast<std::size_t>(c)];
}

std::string to_string(const FaceReading& r){
  std::string s; s.reserve(11);
  for(std::size_t i=0;i<r.size();++i){
    if(i && i%3==0) s.push_back('/');
    s.push_back(to_char(r[i]));
  }
  return s;
}
}
