#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace csp {
constexpr std::size_t kStickers = 9;   // per face, row-major, index 4 = center
constexpr std::size_t kCenter = 4;
constexpr std::size_t kFaces = 6;

enum class DiscreteColor : std::uint8_t { White = 0, Yellow, Red, Orange, Blue, Green, Unknown };
constexpr std::size_t kColorCount = 7;

using FaceReading = std::array<DiscreteColor, kStickers>;

// components normalized to [0,1]
struct Rgb { float r{0}, g{0}, b{0}; };
struct Hsv { float h{0}, s{0}, v{0}; };   // h on the [0,1) circle
using ColorSample = std::variant<Rgb, Hsv>;

Hsv to_hsv(const Rgb& c);
Hsv to_hsv(const ColorSample& c);

char to_char(DiscreteColor c);            // W Y R O B G ?
const char* to_string(DiscreteColor c);
std::string to_string(const FaceReading& r);   // e.g. "WWR/OGB/YYW"

inline FaceReading unknown_reading() {
    FaceReading r;
    r.fill(DiscreteColor::Unknown);
    return r;
}
}
