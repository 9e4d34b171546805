#pragma once
#include "color.hpp"
#include "frame.hpp"
#include <array>
#include <optional>

namespace csp {
using GridSamples = std::array<ColorSample, kStickers>;

struct SamplerParams {
    int min_half_width = 2;   // patch half-width floor, pixels
    int patch_divisor = 6;    // half-width = min(step_x, step_y) / divisor
};

/// Fixed 3x3 grid centered in the frame, one step = dimension / 4.
struct GridGeometry {
    int step_x{0}, step_y{0};
    int origin_x{0}, origin_y{0};
    int half_width{0};

    static GridGeometry for_frame(int width, int height, const SamplerParams& p = {});

    cv::Point cell_center(int row, int col) const {
        return {origin_x + col * step_x, origin_y + row * step_y};
    }

    /// Patch around cell (row, col) clipped to the frame; may be empty.
    cv::Rect patch(int row, int col, int width, int height) const;
};

/// Averages the 9 patches of the grid; nullopt if the view is empty or any
/// patch has no in-bounds pixel.
std::optional<GridSamples> sample_grid(const PixelView& view, const SamplerParams& p = {});
}
