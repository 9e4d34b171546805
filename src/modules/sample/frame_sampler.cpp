#include "csp/sampler.hpp"
#include <algorithm>

namespace csp {
GridGeometry GridGeometry::for_frame(int width, int height, const SamplerParams& p){
  GridGeometry g;
  g.step_x = width / 4;
  g.step_y = height / 4;
  g.origin_x = width / 2 - g.step_x;
  g.origin_y = height / 2 - g.step_y;
  const int div = std::max(1, p.patch_divisor);
  g.half_width = std::max(p.min_half_width, std::min(g.step_x, g.step_y) / div);
  return g;
}

cv::Rect GridGeometry::patch(int row, int col, int width, int height) const{
  const cv::Point c = cell_center(row, col);
  const cv::Rect square(c.x - half_width, c.y - half_width, 2*half_width + 1, 2*half_width + 1);
  return square & cv::Rect(0, 0, std::max(0, width), std::max(0, height));
}

std::optional<GridSamples> sample_grid(const PixelView& view, const SamplerParams& p){
  if(view.empty()) return std::nullopt;
  const GridGeometry g = GridGeometry::for_frame(view.width, view.height, p);
  const cv::Mat bgra = view.as_mat();

  GridSamples out; std::size_t valid = 0;
  for(int row=0; row<3; ++row){
    for(int col=0; col<3; ++col){
      const cv::Rect r = g.patch(row, col, view.width, view.height);
      if(r.area() <= 0) continue;
      // per-channel sums of 8-bit values are exact in double
      const cv::Scalar sum = cv::sum(bgra(r));
      const double denom = 255.0 * r.area();
      out[valid++] = Rgb{ float(sum[2]/denom), float(sum[1]/denom), float(sum[0]/denom) };
    }
  }
  if(valid != kStickers) return std::nullopt;
  return out;
}
}
