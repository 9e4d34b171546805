#include "csp/render.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace csp {
cv::Scalar display_bgr(DiscreteColor c){
  switch(c){
    case DiscreteColor::White:  return {255, 255, 255};
    case DiscreteColor::Yellow: return {0, 255, 255};
    case DiscreteColor::Red:    return {0, 0, 255};
    case DiscreteColor::Orange: return {0, 165, 255};
    case DiscreteColor::Blue:   return {255, 0, 0};
    case DiscreteColor::Green:  return {0, 255, 0};
    case DiscreteColor::Unknown: break;
  }
  return {128, 128, 128};
}

cv::Mat render_face(const FaceReading& reading, int size){
  cv::Mat tile(size, size, CV_8UC3, cv::Scalar::all(0));
  const int cell = size / 3;
  for(int row=0; row<3; ++row)
    for(int col=0; col<3; ++col){
      const cv::Rect r(col*cell, row*cell, cell, cell);
      cv::rectangle(tile, r, display_bgr(reading[row*3 + col]), cv::FILLED);
      cv::rectangle(tile, r, cv::Scalar::all(0), 2);
    }
  return tile;
}

cv::Mat render_net(const CubeFaceSet& faces, int face_size){
  // (col, row) of U R F D L B in the cross layout
  static const cv::Point kSlot[kFaces] = {{1,0}, {2,1}, {1,1}, {1,2}, {0,1}, {3,1}};
  cv::Mat net(3*face_size, 4*face_size, CV_8UC3, cv::Scalar::all(40));
  const auto snap = faces.snapshot();
  for(std::size_t f=0; f<kFaces; ++f){
    const cv::Rect dst(kSlot[f].x*face_size, kSlot[f].y*face_size, face_size, face_size);
    render_face(snap[f], face_size).copyTo(net(dst));
  }
  return net;
}

void draw_overlay(cv::Mat& bgr, const std::optional<FaceReading>& labels, const SamplerParams& p){
  if(bgr.empty()) return;
  const GridGeometry g = GridGeometry::for_frame(bgr.cols, bgr.rows, p);
  for(int row=0; row<3; ++row)
    for(int col=0; col<3; ++col){
      const cv::Rect r = g.patch(row, col, bgr.cols, bgr.rows);
      if(r.area() <= 0) continue;
      const cv::Scalar c = labels ? display_bgr((*labels)[row*3 + col]) : cv::Scalar(200, 200, 200);
      cv::rectangle(bgr, r, cv::Scalar::all(0), 2);
      cv::circle(bgr, g.cell_center(row, col), std::max(3, g.half_width/2), c, cv::FILLED);
    }
}
}
