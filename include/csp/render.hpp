#pragma once
#include "color.hpp"
#include "face_set.hpp"
#include "sampler.hpp"
#include <opencv2/core.hpp>
#include <optional>

namespace csp {
/// On-screen BGR color of a label; Unknown is neutral gray.
cv::Scalar display_bgr(DiscreteColor c);

/// size x size BGR tile, 3x3 cells with black borders.
cv::Mat render_face(const FaceReading& reading, int size = 120);

/// Unfolded cube, 4x3 faces of 'face_size' pixels:
///        U
///     L  F  R  B
///        D
cv::Mat render_net(const CubeFaceSet& faces, int face_size = 90);

/// Draws patch squares at the sample points; filled dots show the latest labels.
void draw_overlay(cv::Mat& bgr, const std::optional<FaceReading>& labels, const SamplerParams& p = {});
}
