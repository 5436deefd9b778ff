#pragma once

#include <opencv2/core/types.hpp>

#include <array>
#include <vector>

namespace sudoku::vision {

//! Order 4 corner points TL,TR,BR,BL (Top Left, Bottom Right, etc).
//! TL = min(x+y), BR = max(x+y), TR = min(y-x), BL = max(y-x). Falls back to a row split when two
//! corners win the same criterion (exactly 45 degree rotation).
std::array<cv::Point2f, 4> orderCorners(const std::vector<cv::Point2f>& quad);

//! Absolute cosine of the corner angle p0-p1-p2 (right angle -> 0, degenerate -> 1).
double cornerCosine(const cv::Point2f& p0, const cv::Point2f& p1, const cv::Point2f& p2);

//! Largest corner cosine of an ordered quad.
double maxCornerCosine(const std::array<cv::Point2f, 4>& quad);

//! Rotation of the TL->TR edge against the x axis in degrees, in (-90, 90].
double topEdgeAngle(const std::array<cv::Point2f, 4>& quad);

//! True if no three of the four points are (nearly) collinear and the quad encloses area.
bool isNonDegenerate(const std::array<cv::Point2f, 4>& quad, double minArea = 1.0);

//! Polygon area of an ordered quad.
double quadArea(const std::array<cv::Point2f, 4>& quad);

} // namespace sudoku::vision
