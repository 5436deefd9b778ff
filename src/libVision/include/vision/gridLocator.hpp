#pragma once

#include "vision/config.hpp"
#include "vision/debugWriter.hpp"
#include "vision/types.hpp"

#include <opencv2/core/types.hpp>

#include <array>
#include <optional>
#include <vector>

namespace sudoku::vision {

//! A 4 point polygon fitted to one contour, before plausibility checks.
struct QuadCandidate {
	std::array<cv::Point2f, 4> quad; //!< TL, TR, BR, BL.
	double contourArea{0.0};         //!< Area enclosed by the source contour.
	double quadArea{0.0};            //!< Area of the fitted polygon.
	bool fromApprox{false};          //!< False if the minimum-area rectangle fallback was used.
};

//! Fit a convex 4 point polygon to a contour; falls back to the minimum-area rotated rectangle.
QuadCandidate fitQuad(const std::vector<cv::Point>& contour);

//! Candidate rejection by area fraction, convexity, skew, corner angles and aspect ratio.
bool isPlausibleGrid(const QuadCandidate& candidate, const cv::Size& imageSize, const LocatorSettings& settings);

//! Area fraction weighted by the quad-fit residual. Higher is better.
double scoreCandidate(const QuadCandidate& candidate, const cv::Size& imageSize);

//! Choose among scored candidates: best score, ties within epsilon go to the larger polygon.
//! \returns Index into candidates or nullopt if empty.
std::optional<std::size_t> selectCandidate(const std::vector<QuadCandidate>& candidates, const std::vector<double>& scores, double scoreEpsilon);

/*! Find the outer border of the sudoku on the ink mask.
 * \param [in]     image    Normalized image; only the mask is searched, the intensity is used for debug output.
 * \param [in]     settings Candidate filtering parameters.
 * \param [in,out] debug    Optional artifact writer.
 * \throws GridNotFoundError if no candidate qualifies.
 */
GridBoundary locateGrid(const NormalizedImage& image, const LocatorSettings& settings, IDebugWriter* debug = nullptr);

} // namespace sudoku::vision
