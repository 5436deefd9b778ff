#include "vision/gridLocator.hpp"

#include "Logging.hpp"
#include "vision/errors.hpp"
#include "vision/geometry.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <numeric>

namespace sudoku::vision {

namespace {

//! Try multiple approximation epsilons until a convex 4-corner polygon is found.
bool contourToApproxQuad(const std::vector<cv::Point>& contour, std::vector<cv::Point2f>& outQuad) {
	const double perimeter                 = cv::arcLength(contour, true);
	const std::array<double, 6> epsFactors = {0.010, 0.015, 0.020, 0.026, 0.032, 0.040};

	std::vector<cv::Point> polygon;
	for (double epsFactor: epsFactors) {
		cv::approxPolyDP(contour, polygon, epsFactor * perimeter, true);
		if (polygon.size() == 4u && cv::isContourConvex(polygon)) {
			outQuad.assign(polygon.begin(), polygon.end());
			return true;
		}
	}
	return false;
}

//! Side lengths top, right, bottom, left of an ordered quad.
std::array<double, 4> sideLengths(const std::array<cv::Point2f, 4>& quad) {
	return {cv::norm(quad[1] - quad[0]), cv::norm(quad[2] - quad[1]), cv::norm(quad[2] - quad[3]), cv::norm(quad[3] - quad[0])};
}

std::vector<cv::Point> toPolygon(const std::array<cv::Point2f, 4>& quad) {
	std::vector<cv::Point> poly;
	poly.reserve(quad.size());
	for (const auto& p: quad) {
		poly.emplace_back(static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y)));
	}
	return poly;
}

} // namespace

QuadCandidate fitQuad(const std::vector<cv::Point>& contour) {
	QuadCandidate candidate{};
	candidate.contourArea = std::abs(cv::contourArea(contour));

	std::vector<cv::Point2f> quad;
	if (contourToApproxQuad(contour, quad)) {
		candidate.fromApprox = true;
	} else {
		cv::RotatedRect rect = cv::minAreaRect(contour);
		std::array<cv::Point2f, 4> points{};
		rect.points(points.data());
		quad.assign(points.begin(), points.end());
	}

	candidate.quad     = orderCorners(quad);
	candidate.quadArea = quadArea(candidate.quad);
	return candidate;
}

bool isPlausibleGrid(const QuadCandidate& candidate, const cv::Size& imageSize, const LocatorSettings& settings) {
	const double imageArea = static_cast<double>(imageSize.width) * static_cast<double>(imageSize.height);
	if (imageArea <= 0.0 || candidate.quadArea < settings.minAreaFraction * imageArea) {
		return false;
	}
	if (!isNonDegenerate(candidate.quad)) {
		return false;
	}

	// Ordered corners of a simple convex quad form a convex polygon; a crossed ordering does not.
	const std::vector<cv::Point2f> polygon(candidate.quad.begin(), candidate.quad.end());
	if (!cv::isContourConvex(polygon)) {
		return false;
	}

	if (std::abs(topEdgeAngle(candidate.quad)) > settings.maxSkewDegrees) {
		return false;
	}
	if (maxCornerCosine(candidate.quad) > settings.maxCornerCosine) {
		return false;
	}

	const auto [top, right, bottom, left] = sideLengths(candidate.quad);
	const double widthEstimate             = 0.5 * (top + bottom);
	const double heightEstimate            = 0.5 * (left + right);
	const double aspect                    = std::min(widthEstimate, heightEstimate) / std::max(widthEstimate, heightEstimate);
	return aspect >= settings.minAspectRatio;
}

double scoreCandidate(const QuadCandidate& candidate, const cv::Size& imageSize) {
	const double imageArea = static_cast<double>(imageSize.width) * static_cast<double>(imageSize.height);
	if (imageArea <= 0.0 || candidate.quadArea <= 0.0) {
		return 0.0;
	}

	const double areaFraction = candidate.quadArea / imageArea;
	const double residual     = std::abs(candidate.quadArea - candidate.contourArea) / candidate.quadArea;
	return areaFraction * std::clamp(1.0 - residual, 0.0, 1.0);
}

std::optional<std::size_t> selectCandidate(const std::vector<QuadCandidate>& candidates, const std::vector<double>& scores, double scoreEpsilon) {
	CV_Assert(candidates.size() == scores.size());
	if (candidates.empty()) {
		return std::nullopt;
	}

	const double bestScore = *std::max_element(scores.begin(), scores.end());

	// Among near-equal scores the outermost (largest) polygon wins. Inner 3x3 boxes never beat the border.
	std::optional<std::size_t> selected;
	for (std::size_t i = 0u; i < candidates.size(); ++i) {
		if (scores[i] < bestScore - scoreEpsilon) {
			continue;
		}
		if (!selected || candidates[i].quadArea > candidates[*selected].quadArea) {
			selected = i;
		}
	}
	return selected;
}

GridBoundary locateGrid(const NormalizedImage& image, const LocatorSettings& settings, IDebugWriter* debug) {
	if (image.mask.empty() || image.mask.type() != CV_8UC1) {
		throw GridNotFoundError(image.source, "No binary mask to search");
	}

	// 1. Outer contours of connected ink regions.
	std::vector<std::vector<cv::Point>> contours;
	cv::findContours(image.mask.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
	if (contours.empty()) {
		throw GridNotFoundError(image.source, "No contours found");
	}

	// 2. Only the largest contours can cover the minimum area fraction.
	std::vector<std::size_t> order(contours.size());
	std::iota(order.begin(), order.end(), std::size_t{0});
	std::vector<double> contourAreas(contours.size());
	for (std::size_t i = 0u; i < contours.size(); ++i) {
		contourAreas[i] = std::abs(cv::contourArea(contours[i]));
	}
	std::stable_sort(order.begin(), order.end(), [&contourAreas](std::size_t left, std::size_t right) { return contourAreas[left] > contourAreas[right]; });

	const std::size_t candidateCount = std::min(order.size(), static_cast<std::size_t>(settings.maxCandidates));
	const cv::Size imageSize         = image.mask.size();

	std::vector<QuadCandidate> candidates;
	std::vector<double> scores;
	for (std::size_t rank = 0u; rank < candidateCount; ++rank) {
		const auto& contour = contours[order[rank]];
		if (contour.size() < 4u) {
			continue;
		}

		const QuadCandidate candidate = fitQuad(contour);
		if (!isPlausibleGrid(candidate, imageSize, settings)) {
			continue;
		}

		const double score = scoreCandidate(candidate, imageSize);
		Logger().Log(Logging::LogLevel::Debug, std::format("[GridLocator] Candidate rank={} contourArea={:.0f} quadArea={:.0f} approx={} score={:.4f}", rank,
		                                                   candidate.contourArea, candidate.quadArea, candidate.fromApprox, score));
		candidates.push_back(candidate);
		scores.push_back(score);
	}

	// 3. Pick the border.
	const auto selected = selectCandidate(candidates, scores, settings.scoreEpsilon);
	if (!selected) {
		throw GridNotFoundError(image.source, std::format("No quadrilateral covers at least {:.0f}% of the image", settings.minAreaFraction * 100.0));
	}

	const QuadCandidate& best = candidates[*selected];
	GridBoundary boundary{};
	boundary.corners      = best.quad;
	boundary.score        = scores[*selected];
	boundary.area         = best.quadArea;
	boundary.areaFraction = best.quadArea / (static_cast<double>(imageSize.width) * static_cast<double>(imageSize.height));

	Logger().Log(Logging::LogLevel::Info, std::format("[GridLocator] Grid found in '{}': area fraction {:.3f}, score {:.4f}.", image.source, boundary.areaFraction,
	                                                  boundary.score));

	if (debug) {
		cv::Mat drawn;
		cv::cvtColor(image.gray.empty() ? image.mask : image.gray, drawn, cv::COLOR_GRAY2BGR);
		cv::polylines(drawn, toPolygon(boundary.corners), true, cv::Scalar(0, 255, 0), 3);
		debug->save("grid_boundary", drawn);
	}

	return boundary;
}

} // namespace sudoku::vision
