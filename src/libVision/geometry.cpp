#include "vision/geometry.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace sudoku::vision {

std::array<cv::Point2f, 4> orderCorners(const std::vector<cv::Point2f>& quad) {
	CV_Assert(quad.size() == 4u); // Check before calling this function.

	auto sumCmp  = [](const cv::Point2f& a, const cv::Point2f& b) { return (a.x + a.y) < (b.x + b.y); };
	auto diffCmp = [](const cv::Point2f& a, const cv::Point2f& b) { return (a.y - a.x) < (b.y - b.x); };

	const auto tl = std::min_element(quad.begin(), quad.end(), sumCmp) - quad.begin();
	const auto br = std::max_element(quad.begin(), quad.end(), sumCmp) - quad.begin();
	const auto tr = std::min_element(quad.begin(), quad.end(), diffCmp) - quad.begin();
	const auto bl = std::max_element(quad.begin(), quad.end(), diffCmp) - quad.begin();

	const bool unique = tl != br && tl != tr && tl != bl && br != tr && br != bl && tr != bl;
	if (unique) {
		return {quad[static_cast<std::size_t>(tl)], quad[static_cast<std::size_t>(tr)], quad[static_cast<std::size_t>(br)], quad[static_cast<std::size_t>(bl)]};
	}

	// Fallback: sort by Y, then split top/bottom and sort by X.
	std::array<cv::Point2f, 4> sortedByY{quad[0], quad[1], quad[2], quad[3]};
	std::sort(sortedByY.begin(), sortedByY.end(), [](const cv::Point2f& a, const cv::Point2f& b) {
		if (a.y == b.y) {
			return a.x < b.x;
		}
		return a.y < b.y;
	});

	std::array<cv::Point2f, 2> topRow{sortedByY[0], sortedByY[1]};
	std::array<cv::Point2f, 2> bottomRow{sortedByY[2], sortedByY[3]};
	std::sort(topRow.begin(), topRow.end(), [](const cv::Point2f& a, const cv::Point2f& b) { return a.x < b.x; });
	std::sort(bottomRow.begin(), bottomRow.end(), [](const cv::Point2f& a, const cv::Point2f& b) { return a.x < b.x; });

	return {topRow[0], topRow[1], bottomRow[1], bottomRow[0]};
}

double cornerCosine(const cv::Point2f& p0, const cv::Point2f& p1, const cv::Point2f& p2) {
	const cv::Point2f v1 = p0 - p1;
	const cv::Point2f v2 = p2 - p1;
	const double norm1   = cv::norm(v1);
	const double norm2   = cv::norm(v2);
	if (norm1 <= 1e-6 || norm2 <= 1e-6) {
		return 1.0;
	}
	return std::abs((static_cast<double>(v1.x) * v2.x + static_cast<double>(v1.y) * v2.y) / (norm1 * norm2));
}

double maxCornerCosine(const std::array<cv::Point2f, 4>& quad) {
	const double c0 = cornerCosine(quad[3], quad[0], quad[1]);
	const double c1 = cornerCosine(quad[0], quad[1], quad[2]);
	const double c2 = cornerCosine(quad[1], quad[2], quad[3]);
	const double c3 = cornerCosine(quad[2], quad[3], quad[0]);
	return std::max({c0, c1, c2, c3});
}

double topEdgeAngle(const std::array<cv::Point2f, 4>& quad) {
	const cv::Point2f edge = quad[1] - quad[0];
	double angle           = std::atan2(static_cast<double>(edge.y), static_cast<double>(edge.x)) * 180.0 / CV_PI;
	while (angle <= -90.0)
		angle += 180.0;
	while (angle > 90.0)
		angle -= 180.0;
	return angle;
}

double quadArea(const std::array<cv::Point2f, 4>& quad) {
	const std::vector<cv::Point2f> polygon(quad.begin(), quad.end());
	return std::abs(cv::contourArea(polygon));
}

bool isNonDegenerate(const std::array<cv::Point2f, 4>& quad, double minArea) {
	for (const auto& p: quad) {
		if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
			return false;
		}
	}

	// Twice the triangle area for every corner triple; zero means collinear.
	static constexpr double COLLINEAR_EPS = 1e-3;
	for (std::size_t i = 0u; i < 4u; ++i) {
		const cv::Point2f& a = quad[i];
		const cv::Point2f& b = quad[(i + 1u) % 4u];
		const cv::Point2f& c = quad[(i + 2u) % 4u];
		const double cross   = static_cast<double>(b.x - a.x) * (c.y - a.y) - static_cast<double>(b.y - a.y) * (c.x - a.x);
		if (std::abs(cross) <= COLLINEAR_EPS) {
			return false;
		}
	}

	return quadArea(quad) >= minArea;
}

} // namespace sudoku::vision
