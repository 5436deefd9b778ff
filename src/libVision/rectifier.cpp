#include "vision/rectifier.hpp"

#include "Logging.hpp"
#include "vision/errors.hpp"
#include "vision/geometry.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <cmath>
#include <format>
#include <vector>

namespace sudoku::vision {

cv::Mat computeGridHomography(const GridBoundary& boundary, int side, const std::string& source) {
	if (side <= 0 || side % GRID_DIM != 0) {
		throw RectificationError(source, std::format("Canonical side {} is not a positive multiple of {}", side, GRID_DIM));
	}
	if (!isNonDegenerate(boundary.corners)) {
		throw RectificationError(source, "Grid corners are collinear or enclose no area");
	}

	const std::vector<cv::Point2f> src(boundary.corners.begin(), boundary.corners.end());
	const float last                   = static_cast<float>(side) - 1.f;
	const std::vector<cv::Point2f> dst = {{0.f, 0.f}, {last, 0.f}, {last, last}, {0.f, last}};

	cv::Mat H;
	try {
		H = cv::getPerspectiveTransform(src, dst);
	} catch (const cv::Exception& e) {
		throw RectificationError(source, std::format("Perspective transform failed: {}", e.what()));
	}

	// getPerspectiveTransform returns a zero matrix when the linear system is singular.
	const double det = H.empty() ? 0.0 : cv::determinant(H);
	if (!std::isfinite(det) || std::abs(det) < 1e-12 || !cv::checkRange(H)) {
		throw RectificationError(source, "Perspective transform is singular");
	}
	return H;
}

RectifiedGrid rectifyGrid(const NormalizedImage& image, const GridBoundary& boundary, const RectifierSettings& settings, IDebugWriter* debug) {
	if (image.gray.empty() || image.mask.empty()) {
		throw RectificationError(image.source, "Nothing to rectify");
	}

	RectifiedGrid grid{};
	grid.side = canonicalSide(settings);
	grid.H    = computeGridHomography(boundary, grid.side, image.source);

	const cv::Size outSize(grid.side, grid.side);
	cv::warpPerspective(image.gray, grid.gray, grid.H, outSize, cv::INTER_LINEAR, cv::BORDER_REPLICATE);
	cv::warpPerspective(image.mask, grid.mask, grid.H, outSize, cv::INTER_NEAREST, cv::BORDER_CONSTANT, cv::Scalar(0));

	Logger().Log(Logging::LogLevel::Debug, std::format("[Rectifier] Warped '{}' to {}x{}.", image.source, grid.side, grid.side));
	if (debug) {
		debug->save("rectified", grid.gray);
		debug->save("rectified_mask", grid.mask);
	}
	return grid;
}

} // namespace sudoku::vision
