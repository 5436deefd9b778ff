#include "vision/digitImage.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace sudoku::vision {

cv::Mat centerOnSquare(const cv::Mat& ink, int size, double padding) {
	CV_Assert(ink.empty() || ink.type() == CV_8UC1);
	CV_Assert(size > 0);

	if (ink.empty() || cv::countNonZero(ink) == 0) {
		return cv::Mat::zeros(size, size, CV_8UC1);
	}

	const cv::Rect box = cv::boundingRect(ink);
	const int side     = std::max(box.width, box.height);
	const int border   = static_cast<int>(std::lround(padding * static_cast<double>(side)));
	const int total    = side + 2 * border;

	// Keep the aspect ratio: a "1" stays a narrow stroke in the middle.
	cv::Mat square = cv::Mat::zeros(total, total, CV_8UC1);
	const cv::Rect target((total - box.width) / 2, (total - box.height) / 2, box.width, box.height);
	ink(box).copyTo(square(target));

	cv::Mat resized;
	cv::resize(square, resized, cv::Size(size, size), 0.0, 0.0, total > size ? cv::INTER_AREA : cv::INTER_LINEAR);
	return resized;
}

} // namespace sudoku::vision
