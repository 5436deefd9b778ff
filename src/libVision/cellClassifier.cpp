#include "vision/cellClassifier.hpp"

#include "Logging.hpp"
#include "vision/digitImage.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <format>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace sudoku::vision {

namespace {

//! Components smaller than this are sensor noise.
static constexpr int MIN_COMPONENT_PIXELS = 4;

//! Centered rectangle covering fraction of each axis.
cv::Rect centralRegion(const cv::Size& size, double fraction) {
	const int w = std::max(1, static_cast<int>(std::lround(fraction * size.width)));
	const int h = std::max(1, static_cast<int>(std::lround(fraction * size.height)));
	return {(size.width - w) / 2, (size.height - h) / 2, w, h};
}

} // namespace

cv::Mat isolateDigit(const cv::Mat& mask, double centralFraction) {
	if (mask.empty()) {
		return {};
	}
	CV_Assert(mask.type() == CV_8UC1);

	cv::Mat labels, stats, centroids;
	const int count = cv::connectedComponentsWithStats(mask, labels, stats, centroids, 8, CV_32S);

	const cv::Rect center = centralRegion(mask.size(), centralFraction);
	cv::Mat digit         = cv::Mat::zeros(mask.size(), CV_8UC1);
	for (int label = 1; label < count; ++label) {
		const int area = stats.at<int>(label, cv::CC_STAT_AREA);
		if (area < MIN_COMPONENT_PIXELS) {
			continue;
		}

		const cv::Rect box(stats.at<int>(label, cv::CC_STAT_LEFT), stats.at<int>(label, cv::CC_STAT_TOP), stats.at<int>(label, cv::CC_STAT_WIDTH),
		                   stats.at<int>(label, cv::CC_STAT_HEIGHT));
		const bool touchesBorder = box.x == 0 || box.y == 0 || box.x + box.width == mask.cols || box.y + box.height == mask.rows;
		if (touchesBorder && (box & center).area() == 0) {
			continue;
		}

		digit.setTo(cv::Scalar(255), labels == label);
	}
	return digit;
}

cv::Mat prepareDigit(const cv::Mat& gray, const cv::Mat& digitMask, const ClassifierSettings& settings) {
	CV_Assert(gray.size() == digitMask.size());

	// 1. Bounding box of the digit with a small frame for Otsu to see paper.
	static constexpr int FRAME = 2;
	const cv::Rect cellRect(0, 0, gray.cols, gray.rows);
	cv::Rect box = cv::boundingRect(digitMask);
	box          = cv::Rect(box.x - FRAME, box.y - FRAME, box.width + 2 * FRAME, box.height + 2 * FRAME) & cellRect;

	// 2. Local contrast, then binarize with white ink.
	cv::Mat crop = gray(box).clone();
	cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(2.0, cv::Size(2, 2));
	clahe->apply(crop, crop);

	cv::Mat ink;
	cv::threshold(crop, ink, 0.0, 255.0, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);

	// 3. Restrict to the isolated components so grid-line remnants stay out.
	cv::Mat allowed;
	cv::dilate(digitMask(box), allowed, cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3)));
	cv::bitwise_and(ink, allowed, ink);

	return centerOnSquare(ink, settings.recognizerInputSize, settings.paddingFraction);
}

std::optional<int> parseDigitLabel(const std::string& label) {
	// OCR text often carries punctuation around the digit ("7.", "(7"). Only digit characters count.
	std::string digits;
	std::copy_if(label.begin(), label.end(), std::back_inserter(digits), [](unsigned char c) { return std::isdigit(c) != 0; });
	if (digits.size() != 1u || digits.front() == '0') {
		return std::nullopt;
	}
	return digits.front() - '0';
}

CellClassifier::CellClassifier(std::shared_ptr<IDigitRecognizer> recognizer, ClassifierSettings settings)
    : m_recognizer(std::move(recognizer)), m_settings(std::move(settings)) {
	if (!m_recognizer) {
		throw std::invalid_argument("CellClassifier requires a recognizer");
	}
}

CellResult CellClassifier::classify(const Cell& cell) {
	CellResult result{};
	result.row = cell.row;
	result.col = cell.col;

	// 1. Ink density decides empty cells locally. Blank cells are the main source of hallucinated digits.
	const cv::Mat digitMask = isolateDigit(cell.mask, m_settings.centralFraction);
	const int inkPixels     = digitMask.empty() ? 0 : cv::countNonZero(digitMask);
	if (inkPixels < m_settings.minInkPixels) {
		result.kind       = CellResult::Kind::Empty;
		result.confidence = 1.f;
		return result;
	}

	// 2. Ask the recognizer. Any failure only costs this cell.
	Recognition recognition{};
	try {
		recognition = callRecognizer(prepareDigit(cell.gray, digitMask, m_settings));
	} catch (const std::exception& e) {
		++m_failures;
		Logger().Log(Logging::LogLevel::Warning, std::format("[CellClassifier] Recognizer failed on cell ({}, {}): {}", cell.row, cell.col, e.what()));
		result.kind       = CellResult::Kind::Ambiguous;
		result.confidence = 0.f;
		return result;
	}

	// 3. Interpret label and confidence.
	result.confidence = std::clamp(recognition.confidence, 0.f, 1.f);
	const auto digit  = parseDigitLabel(recognition.label);
	if (digit && result.confidence >= static_cast<float>(m_settings.acceptanceThreshold)) {
		result.kind  = CellResult::Kind::Digit;
		result.digit = *digit;
	} else {
		result.kind = CellResult::Kind::Ambiguous;
		Logger().Log(Logging::LogLevel::Debug, std::format("[CellClassifier] Cell ({}, {}) ambiguous: label '{}' confidence {:.2f}.", cell.row, cell.col,
		                                                   recognition.label, result.confidence));
	}
	return result;
}

Recognition CellClassifier::callRecognizer(const cv::Mat& image) {
	++m_invocations;
	if (m_recognizer->isThreadSafe()) {
		return m_recognizer->recognize(image);
	}

	std::lock_guard<std::mutex> lock(m_recognizerMutex);
	return m_recognizer->recognize(image);
}

unsigned CellClassifier::invocationCount() const {
	return m_invocations.load();
}

unsigned CellClassifier::failureCount() const {
	return m_failures.load();
}

} // namespace sudoku::vision
