#pragma once

#include "vision/IDigitRecognizer.hpp"
#include "vision/config.hpp"
#include "vision/types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace sudoku::vision {

//! Keep only ink that belongs to a digit. Components touching the cell border are grid-line bleed
//! unless they reach the central region (centralFraction of the cell per axis).
cv::Mat isolateDigit(const cv::Mat& mask, double centralFraction);

//! Binarized, centered, square image of the digit ready for the recognizer.
//! \param gray      Cell intensity (ink dark).
//! \param digitMask Result of isolateDigit for the same cell.
cv::Mat prepareDigit(const cv::Mat& gray, const cv::Mat& digitMask, const ClassifierSettings& settings);

//! Map a recognizer label to a digit 1..9. Non-digit characters are ignored; exactly one digit must remain.
std::optional<int> parseDigitLabel(const std::string& label);

/*! Adapter between cells and the external recognizer.
 * Empty cells are decided locally and never reach the recognizer. Recognizer failures degrade the
 * cell to ambiguous instead of failing the grid.
 */
class CellClassifier {
public:
	CellClassifier(std::shared_ptr<IDigitRecognizer> recognizer, ClassifierSettings settings);

	//! Safe to call concurrently for different cells.
	CellResult classify(const Cell& cell);

	unsigned invocationCount() const; //!< Number of recognizer calls so far.
	unsigned failureCount() const;    //!< Number of recognizer calls that threw.

private:
	Recognition callRecognizer(const cv::Mat& image);

private:
	std::shared_ptr<IDigitRecognizer> m_recognizer;
	ClassifierSettings m_settings;

	std::mutex m_recognizerMutex; //!< Serializes recognizers that are not thread safe.
	std::atomic<unsigned> m_invocations{0};
	std::atomic<unsigned> m_failures{0};
};

} // namespace sudoku::vision
