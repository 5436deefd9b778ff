#pragma once

#include <opencv2/core/mat.hpp>

#include <string>

namespace sudoku::vision {

//! Raw answer of a recognizer. The classifier decides whether it is acceptable.
struct Recognition {
	std::string label;     //!< Recognized text; a single digit when confident.
	float confidence{0.f}; //!< In [0, 1].
};

//! External digit recognition collaborator (image in, label + confidence out).
class IDigitRecognizer {
public:
	virtual ~IDigitRecognizer() = default;

	//! \param image Square CV_8UC1 image, white ink on black, digit centered.
	//! \throws RecognitionError (or any std::exception) on transient failure.
	//! The scan timeout is only checked between calls and cannot interrupt one in flight.
	//! Implementations must bound their own latency, otherwise a hung call blocks the whole scan.
	virtual Recognition recognize(const cv::Mat& image) = 0;

	//! True if recognize may run on several threads at once. Otherwise calls are serialized.
	virtual bool isThreadSafe() const {
		return false;
	}
};

} // namespace sudoku::vision
