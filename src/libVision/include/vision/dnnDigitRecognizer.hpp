#pragma once

#include "vision/IDigitRecognizer.hpp"

#include <opencv2/dnn.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace sudoku::vision {

//! Input/output conventions of the classification network.
struct DnnRecognizerOptions {
	int inputSize{28};            //!< Square network input side (MNIST style models use 28).
	double scale{1.0 / 255.0};    //!< Pixel scale applied by blobFromImage.
	bool invertInput{false};      //!< Feed black ink on white for models trained that way.
	std::vector<std::string> labels{"0", "1", "2", "3", "4", "5", "6", "7", "8", "9"}; //!< Label per output class.
};

/*! ONNX digit classifier evaluated with OpenCV's dnn module.
 * Outputs are turned into probabilities with softmax unless they already sum to one.
 * \note cv::dnn::Net is not re-entrant; the classifier serializes calls.
 */
class DnnDigitRecognizer : public IDigitRecognizer {
public:
	//! \throws RecognitionError if the model cannot be loaded.
	explicit DnnDigitRecognizer(const std::filesystem::path& modelPath, DnnRecognizerOptions options = {});

	Recognition recognize(const cv::Mat& image) override;

	//! Softmax over a single row of logits. Rows that already form a distribution are returned unchanged.
	static std::vector<float> toProbabilities(const cv::Mat& output);

private:
	cv::dnn::Net m_net;
	DnnRecognizerOptions m_options;
};

} // namespace sudoku::vision
