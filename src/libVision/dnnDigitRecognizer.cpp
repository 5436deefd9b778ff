#include "vision/dnnDigitRecognizer.hpp"

#include "Logging.hpp"
#include "vision/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>
#include <utility>

namespace sudoku::vision {

DnnDigitRecognizer::DnnDigitRecognizer(const std::filesystem::path& modelPath, DnnRecognizerOptions options) : m_options(std::move(options)) {
	try {
		m_net = cv::dnn::readNetFromONNX(modelPath.string());
	} catch (const cv::Exception& e) {
		throw RecognitionError(std::format("Could not load digit model '{}': {}", modelPath.string(), e.what()));
	}
	if (m_net.empty()) {
		throw RecognitionError(std::format("Digit model '{}' contains no layers", modelPath.string()));
	}

	m_net.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
	m_net.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
	Logger().Log(Logging::LogLevel::Info, std::format("[DnnRecognizer] Loaded model '{}'.", modelPath.string()));
}

std::vector<float> DnnDigitRecognizer::toProbabilities(const cv::Mat& output) {
	cv::Mat row = output.reshape(1, 1);
	if (row.type() != CV_32F) {
		row.convertTo(row, CV_32F);
	}
	std::vector<float> values(row.begin<float>(), row.end<float>());
	if (values.empty()) {
		return values;
	}

	const float sum     = std::accumulate(values.begin(), values.end(), 0.f);
	const bool negative = std::any_of(values.begin(), values.end(), [](float v) { return v < 0.f; });
	if (!negative && std::abs(sum - 1.f) < 1e-3f) {
		return values;
	}

	const float maxLogit = *std::max_element(values.begin(), values.end());
	float total          = 0.f;
	for (float& v: values) {
		v = std::exp(v - maxLogit);
		total += v;
	}
	for (float& v: values) {
		v /= total;
	}
	return values;
}

Recognition DnnDigitRecognizer::recognize(const cv::Mat& image) {
	if (image.empty()) {
		throw RecognitionError("DnnDigitRecognizer: empty input");
	}

	cv::Mat input = image;
	if (input.channels() != 1) {
		cv::cvtColor(input, input, cv::COLOR_BGR2GRAY);
	}
	if (m_options.invertInput) {
		cv::Mat inverted;
		cv::bitwise_not(input, inverted);
		input = inverted;
	}

	std::vector<float> probabilities;
	try {
		const cv::Mat blob = cv::dnn::blobFromImage(input, m_options.scale, cv::Size(m_options.inputSize, m_options.inputSize), cv::Scalar(), false, false);
		m_net.setInput(blob);
		probabilities = toProbabilities(m_net.forward());
	} catch (const cv::Exception& e) {
		throw RecognitionError(std::format("Inference failed: {}", e.what()));
	}
	if (probabilities.empty()) {
		throw RecognitionError("Inference produced no output");
	}

	const auto bestIt       = std::max_element(probabilities.begin(), probabilities.end());
	const std::size_t index = static_cast<std::size_t>(bestIt - probabilities.begin());
	if (index >= m_options.labels.size()) {
		return {"", *bestIt};
	}
	return {m_options.labels[index], *bestIt};
}

} // namespace sudoku::vision
