#include "vision/imageLoader.hpp"

#include "Logging.hpp"
#include "vision/errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>

namespace sudoku::vision {

RawImage loadImage(const std::filesystem::path& path) {
	const std::string source = path.filename().string();

	// Read raw bytes ourselves. cv::imread fails on some non-ASCII paths.
	std::ifstream file(path, std::ios::binary);
	if (!file) {
		throw UnreadableImageError(source, "Could not open image file");
	}
	std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
	if (bytes.empty()) {
		throw UnreadableImageError(source, "Image file is empty");
	}

	return decodeImage(bytes, source);
}

RawImage decodeImage(const std::vector<unsigned char>& bytes, const std::string& source) {
	if (bytes.empty()) {
		throw UnreadableImageError(source, "No image data");
	}

	cv::Mat decoded;
	try {
		decoded = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
	} catch (const cv::Exception& e) {
		throw UnreadableImageError(source, std::format("Decoding failed: {}", e.what()));
	}
	if (decoded.empty()) {
		throw UnreadableImageError(source, "Unsupported or corrupt image format");
	}

	// 16 bit PNG/TIFF and float TIFF are brought down to 8 bit.
	if (decoded.depth() == CV_16U) {
		decoded.convertTo(decoded, CV_8U, 1.0 / 256.0);
	} else if (decoded.depth() == CV_32F || decoded.depth() == CV_64F) {
		cv::normalize(decoded, decoded, 0.0, 255.0, cv::NORM_MINMAX);
		decoded.convertTo(decoded, CV_8U);
	} else if (decoded.depth() != CV_8U) {
		decoded.convertTo(decoded, CV_8U);
	}

	Logger().Log(Logging::LogLevel::Debug, std::format("[ImageLoader] Decoded '{}' ({}x{}, {} channels).", source, decoded.cols, decoded.rows, decoded.channels()));
	return {decoded, source};
}

bool convertToGray(const cv::Mat& image, cv::Mat& outGray) {
	if (image.empty()) {
		return false;
	}

	cv::Mat gray;
	switch (image.channels()) {
	case 1:
		gray = image.clone();
		break;
	case 3:
		cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
		break;
	case 4:
		cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
		break;
	default:
		return false;
	}

	if (gray.depth() != CV_8U) {
		gray.convertTo(gray, CV_8U);
	}
	outGray = gray;
	return true;
}

bool hasDarkBackground(const cv::Mat& gray) {
	CV_Assert(gray.type() == CV_8UC1);
	if (gray.empty()) {
		return false;
	}

	// Sample the outermost rows/columns only. Paper usually surrounds the puzzle.
	const double top    = cv::mean(gray.row(0))[0];
	const double bottom = cv::mean(gray.row(gray.rows - 1))[0];
	const double left   = cv::mean(gray.col(0))[0];
	const double right  = cv::mean(gray.col(gray.cols - 1))[0];

	const double borderMean = (top * gray.cols + bottom * gray.cols + left * gray.rows + right * gray.rows) / (2.0 * (gray.cols + gray.rows));
	return borderMean <= 127.0;
}

NormalizedImage normalizeImage(const RawImage& raw, const NormalizeSettings& settings, IDebugWriter* debug) {
	if (raw.pixels.empty()) {
		throw UnreadableImageError(raw.source, "Image is empty");
	}

	const int shortSide = std::min(raw.pixels.cols, raw.pixels.rows);
	if (shortSide < settings.minImageSide) {
		throw UnreadableImageError(raw.source, std::format("Image resolution {}x{} is below the minimum side of {} px", raw.pixels.cols, raw.pixels.rows, settings.minImageSide));
	}

	NormalizedImage result{};
	result.source = raw.source;

	if (!convertToGray(raw.pixels, result.gray)) {
		throw UnreadableImageError(raw.source, std::format("Unsupported channel count {}", raw.pixels.channels()));
	}

	// 1. Enlarge small scans so grid lines survive the blur.
	if (shortSide < settings.upscaleTargetSide) {
		result.scale = static_cast<double>(settings.upscaleTargetSide) / static_cast<double>(shortSide);
		cv::resize(result.gray, result.gray, cv::Size(), result.scale, result.scale, cv::INTER_CUBIC);
		Logger().Log(Logging::LogLevel::Debug, std::format("[ImageLoader] Upscaled '{}' by {:.2f}.", raw.source, result.scale));
	}

	// 2. Ink must be darker than paper for the inverse threshold below.
	if (hasDarkBackground(result.gray)) {
		cv::bitwise_not(result.gray, result.gray);
		Logger().Log(Logging::LogLevel::Debug, std::format("[ImageLoader] Inverted dark background of '{}'.", raw.source));
	}
	if (debug) {
		debug->save("normalized_gray", result.gray);
	}

	// 3. Local threshold. Uneven lighting shifts the local mean, not the ink/paper contrast.
	cv::Mat blurred;
	cv::GaussianBlur(result.gray, blurred, cv::Size(settings.blurKernelSize, settings.blurKernelSize), 0.0);

	cv::adaptiveThreshold(blurred, result.mask, 255.0, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY_INV, settings.adaptiveBlockSize, settings.adaptiveC);

	// 4. Close small gaps in the grid lines.
	if (settings.closeKernelSize > 0) {
		const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(settings.closeKernelSize, settings.closeKernelSize));
		cv::morphologyEx(result.mask, result.mask, cv::MORPH_CLOSE, kernel);
	}
	if (debug) {
		debug->save("normalized_mask", result.mask);
	}

	return result;
}

} // namespace sudoku::vision
