#include "vision/config.hpp"

#include "vision/errors.hpp"
#include "vision/types.hpp"

#include <opencv2/core/persistence.hpp>

#include <algorithm>
#include <format>
#include <string>

namespace sudoku::vision {

namespace {

//! Only overwrite the default when the key exists. FileNode >> resets missing values to zero.
template <class Value>
void readIfPresent(const cv::FileNode& node, const char* key, Value& value) {
	const cv::FileNode entry = node[key];
	if (!entry.empty()) {
		entry >> value;
	}
}

void require(bool condition, const std::string& message) {
	if (!condition) {
		throw ConfigError(std::format("Invalid configuration: {}", message));
	}
}

bool isOddPositive(int value) {
	return value > 0 && value % 2 == 1;
}

} // namespace

int canonicalSide(const RectifierSettings& settings) {
	const int side = std::max(settings.canonicalSide, MIN_SIDE);
	return ((side + GRID_DIM - 1) / GRID_DIM) * GRID_DIM;
}

void validateConfig(const PipelineConfig& config) {
	const auto& n = config.normalize;
	require(n.minImageSide > 0, "normalize.minImageSide must be positive");
	require(n.upscaleTargetSide >= n.minImageSide, "normalize.upscaleTargetSide must be >= minImageSide");
	require(isOddPositive(n.blurKernelSize), "normalize.blurKernelSize must be odd");
	require(isOddPositive(n.adaptiveBlockSize) && n.adaptiveBlockSize >= 3, "normalize.adaptiveBlockSize must be odd and >= 3");
	require(n.closeKernelSize >= 0, "normalize.closeKernelSize must not be negative");

	const auto& l = config.locator;
	require(l.minAreaFraction > 0.0 && l.minAreaFraction < 1.0, "locator.minAreaFraction must be in (0, 1)");
	require(l.maxSkewDegrees > 0.0 && l.maxSkewDegrees < 45.0, "locator.maxSkewDegrees must be in (0, 45)");
	require(l.maxCornerCosine > 0.0 && l.maxCornerCosine < 1.0, "locator.maxCornerCosine must be in (0, 1)");
	require(l.minAspectRatio > 0.0 && l.minAspectRatio <= 1.0, "locator.minAspectRatio must be in (0, 1]");
	require(l.scoreEpsilon >= 0.0, "locator.scoreEpsilon must not be negative");
	require(l.maxCandidates > 0, "locator.maxCandidates must be positive");

	require(config.rectifier.canonicalSide > 0, "rectifier.canonicalSide must be positive");
	require(config.splitter.marginFraction >= 0.0 && config.splitter.marginFraction < 0.5, "splitter.marginFraction must be in [0, 0.5)");

	const auto& c = config.classifier;
	require(c.minInkPixels >= 0, "classifier.minInkPixels must not be negative");
	require(c.centralFraction > 0.0 && c.centralFraction <= 1.0, "classifier.centralFraction must be in (0, 1]");
	require(c.recognizerInputSize >= 8, "classifier.recognizerInputSize must be >= 8");
	require(c.paddingFraction >= 0.0 && c.paddingFraction < 1.0, "classifier.paddingFraction must be in [0, 1)");
	require(c.acceptanceThreshold >= 0.0 && c.acceptanceThreshold <= 1.0, "classifier.acceptanceThreshold must be in [0, 1]");

	require(config.timeout.count() >= 0, "timeout must not be negative");
}

PipelineConfig loadConfig(const std::filesystem::path& path) {
	cv::FileStorage fs;
	try {
		fs.open(path.string(), cv::FileStorage::READ);
	} catch (const cv::Exception& e) {
		throw ConfigError(std::format("Could not parse configuration '{}': {}", path.string(), e.what()));
	}
	if (!fs.isOpened()) {
		throw ConfigError(std::format("Could not open configuration '{}'", path.string()));
	}

	PipelineConfig config{};

	const cv::FileNode normalize = fs["normalize"];
	if (!normalize.empty()) {
		readIfPresent(normalize, "minImageSide", config.normalize.minImageSide);
		readIfPresent(normalize, "upscaleTargetSide", config.normalize.upscaleTargetSide);
		readIfPresent(normalize, "blurKernelSize", config.normalize.blurKernelSize);
		readIfPresent(normalize, "adaptiveBlockSize", config.normalize.adaptiveBlockSize);
		readIfPresent(normalize, "adaptiveC", config.normalize.adaptiveC);
		readIfPresent(normalize, "closeKernelSize", config.normalize.closeKernelSize);
	}

	const cv::FileNode locator = fs["locator"];
	if (!locator.empty()) {
		readIfPresent(locator, "minAreaFraction", config.locator.minAreaFraction);
		readIfPresent(locator, "maxSkewDegrees", config.locator.maxSkewDegrees);
		readIfPresent(locator, "maxCornerCosine", config.locator.maxCornerCosine);
		readIfPresent(locator, "minAspectRatio", config.locator.minAspectRatio);
		readIfPresent(locator, "scoreEpsilon", config.locator.scoreEpsilon);
		readIfPresent(locator, "maxCandidates", config.locator.maxCandidates);
	}

	const cv::FileNode rectifier = fs["rectifier"];
	if (!rectifier.empty()) {
		readIfPresent(rectifier, "canonicalSide", config.rectifier.canonicalSide);
	}

	const cv::FileNode splitter = fs["splitter"];
	if (!splitter.empty()) {
		readIfPresent(splitter, "marginFraction", config.splitter.marginFraction);
	}

	const cv::FileNode classifier = fs["classifier"];
	if (!classifier.empty()) {
		readIfPresent(classifier, "minInkPixels", config.classifier.minInkPixels);
		readIfPresent(classifier, "centralFraction", config.classifier.centralFraction);
		readIfPresent(classifier, "recognizerInputSize", config.classifier.recognizerInputSize);
		readIfPresent(classifier, "paddingFraction", config.classifier.paddingFraction);
		readIfPresent(classifier, "acceptanceThreshold", config.classifier.acceptanceThreshold);
	}

	int workerLimit = static_cast<int>(config.workerLimit);
	readIfPresent(fs.root(), "workerLimit", workerLimit);
	if (workerLimit < 0) {
		throw ConfigError("Invalid configuration: workerLimit must not be negative");
	}
	config.workerLimit = static_cast<unsigned>(workerLimit);

	int timeoutMs = static_cast<int>(config.timeout.count());
	readIfPresent(fs.root(), "timeoutMs", timeoutMs);
	config.timeout = std::chrono::milliseconds(timeoutMs);

	std::string debugDirectory;
	readIfPresent(fs.root(), "debugDirectory", debugDirectory);
	config.debugDirectory = debugDirectory;

	validateConfig(config);
	return config;
}

void saveConfig(const PipelineConfig& config, const std::filesystem::path& path) {
	cv::FileStorage fs(path.string(), cv::FileStorage::WRITE);
	if (!fs.isOpened()) {
		throw ConfigError(std::format("Could not write configuration '{}'", path.string()));
	}

	fs << "normalize" << "{"
	   << "minImageSide" << config.normalize.minImageSide
	   << "upscaleTargetSide" << config.normalize.upscaleTargetSide
	   << "blurKernelSize" << config.normalize.blurKernelSize
	   << "adaptiveBlockSize" << config.normalize.adaptiveBlockSize
	   << "adaptiveC" << config.normalize.adaptiveC
	   << "closeKernelSize" << config.normalize.closeKernelSize
	   << "}";

	fs << "locator" << "{"
	   << "minAreaFraction" << config.locator.minAreaFraction
	   << "maxSkewDegrees" << config.locator.maxSkewDegrees
	   << "maxCornerCosine" << config.locator.maxCornerCosine
	   << "minAspectRatio" << config.locator.minAspectRatio
	   << "scoreEpsilon" << config.locator.scoreEpsilon
	   << "maxCandidates" << config.locator.maxCandidates
	   << "}";

	fs << "rectifier" << "{" << "canonicalSide" << config.rectifier.canonicalSide << "}";
	fs << "splitter" << "{" << "marginFraction" << config.splitter.marginFraction << "}";

	fs << "classifier" << "{"
	   << "minInkPixels" << config.classifier.minInkPixels
	   << "centralFraction" << config.classifier.centralFraction
	   << "recognizerInputSize" << config.classifier.recognizerInputSize
	   << "paddingFraction" << config.classifier.paddingFraction
	   << "acceptanceThreshold" << config.classifier.acceptanceThreshold
	   << "}";

	fs << "workerLimit" << static_cast<int>(config.workerLimit);
	fs << "timeoutMs" << static_cast<int>(config.timeout.count());
	fs << "debugDirectory" << config.debugDirectory.string();
}

} // namespace sudoku::vision
