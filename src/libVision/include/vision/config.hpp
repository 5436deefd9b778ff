#pragma once

#include <chrono>
#include <filesystem>

namespace sudoku::vision {

//! Grayscale conversion and ink/background separation.
struct NormalizeSettings {
	int minImageSide{90};       //!< Shorter side below this cannot resolve grid lines.
	int upscaleTargetSide{300}; //!< Shorter side is enlarged to this before thresholding.
	int blurKernelSize{5};      //!< Odd Gaussian kernel applied before thresholding.
	int adaptiveBlockSize{51};  //!< Odd neighbourhood of the adaptive threshold.
	double adaptiveC{10.0};     //!< Constant subtracted from the local weighted mean.
	int closeKernelSize{3};     //!< Morphological close reconnecting broken lines. 0 disables.
};

//! Candidate scoring of the grid border.
struct LocatorSettings {
	double minAreaFraction{0.10}; //!< Candidate polygon must cover this image-area fraction.
	double maxSkewDegrees{25.0};  //!< Maximum rotation of the top edge against the x axis.
	double maxCornerCosine{0.5};  //!< Corner angles must stay within 60..120 degrees.
	double minAspectRatio{0.5};   //!< Shorter over longer mean side length.
	double scoreEpsilon{0.05};    //!< Scores closer than this are tie-broken by polygon area.
	int maxCandidates{16};        //!< Only the largest contours are scored.
};

struct RectifierSettings {
	int canonicalSide{450}; //!< Rounded up to a multiple of 9, at least 252.
};

struct SplitterSettings {
	double marginFraction{0.12}; //!< Inward margin per cell side relative to the cell size.
};

//! Empty detection, recognizer input and label acceptance.
struct ClassifierSettings {
	int minInkPixels{40};            //!< Fewer isolated ink pixels => empty cell.
	double centralFraction{0.5};     //!< Border-touching ink counts as digit only if it reaches this central region.
	int recognizerInputSize{32};     //!< Side of the square image handed to the recognizer.
	double paddingFraction{0.2};     //!< Border added around the digit before resizing.
	double acceptanceThreshold{0.6}; //!< Minimum recognizer confidence for a digit.
};

//! Complete configuration threaded through every pipeline stage.
struct PipelineConfig {
	NormalizeSettings normalize;
	LocatorSettings locator;
	RectifierSettings rectifier;
	SplitterSettings splitter;
	ClassifierSettings classifier;

	unsigned workerLimit{4};                 //!< Concurrent cell classifications. <= 1 runs inline.
	std::chrono::milliseconds timeout{30000}; //!< Whole-image deadline. 0 disables.
	std::filesystem::path debugDirectory;     //!< Empty disables debug artifacts.
};

//! Read a YAML/JSON configuration. Keys missing in the file keep their default value.
//! \throws ConfigError if the file cannot be opened or holds invalid values.
PipelineConfig loadConfig(const std::filesystem::path& path);

//! Write the configuration in the format chosen by the file extension.
void saveConfig(const PipelineConfig& config, const std::filesystem::path& path);

//! \throws ConfigError naming the first out-of-range value.
void validateConfig(const PipelineConfig& config);

//! Canonical side rounded up to the next multiple of 9 (at least 252).
int canonicalSide(const RectifierSettings& settings);

} // namespace sudoku::vision
