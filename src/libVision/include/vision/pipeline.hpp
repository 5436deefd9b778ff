#pragma once

#include "vision/IDigitRecognizer.hpp"
#include "vision/cellClassifier.hpp"
#include "vision/config.hpp"
#include "vision/debugWriter.hpp"
#include "vision/types.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sudoku::vision {

//! Whole-image deadline. Unset means no timeout.
using Deadline = std::optional<std::chrono::steady_clock::time_point>;

//! Deadline starting now, or none for a zero timeout.
Deadline makeDeadline(std::chrono::milliseconds timeout);

//! \throws ProcessingTimeoutError naming the stage if the deadline passed.
void checkDeadline(const Deadline& deadline, const std::string& source, const std::string& stage);

//! Output of the deterministic (non-recognition) stages.
struct GridExtraction {
	NormalizedImage normalized;
	GridBoundary boundary;
	RectifiedGrid rectified;
	std::vector<Cell> cells; //!< 81 cells, row-major, views into rectified.
};

//! Run normalize -> locate -> rectify -> split. Same image and config always give the same result.
//! \throws UnreadableImageError, GridNotFoundError, RectificationError, ProcessingTimeoutError
GridExtraction extractCells(const RawImage& image, const PipelineConfig& config, IDebugWriter* debug = nullptr, const Deadline& deadline = std::nullopt);

//! Classify cells on up to workerLimit threads. Results are indexed like cells, whatever the completion order.
//! \throws ProcessingTimeoutError if the deadline passes before every cell is classified.
std::vector<CellResult> classifyCells(const std::vector<Cell>& cells, CellClassifier& classifier, unsigned workerLimit, const Deadline& deadline = std::nullopt,
                                      const std::string& source = {});

/*! Full pipeline for one image at a time: load, detect, split, classify and assemble.
 * The recognizer is shared by every scan of this instance.
 */
class SudokuScanner {
public:
	//! \throws ConfigError if the configuration is invalid.
	SudokuScanner(PipelineConfig config, std::shared_ptr<IDigitRecognizer> recognizer);

	//! Load and process one image file.
	ScanResult scan(const std::filesystem::path& path);

	//! Process an already decoded image.
	//! \param debug Overrides the writer derived from PipelineConfig::debugDirectory.
	ScanResult scan(const RawImage& image, IDebugWriter* debug = nullptr);

	const PipelineConfig& config() const;
	unsigned recognizerInvocations() const; //!< Accumulated over every scan.

private:
	ScanResult process(const RawImage& image, IDebugWriter* debug, const Deadline& deadline);

private:
	PipelineConfig m_config;
	CellClassifier m_classifier;
};

} // namespace sudoku::vision
