#pragma once

#include "app/resultExporter.hpp"
#include "vision/pipeline.hpp"
#include "vision/types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sudoku::app {

//! True for .png .jpg .jpeg .bmp .tiff .tif (case insensitive).
bool isSupportedImage(const std::filesystem::path& path);

//! Supported images directly inside directory, sorted by path. Not recursive.
std::vector<std::filesystem::path> findImages(const std::filesystem::path& directory);

//! Result of processing a single input file.
struct ImageOutcome {
	std::filesystem::path path;
	bool success{false};
	std::string error;                      //!< Failure message, empty on success.
	std::optional<vision::ScanResult> scan; //!< Set on success.
	std::filesystem::path exported;         //!< Written output file, empty if not exported.
};

struct BatchReport {
	std::vector<ImageOutcome> outcomes; //!< In processing order.

	std::size_t succeeded() const;
	std::size_t failed() const;
};

/*! Drives the scanner over one or many files.
 * A failing image never stops the batch: the error is logged with the file name and recorded.
 */
class BatchRunner {
public:
	//! \param exporter Optional, results are not written if null.
	BatchRunner(vision::SudokuScanner& scanner, IResultExporter* exporter, std::filesystem::path outputDir);

	//! Scan and export a single image. Never throws for per-image failures.
	ImageOutcome processOne(const std::filesystem::path& path);

	//! Process every supported image of a directory.
	//! \throws std::filesystem::filesystem_error if the directory cannot be listed.
	BatchReport run(const std::filesystem::path& directory);

	//! Process an explicit list of files.
	BatchReport run(const std::vector<std::filesystem::path>& files);

private:
	vision::SudokuScanner& m_scanner;
	IResultExporter* m_exporter;
	std::filesystem::path m_outputDir;
};

} // namespace sudoku::app
