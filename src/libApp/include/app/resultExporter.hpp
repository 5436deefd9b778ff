#pragma once

#include "vision/types.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace sudoku::app {

//! Output file could not be written.
class ExportError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! Renders one processed image into one output file.
class IResultExporter {
public:
	virtual ~IResultExporter() = default;

	//! \returns Path of the written file.
	//! \throws ExportError if the file cannot be written.
	virtual std::filesystem::path write(const vision::ScanResult& result, const std::filesystem::path& outputDir) = 0;
};

//! Writes "<stem>_sudoku.csv": metadata lines followed by 9 rows of 9 cells.
//! Empty and ambiguous cells are left blank.
class CsvResultExporter : public IResultExporter {
public:
	std::filesystem::path write(const vision::ScanResult& result, const std::filesystem::path& outputDir) override;

	//! File name used for a given source image name.
	static std::string outputFileName(const std::string& source);
};

//! ISO 8601 UTC timestamp with second resolution, e.g. 2024-05-01T12:30:00Z.
std::string formatTimestamp(std::chrono::system_clock::time_point timestamp);

//! Human readable 9x9 preview: '.' for empty, '?' for ambiguous, boxes separated.
std::string formatGridPreview(const vision::SudokuGrid& grid);

} // namespace sudoku::app
