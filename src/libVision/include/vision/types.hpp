#pragma once

#include <opencv2/core/mat.hpp>
#include <opencv2/core/types.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace sudoku::vision {

static constexpr int GRID_DIM   = 9;                   //!< Rows/columns of a sudoku.
static constexpr int CELL_COUNT = GRID_DIM * GRID_DIM; //!< Cells per grid.
static constexpr int MIN_SIDE   = 252;                 //!< Smallest canonical side of a rectified grid.

//! Decoded image as loaded. Discarded once normalized.
struct RawImage {
	cv::Mat pixels;     //!< 8 bit, 1/3/4 channels (BGR order for colour).
	std::string source; //!< File name used in error messages.
};

//! Single channel intensity plus binary ink mask (ink = 255).
struct NormalizedImage {
	cv::Mat gray;       //!< CV_8UC1 intensity, ink darker than paper.
	cv::Mat mask;       //!< CV_8UC1 adaptive threshold result.
	double scale{1.0};  //!< Upscale factor applied to the raw image.
	std::string source;
};

//! Best-guess outer border of the puzzle in normalized image coordinates.
struct GridBoundary {
	std::array<cv::Point2f, 4> corners; //!< TL, TR, BR, BL.
	double score{0.0};                  //!< Locator score of the selected candidate.
	double area{0.0};                   //!< Polygon area in pixels.
	double areaFraction{0.0};           //!< Polygon area relative to the image area.
};

//! Perspective corrected, axis aligned view of the grid.
struct RectifiedGrid {
	cv::Mat gray; //!< side x side intensity, bilinear resampled.
	cv::Mat mask; //!< side x side ink mask, nearest neighbour resampled.
	cv::Mat H;    //!< Homography normalized image -> rectified grid (CV_64F 3x3).
	int side{0};  //!< Always divisible by GRID_DIM.
};

//! One of the 81 lattice cells. Images are read-only views into the RectifiedGrid buffers.
struct Cell {
	int row{0};
	int col{0};
	cv::Rect region; //!< Full lattice cell, side = RectifiedGrid::side / 9.
	cv::Rect inner;  //!< Region shrunk by the splitter margin.
	cv::Mat gray;    //!< Intensity of the inner region.
	cv::Mat mask;    //!< Ink mask of the inner region.

	std::size_t index() const {
		return static_cast<std::size_t>(row * GRID_DIM + col);
	}
};

//! Outcome of classifying a single cell.
struct CellResult {
	enum class Kind { Empty, Digit, Ambiguous };

	int row{0};
	int col{0};
	Kind kind{Kind::Empty};
	int digit{0};          //!< 1..9 for Kind::Digit, 0 otherwise.
	float confidence{0.f}; //!< 1.0 for empty cells, recognizer confidence otherwise.
};

//! Immutable 9x9 row-major grid of classified cells.
class SudokuGrid {
public:
	SudokuGrid() = default;
	explicit SudokuGrid(std::array<CellResult, CELL_COUNT> cells);

	const CellResult& at(int row, int col) const;
	const std::array<CellResult, CELL_COUNT>& cells() const;

	std::size_t ambiguousCount() const; //!< Quality summary for downstream warnings.
	std::size_t emptyCount() const;
	std::size_t digitCount() const;

	//! 81 characters row-major: digit, '0' for empty and '?' for ambiguous cells.
	std::string toString() const;

private:
	std::size_t countKind(CellResult::Kind kind) const;

private:
	std::array<CellResult, CELL_COUNT> m_cells{};
};

//! Everything a consumer needs from one processed image.
struct ScanResult {
	SudokuGrid grid;
	GridBoundary boundary;
	std::string source;                              //!< Source file name (no directory).
	std::chrono::system_clock::time_point timestamp; //!< Completion time.
};

} // namespace sudoku::vision
