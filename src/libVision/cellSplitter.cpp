#include "vision/cellSplitter.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace sudoku::vision {

int cellMargin(int cellSide, const SplitterSettings& settings) {
	const int margin = static_cast<int>(std::lround(settings.marginFraction * static_cast<double>(cellSide)));
	return std::clamp(margin, 1, std::max(1, (cellSide - 1) / 2));
}

std::vector<Cell> splitCells(const RectifiedGrid& grid, const SplitterSettings& settings) {
	if (grid.side <= 0 || grid.side % GRID_DIM != 0 || grid.gray.rows != grid.side || grid.gray.cols != grid.side) {
		throw std::invalid_argument(std::format("splitCells: rectified grid side {} is not a square multiple of {}", grid.side, GRID_DIM));
	}

	const int cellSide = grid.side / GRID_DIM;
	const int margin   = cellMargin(cellSide, settings);

	std::vector<Cell> cells;
	cells.reserve(CELL_COUNT);
	for (int row = 0; row < GRID_DIM; ++row) {
		for (int col = 0; col < GRID_DIM; ++col) {
			Cell cell{};
			cell.row    = row;
			cell.col    = col;
			cell.region = cv::Rect(col * cellSide, row * cellSide, cellSide, cellSide);
			cell.inner  = cv::Rect(cell.region.x + margin, cell.region.y + margin, cellSide - 2 * margin, cellSide - 2 * margin);
			cell.gray   = grid.gray(cell.inner);
			if (!grid.mask.empty()) {
				cell.mask = grid.mask(cell.inner);
			}
			cells.push_back(cell);
		}
	}
	return cells;
}

cv::Mat buildCellMosaic(const std::vector<Cell>& cells, int gap) {
	if (cells.empty()) {
		return {};
	}

	const cv::Size tile = cells.front().gray.size();
	const int width     = GRID_DIM * tile.width + (GRID_DIM + 1) * gap;
	const int height    = GRID_DIM * tile.height + (GRID_DIM + 1) * gap;

	cv::Mat mosaic(height, width, CV_8UC1, cv::Scalar(128));
	for (const auto& cell: cells) {
		if (cell.gray.size() != tile) {
			continue;
		}
		const cv::Rect target(gap + cell.col * (tile.width + gap), gap + cell.row * (tile.height + gap), tile.width, tile.height);
		cell.gray.copyTo(mosaic(target));
	}
	return mosaic;
}

} // namespace sudoku::vision
