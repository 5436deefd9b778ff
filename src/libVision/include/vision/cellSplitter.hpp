#pragma once

#include "vision/config.hpp"
#include "vision/types.hpp"

#include <vector>

namespace sudoku::vision {

//! Inward margin in pixels for a lattice cell of the given side. At least 1 px, leaves at least 1 px.
int cellMargin(int cellSide, const SplitterSettings& settings);

//! Partition the rectified grid into 81 equal cells, row-major.
//! \note Cell images are views into the grid buffers; the grid must outlive them.
std::vector<Cell> splitCells(const RectifiedGrid& grid, const SplitterSettings& settings);

//! Tile the inner cell images with a gap for visual inspection.
cv::Mat buildCellMosaic(const std::vector<Cell>& cells, int gap = 4);

} // namespace sudoku::vision
