#pragma once

#include "vision/types.hpp"

#include <vector>

namespace sudoku::vision {

//! Place every result by its (row, col) into a row-major grid. Arrival order is irrelevant.
//! \throws std::invalid_argument unless there are exactly 81 results with unique in-range positions.
SudokuGrid assembleGrid(const std::vector<CellResult>& results);

} // namespace sudoku::vision
