#include "vision/gridAssembler.hpp"

#include <array>
#include <format>
#include <stdexcept>

namespace sudoku::vision {

SudokuGrid assembleGrid(const std::vector<CellResult>& results) {
	if (results.size() != static_cast<std::size_t>(CELL_COUNT)) {
		throw std::invalid_argument(std::format("assembleGrid: expected {} cell results, got {}", CELL_COUNT, results.size()));
	}

	std::array<CellResult, CELL_COUNT> cells{};
	std::array<bool, CELL_COUNT> seen{};
	for (const auto& result: results) {
		if (result.row < 0 || result.row >= GRID_DIM || result.col < 0 || result.col >= GRID_DIM) {
			throw std::invalid_argument(std::format("assembleGrid: cell ({}, {}) out of range", result.row, result.col));
		}

		const auto index = static_cast<std::size_t>(result.row * GRID_DIM + result.col);
		if (seen[index]) {
			throw std::invalid_argument(std::format("assembleGrid: duplicate result for cell ({}, {})", result.row, result.col));
		}
		seen[index]  = true;
		cells[index] = result;
	}

	return SudokuGrid(cells);
}

} // namespace sudoku::vision
