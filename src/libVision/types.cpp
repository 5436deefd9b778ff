#include "vision/types.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace sudoku::vision {

SudokuGrid::SudokuGrid(std::array<CellResult, CELL_COUNT> cells) : m_cells(std::move(cells)) {
}

const CellResult& SudokuGrid::at(int row, int col) const {
	if (row < 0 || row >= GRID_DIM || col < 0 || col >= GRID_DIM) {
		throw std::out_of_range("SudokuGrid: cell position out of range");
	}
	return m_cells[static_cast<std::size_t>(row * GRID_DIM + col)];
}

const std::array<CellResult, CELL_COUNT>& SudokuGrid::cells() const {
	return m_cells;
}

std::size_t SudokuGrid::ambiguousCount() const {
	return countKind(CellResult::Kind::Ambiguous);
}

std::size_t SudokuGrid::emptyCount() const {
	return countKind(CellResult::Kind::Empty);
}

std::size_t SudokuGrid::digitCount() const {
	return countKind(CellResult::Kind::Digit);
}

std::string SudokuGrid::toString() const {
	std::string out;
	out.reserve(CELL_COUNT);
	for (const auto& cell: m_cells) {
		switch (cell.kind) {
		case CellResult::Kind::Digit:
			out.push_back(static_cast<char>('0' + cell.digit));
			break;
		case CellResult::Kind::Ambiguous:
			out.push_back('?');
			break;
		case CellResult::Kind::Empty:
			out.push_back('0');
			break;
		}
	}
	return out;
}

std::size_t SudokuGrid::countKind(CellResult::Kind kind) const {
	return static_cast<std::size_t>(std::count_if(m_cells.begin(), m_cells.end(), [kind](const CellResult& cell) { return cell.kind == kind; }));
}

} // namespace sudoku::vision
