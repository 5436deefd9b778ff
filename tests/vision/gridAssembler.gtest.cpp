#include "vision/gridAssembler.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>

namespace sudoku::gtest {

static std::vector<vision::CellResult> makeResults() {
	std::vector<vision::CellResult> results;
	for (int row = 0; row < vision::GRID_DIM; ++row) {
		for (int col = 0; col < vision::GRID_DIM; ++col) {
			vision::CellResult result{};
			result.row = row;
			result.col = col;
			if ((row + col) % 4 == 0) {
				result.kind  = vision::CellResult::Kind::Digit;
				result.digit = (row + col) % 9 + 1;
			} else if (row == 8 && col == 7) {
				result.kind = vision::CellResult::Kind::Ambiguous;
			}
			results.push_back(result);
		}
	}
	return results;
}

TEST(GridAssembler, ArrivalOrderDoesNotMatter) {
	const auto ordered  = makeResults();
	const auto expected = vision::assembleGrid(ordered).toString();

	std::mt19937 random(42u);
	for (int round = 0; round < 5; ++round) {
		auto shuffled = ordered;
		std::shuffle(shuffled.begin(), shuffled.end(), random);

		const auto grid = vision::assembleGrid(shuffled);
		EXPECT_EQ(grid.toString(), expected);
		for (int row = 0; row < vision::GRID_DIM; ++row) {
			for (int col = 0; col < vision::GRID_DIM; ++col) {
				EXPECT_EQ(grid.at(row, col).row, row);
				EXPECT_EQ(grid.at(row, col).col, col);
			}
		}
	}
}

TEST(GridAssembler, SummaryCounts) {
	const auto grid = vision::assembleGrid(makeResults());

	EXPECT_EQ(grid.ambiguousCount(), 1u);
	EXPECT_EQ(grid.digitCount() + grid.emptyCount() + grid.ambiguousCount(), static_cast<std::size_t>(vision::CELL_COUNT));
	EXPECT_EQ(grid.toString().size(), static_cast<std::size_t>(vision::CELL_COUNT));
	EXPECT_EQ(grid.toString()[8 * 9 + 7], '?');
	EXPECT_EQ(grid.toString()[0], '1');
}

TEST(GridAssembler, RejectsWrongCount) {
	auto results = makeResults();
	results.pop_back();
	EXPECT_THROW(vision::assembleGrid(results), std::invalid_argument);
	EXPECT_THROW(vision::assembleGrid({}), std::invalid_argument);
}

TEST(GridAssembler, RejectsDuplicatePosition) {
	auto results   = makeResults();
	results[5].row = results[4].row;
	results[5].col = results[4].col;
	EXPECT_THROW(vision::assembleGrid(results), std::invalid_argument);
}

TEST(GridAssembler, RejectsOutOfRangePosition) {
	auto results   = makeResults();
	results[0].row = 9;
	EXPECT_THROW(vision::assembleGrid(results), std::invalid_argument);
}

TEST(SudokuGrid, AtChecksBounds) {
	const auto grid = vision::assembleGrid(makeResults());
	EXPECT_THROW(grid.at(9, 0), std::out_of_range);
	EXPECT_THROW(grid.at(0, -1), std::out_of_range);
}

} // namespace sudoku::gtest
