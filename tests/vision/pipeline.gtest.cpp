#include "vision/debugWriter.hpp"
#include "vision/errors.hpp"
#include "vision/mockRecognizer.hpp"
#include "vision/pipeline.hpp"
#include "vision/syntheticGrid.hpp"
#include "vision/templateDigitRecognizer.hpp"

#include <gtest/gtest.h>

#include <opencv2/core.hpp>

#include <array>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace sudoku::gtest {

//! Occupancy pattern: '1' for any non-empty cell, '0' otherwise.
static std::string occupancy(const std::string& cells) {
	std::string out = cells;
	for (char& c: out) {
		c = c == '0' ? '0' : '1';
	}
	return out;
}

static vision::PipelineConfig inlineConfig() {
	vision::PipelineConfig config{};
	config.workerLimit = 1u;
	return config;
}

//! Collects artifact names instead of writing files.
class RecordingDebugWriter : public vision::IDebugWriter {
public:
	void save(const std::string& name, const cv::Mat& image) override {
		if (!image.empty()) {
			names.push_back(name);
		}
	}

	std::vector<std::string> names;
};

TEST(Pipeline, ReadsClassicPuzzle) {
	vision::SudokuScanner scanner(inlineConfig(), std::make_shared<vision::TemplateDigitRecognizer>());

	const auto result = scanner.scan(toRawImage(renderPuzzle(CLASSIC_PUZZLE), "classic.png"));
	EXPECT_EQ(result.grid.toString(), puzzleString(CLASSIC_PUZZLE));
	EXPECT_EQ(result.grid.digitCount(), 30u);
	EXPECT_EQ(result.grid.emptyCount(), 51u);
	EXPECT_EQ(result.grid.ambiguousCount(), 0u);
	EXPECT_EQ(result.source, "classic.png");
	EXPECT_EQ(scanner.recognizerInvocations(), 30u);
}

TEST(Pipeline, BlankGridIsAllEmpty) {
	auto recognizer = std::make_shared<CountingRecognizer>();
	vision::SudokuScanner scanner(inlineConfig(), recognizer);

	const auto result = scanner.scan(toRawImage(renderBlankGrid()));
	EXPECT_EQ(result.grid.emptyCount(), 81u);
	EXPECT_EQ(recognizer->calls(), 0u);
	EXPECT_EQ(scanner.recognizerInvocations(), 0u);
}

TEST(Pipeline, ExtractionIsDeterministic) {
	const auto image  = toRawImage(renderPuzzle(CLASSIC_PUZZLE));
	const auto config = inlineConfig();

	const auto first  = vision::extractCells(image, config);
	const auto second = vision::extractCells(image, config);

	for (std::size_t i = 0u; i < 4u; ++i) {
		EXPECT_EQ(first.boundary.corners[i], second.boundary.corners[i]);
	}
	ASSERT_EQ(first.cells.size(), second.cells.size());
	EXPECT_EQ(cv::norm(first.rectified.gray, second.rectified.gray, cv::NORM_INF), 0.0);
	for (std::size_t i = 0u; i < first.cells.size(); ++i) {
		EXPECT_EQ(first.cells[i].inner, second.cells[i].inner);
		EXPECT_EQ(cv::countNonZero(first.cells[i].mask != second.cells[i].mask), 0);
	}
}

TEST(Pipeline, RepeatedScansAgree) {
	vision::SudokuScanner scanner(vision::PipelineConfig{}, std::make_shared<vision::TemplateDigitRecognizer>());
	const auto image = toRawImage(renderPuzzle(CLASSIC_PUZZLE));

	const auto first = scanner.scan(image).grid.toString();
	for (int run = 0; run < 3; ++run) {
		EXPECT_EQ(scanner.scan(image).grid.toString(), first);
	}
}

TEST(Pipeline, ReadsRotatedPuzzle) {
	const GridLayout layout{};
	cv::Mat transform;
	const cv::Mat rotated = rotateImage(renderPuzzle(CLASSIC_PUZZLE, layout), 10.0, 0.8, &transform);

	const auto extraction = vision::extractCells(toRawImage(rotated, "rotated.png"), inlineConfig());

	// Locator corners follow the rotated border.
	const auto expected = layout.outerCorners();
	std::vector<cv::Point2f> rotatedCorners;
	for (const auto& corner: expected) {
		rotatedCorners.push_back(transformPoint(transform, corner));
	}
	const auto ordered = vision::orderCorners(rotatedCorners);
	for (std::size_t i = 0u; i < 4u; ++i) {
		EXPECT_NEAR(extraction.boundary.corners[i].x, ordered[i].x, 6.0) << "corner " << i;
		EXPECT_NEAR(extraction.boundary.corners[i].y, ordered[i].y, 6.0) << "corner " << i;
	}

	vision::SudokuScanner scanner(inlineConfig(), std::make_shared<vision::TemplateDigitRecognizer>());
	const auto tilted = scanner.scan(toRawImage(rotated, "rotated.png"));
	EXPECT_EQ(tilted.grid.toString(), puzzleString(CLASSIC_PUZZLE));
	EXPECT_EQ(tilted.grid.ambiguousCount(), 0u);
}

TEST(Pipeline, ReadsKeystonePerspective) {
	const GridLayout layout{};
	// Narrower at the top than at the bottom, as when the camera looks down at a page.
	const std::array<cv::Point2f, 4> target = {cv::Point2f(60.f, 30.f), cv::Point2f(570.f, 30.f), cv::Point2f(620.f, 610.f), cv::Point2f(10.f, 610.f)};
	cv::Mat homography;
	const cv::Mat warped = keystoneImage(renderPuzzle(CLASSIC_PUZZLE, layout), target, &homography);

	const auto extraction = vision::extractCells(toRawImage(warped, "keystone.png"), inlineConfig());

	const auto outer = layout.outerCorners();
	std::vector<cv::Point2f> warpedCorners;
	cv::perspectiveTransform(std::vector<cv::Point2f>(outer.begin(), outer.end()), warpedCorners, homography);
	const auto ordered = vision::orderCorners(warpedCorners);
	for (std::size_t i = 0u; i < 4u; ++i) {
		EXPECT_NEAR(extraction.boundary.corners[i].x, ordered[i].x, 6.0) << "corner " << i;
		EXPECT_NEAR(extraction.boundary.corners[i].y, ordered[i].y, 6.0) << "corner " << i;
	}

	// Rectification removes the keystone: the top edge is no longer shorter than the bottom one.
	EXPECT_EQ(extraction.rectified.gray.rows, extraction.rectified.gray.cols);
	EXPECT_EQ(extraction.cells.size(), static_cast<std::size_t>(vision::CELL_COUNT));

	vision::SudokuScanner scanner(inlineConfig(), std::make_shared<vision::TemplateDigitRecognizer>());
	const auto result = scanner.scan(toRawImage(warped, "keystone.png"));
	EXPECT_EQ(result.grid.toString(), puzzleString(CLASSIC_PUZZLE));
	EXPECT_EQ(result.grid.ambiguousCount(), 0u);
}

TEST(Pipeline, DarkBackgroundIsInverted) {
	cv::Mat inverted;
	cv::bitwise_not(renderPuzzle(CLASSIC_PUZZLE), inverted);

	vision::SudokuScanner scanner(inlineConfig(), std::make_shared<CountingRecognizer>());
	const auto result = scanner.scan(toRawImage(inverted));
	EXPECT_EQ(occupancy(result.grid.toString()), occupancy(puzzleString(CLASSIC_PUZZLE)));
}

TEST(Pipeline, WorkerCountDoesNotChangeResult) {
	const auto image = toRawImage(renderPuzzle(CLASSIC_PUZZLE));

	vision::SudokuScanner sequential(inlineConfig(), std::make_shared<vision::TemplateDigitRecognizer>());
	const auto expected = sequential.scan(image).grid;

	vision::PipelineConfig parallelConfig{};
	parallelConfig.workerLimit = 8u;
	vision::SudokuScanner parallel(parallelConfig, std::make_shared<JitteryRecognizer>());

	const auto result = parallel.scan(image).grid;
	EXPECT_EQ(result.toString(), expected.toString());
	for (int row = 0; row < vision::GRID_DIM; ++row) {
		for (int col = 0; col < vision::GRID_DIM; ++col) {
			EXPECT_EQ(result.at(row, col).row, row);
			EXPECT_EQ(result.at(row, col).col, col);
		}
	}
}

TEST(Pipeline, SerializesNonThreadSafeRecognizer) {
	vision::PipelineConfig config{};
	config.workerLimit = 4u;
	vision::SudokuScanner scanner(config, std::make_shared<SlowRecognizer>(std::chrono::milliseconds(1)));

	const auto result = scanner.scan(toRawImage(renderPuzzle(CLASSIC_PUZZLE)));
	EXPECT_EQ(result.grid.digitCount(), 30u);
	EXPECT_EQ(scanner.recognizerInvocations(), 30u);
}

TEST(Pipeline, TimeoutAbortsImage) {
	vision::PipelineConfig config = inlineConfig();
	config.timeout                = std::chrono::milliseconds(100);
	vision::SudokuScanner scanner(config, std::make_shared<SlowRecognizer>(std::chrono::milliseconds(50)));

	EXPECT_THROW(scanner.scan(toRawImage(renderPuzzle(CLASSIC_PUZZLE), "slow.png")), vision::ProcessingTimeoutError);
}

TEST(Pipeline, TimeoutAbortsParallelClassification) {
	vision::PipelineConfig config{};
	config.workerLimit = 4u;
	config.timeout     = std::chrono::milliseconds(100);
	vision::SudokuScanner scanner(config, std::make_shared<SlowRecognizer>(std::chrono::milliseconds(50)));

	EXPECT_THROW(scanner.scan(toRawImage(renderPuzzle(CLASSIC_PUZZLE), "slow.png")), vision::ProcessingTimeoutError);
}

TEST(Pipeline, RecognizerFailureOnlyAffectsDigitCells) {
	vision::PipelineConfig config{};
	config.workerLimit = 4u;
	vision::SudokuScanner scanner(config, std::make_shared<ThrowingRecognizer>());

	const auto result = scanner.scan(toRawImage(renderPuzzle(CLASSIC_PUZZLE)));
	EXPECT_EQ(result.grid.ambiguousCount(), 30u);
	EXPECT_EQ(result.grid.emptyCount(), 51u);
	EXPECT_EQ(occupancy(result.grid.toString()), occupancy(puzzleString(CLASSIC_PUZZLE)));
}

TEST(Pipeline, PageWithoutGridFails) {
	vision::SudokuScanner scanner(inlineConfig(), std::make_shared<CountingRecognizer>());
	const cv::Mat page(600, 600, CV_8UC3, cv::Scalar(255, 255, 255));

	try {
		scanner.scan(toRawImage(page, "page.png"));
		FAIL() << "Expected GridNotFoundError";
	} catch (const vision::GridNotFoundError& e) {
		EXPECT_EQ(e.file(), "page.png");
	}
}

TEST(Pipeline, CorruptFileFails) {
	const auto dir = std::filesystem::temp_directory_path() / "sudoku_pipeline_test";
	std::filesystem::create_directories(dir);
	const auto path = dir / "corrupt.png";
	std::ofstream(path, std::ios::binary) << "definitely not a png";

	vision::SudokuScanner scanner(inlineConfig(), std::make_shared<CountingRecognizer>());
	EXPECT_THROW(scanner.scan(path), vision::UnreadableImageError);

	std::filesystem::remove_all(dir);
}

TEST(Pipeline, WritesDebugArtifacts) {
	vision::SudokuScanner scanner(inlineConfig(), std::make_shared<CountingRecognizer>());
	RecordingDebugWriter debug;

	scanner.scan(toRawImage(renderBlankGrid()), &debug);
	const std::vector<std::string> expected = {"normalized_gray", "normalized_mask", "grid_boundary", "rectified", "rectified_mask", "cells"};
	EXPECT_EQ(debug.names, expected);
}

TEST(Pipeline, DebugDirectoryReceivesNumberedImages) {
	const auto dir = std::filesystem::temp_directory_path() / "sudoku_debug_test";
	std::filesystem::remove_all(dir);

	vision::PipelineConfig config = inlineConfig();
	config.debugDirectory         = dir;
	vision::SudokuScanner scanner(config, std::make_shared<CountingRecognizer>());

	scanner.scan(toRawImage(renderBlankGrid(), "blank.png"));
	EXPECT_TRUE(std::filesystem::exists(dir / "blank" / "0_normalized_gray.png"));
	EXPECT_TRUE(std::filesystem::exists(dir / "blank" / "2_grid_boundary.png"));
	EXPECT_TRUE(std::filesystem::exists(dir / "blank" / "5_cells.png"));

	std::filesystem::remove_all(dir);
}

TEST(Pipeline, DirectoryWriterCountsArtifacts) {
	const auto dir = std::filesystem::temp_directory_path() / "sudoku_debug_writer_test";
	std::filesystem::remove_all(dir);

	vision::SudokuScanner scanner(inlineConfig(), std::make_shared<CountingRecognizer>());
	ASSERT_TRUE(scanner.config().debugDirectory.empty());

	vision::DebugDirectoryWriter writer(dir / "explicit");
	EXPECT_EQ(writer.directory().string(), (dir / "explicit").string());
	EXPECT_EQ(writer.written(), 0u);

	scanner.scan(toRawImage(renderBlankGrid(), "blank.png"), &writer);
	EXPECT_EQ(writer.written(), 6u);
	EXPECT_TRUE(std::filesystem::exists(writer.directory() / "3_rectified.png"));

	std::filesystem::remove_all(dir);
}

TEST(Pipeline, ScannerKeepsConfig) {
	vision::PipelineConfig config{};
	config.workerLimit = 3u;
	config.timeout     = std::chrono::milliseconds(2500);

	const vision::SudokuScanner scanner(config, std::make_shared<CountingRecognizer>());
	EXPECT_EQ(scanner.config().workerLimit, 3u);
	EXPECT_EQ(scanner.config().timeout.count(), 2500);
}

TEST(Pipeline, InvalidConfigIsRejected) {
	vision::PipelineConfig config{};
	config.normalize.blurKernelSize = 4;
	EXPECT_THROW(vision::SudokuScanner(config, std::make_shared<CountingRecognizer>()), vision::ConfigError);
}

} // namespace sudoku::gtest
