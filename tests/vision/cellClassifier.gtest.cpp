#include "vision/cellClassifier.hpp"
#include "vision/digitImage.hpp"
#include "vision/dnnDigitRecognizer.hpp"
#include "vision/mockRecognizer.hpp"
#include "vision/templateDigitRecognizer.hpp"

#include <gtest/gtest.h>

#include <opencv2/imgproc.hpp>

#include <memory>
#include <stdexcept>
#include <string>

namespace sudoku::gtest {

static constexpr int CELL = 38;

//! Inner cell image with optional printed digit. The mask marks dark pixels.
static vision::Cell makeCell(int digit, int row = 0, int col = 0) {
	vision::Cell cell{};
	cell.row  = row;
	cell.col  = col;
	cell.gray = cv::Mat(CELL, CELL, CV_8UC1, cv::Scalar(255));
	if (digit != 0) {
		const std::string text = std::to_string(digit);
		int baseline           = 0;
		const cv::Size size    = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, 0.9, 2, &baseline);
		cv::putText(cell.gray, text, {(CELL - size.width) / 2, (CELL + size.height) / 2}, cv::FONT_HERSHEY_SIMPLEX, 0.9, cv::Scalar(0), 2);
	}
	cv::threshold(cell.gray, cell.mask, 128.0, 255.0, cv::THRESH_BINARY_INV);
	return cell;
}

TEST(CellClassifier, EmptyCellNeverReachesRecognizer) {
	auto recognizer = std::make_shared<CountingRecognizer>();
	vision::CellClassifier classifier(recognizer, {});

	const auto result = classifier.classify(makeCell(0, 2, 3));
	EXPECT_EQ(result.kind, vision::CellResult::Kind::Empty);
	EXPECT_EQ(result.row, 2);
	EXPECT_EQ(result.col, 3);
	EXPECT_FLOAT_EQ(result.confidence, 1.f);
	EXPECT_EQ(recognizer->calls(), 0u);
	EXPECT_EQ(classifier.invocationCount(), 0u);
}

TEST(CellClassifier, GridLineBleedIsIgnored) {
	auto recognizer = std::make_shared<CountingRecognizer>();
	vision::CellClassifier classifier(recognizer, {});

	// Residual line along the left border and a speck of noise.
	vision::Cell cell = makeCell(0);
	cv::rectangle(cell.gray, {0, 0}, {2, CELL - 1}, cv::Scalar(0), cv::FILLED);
	cell.gray.at<unsigned char>(20, 20) = 0;
	cv::threshold(cell.gray, cell.mask, 128.0, 255.0, cv::THRESH_BINARY_INV);

	EXPECT_EQ(classifier.classify(cell).kind, vision::CellResult::Kind::Empty);
	EXPECT_EQ(recognizer->calls(), 0u);
}

TEST(CellClassifier, AcceptsConfidentDigit) {
	auto recognizer = std::make_shared<CountingRecognizer>("7", 0.9f);
	vision::CellClassifier classifier(recognizer, {});

	const auto result = classifier.classify(makeCell(7));
	EXPECT_EQ(result.kind, vision::CellResult::Kind::Digit);
	EXPECT_EQ(result.digit, 7);
	EXPECT_FLOAT_EQ(result.confidence, 0.9f);
	EXPECT_EQ(recognizer->calls(), 1u);
}

TEST(CellClassifier, LowConfidenceIsAmbiguous) {
	auto recognizer = std::make_shared<CountingRecognizer>("7", 0.3f);
	vision::CellClassifier classifier(recognizer, {});

	const auto result = classifier.classify(makeCell(7));
	EXPECT_EQ(result.kind, vision::CellResult::Kind::Ambiguous);
	EXPECT_EQ(result.digit, 0);
}

TEST(CellClassifier, AcceptanceThresholdIsInclusive) {
	// 0.7 and 0.9 are not exact in binary; the float confidence must still meet the double threshold.
	for (const double threshold: {0.5, 0.7, 0.9}) {
		vision::ClassifierSettings settings{};
		settings.acceptanceThreshold = threshold;

		vision::CellClassifier classifier(std::make_shared<CountingRecognizer>("4", static_cast<float>(threshold)), settings);
		EXPECT_EQ(classifier.classify(makeCell(4)).kind, vision::CellResult::Kind::Digit) << "threshold " << threshold;
	}
}

TEST(CellClassifier, InvalidLabelsAreAmbiguous) {
	for (const std::string label: {"", "0", "12", "x", "?"}) {
		vision::CellClassifier classifier(std::make_shared<CountingRecognizer>(label, 0.99f), {});
		EXPECT_EQ(classifier.classify(makeCell(3)).kind, vision::CellResult::Kind::Ambiguous) << "label '" << label << "'";
	}
}

TEST(CellClassifier, RecognizerFailureDegradesToAmbiguous) {
	vision::CellClassifier classifier(std::make_shared<ThrowingRecognizer>(), {});

	vision::CellResult result{};
	EXPECT_NO_THROW(result = classifier.classify(makeCell(5, 4, 4)));
	EXPECT_EQ(result.kind, vision::CellResult::Kind::Ambiguous);
	EXPECT_FLOAT_EQ(result.confidence, 0.f);
	EXPECT_EQ(result.row, 4);
	EXPECT_EQ(result.col, 4);
	EXPECT_EQ(classifier.failureCount(), 1u);
	EXPECT_EQ(classifier.invocationCount(), 1u);
}

TEST(CellClassifier, RequiresRecognizer) {
	EXPECT_THROW(vision::CellClassifier(nullptr, {}), std::invalid_argument);
}

TEST(CellClassifier, ParsesDigitLabels) {
	for (int digit = 1; digit <= 9; ++digit) {
		EXPECT_EQ(vision::parseDigitLabel(std::to_string(digit)).value_or(0), digit);
	}
	EXPECT_EQ(vision::parseDigitLabel(" 8\n").value_or(0), 8);
	EXPECT_EQ(vision::parseDigitLabel("7.").value_or(0), 7);
	EXPECT_EQ(vision::parseDigitLabel("(7").value_or(0), 7);
	EXPECT_EQ(vision::parseDigitLabel("7)").value_or(0), 7);

	EXPECT_FALSE(vision::parseDigitLabel("").has_value());
	EXPECT_FALSE(vision::parseDigitLabel("   ").has_value());
	EXPECT_FALSE(vision::parseDigitLabel("0").has_value());
	EXPECT_FALSE(vision::parseDigitLabel("10").has_value());
	EXPECT_FALSE(vision::parseDigitLabel("a").has_value());
	EXPECT_FALSE(vision::parseDigitLabel("1/2").has_value());
}

TEST(CellClassifier, PreparedDigitIsCenteredSquare) {
	const vision::ClassifierSettings settings{};
	const auto cell  = makeCell(4);
	const auto digit = vision::isolateDigit(cell.mask, settings.centralFraction);

	const cv::Mat prepared = vision::prepareDigit(cell.gray, digit, settings);
	ASSERT_EQ(prepared.rows, settings.recognizerInputSize);
	ASSERT_EQ(prepared.cols, settings.recognizerInputSize);
	EXPECT_GT(cv::countNonZero(prepared), 0);

	// Ink centered: its bounding box is roughly symmetric.
	const cv::Rect box = cv::boundingRect(prepared);
	EXPECT_NEAR(box.x + box.width / 2.0, settings.recognizerInputSize / 2.0, 3.0);
	EXPECT_NEAR(box.y + box.height / 2.0, settings.recognizerInputSize / 2.0, 3.0);
}

TEST(TemplateDigitRecognizer, RecognizesPrintedDigits) {
	vision::TemplateDigitRecognizer recognizer(32, 0.2);
	ASSERT_EQ(recognizer.templateSize(), 32);

	for (int digit = 1; digit <= 9; ++digit) {
		cv::Mat canvas = cv::Mat::zeros(120, 120, CV_8UC1);
		cv::putText(canvas, std::to_string(digit), {35, 90}, cv::FONT_HERSHEY_SIMPLEX, 2.0, cv::Scalar(255), 4);

		const auto recognition = recognizer.recognize(vision::centerOnSquare(canvas, 32, 0.2));
		EXPECT_EQ(recognition.label, std::to_string(digit));
		EXPECT_GT(recognition.confidence, 0.6f) << digit;
	}
}

TEST(TemplateDigitRecognizer, EmptyInputHasNoLabel) {
	vision::TemplateDigitRecognizer recognizer;

	const auto recognition = recognizer.recognize(cv::Mat::zeros(32, 32, CV_8UC1));
	EXPECT_TRUE(recognition.label.empty());
	EXPECT_FLOAT_EQ(recognition.confidence, 0.f);
	EXPECT_TRUE(recognizer.isThreadSafe());
}

TEST(TemplateDigitRecognizer, RejectsTinyTemplates) {
	EXPECT_THROW(vision::TemplateDigitRecognizer(4), vision::RecognitionError);
}

TEST(DnnDigitRecognizer, SoftmaxOverLogits) {
	const cv::Mat logits = (cv::Mat_<float>(1, 3) << 1.f, 2.f, 3.f);
	const auto probabilities = vision::DnnDigitRecognizer::toProbabilities(logits);

	ASSERT_EQ(probabilities.size(), 3u);
	EXPECT_NEAR(probabilities[0] + probabilities[1] + probabilities[2], 1.f, 1e-5f);
	EXPECT_GT(probabilities[2], probabilities[1]);
	EXPECT_GT(probabilities[1], probabilities[0]);
	EXPECT_NEAR(probabilities[2], 0.6652f, 1e-3f);
}

TEST(DnnDigitRecognizer, KeepsExistingDistribution) {
	const cv::Mat distribution = (cv::Mat_<float>(1, 4) << 0.1f, 0.2f, 0.3f, 0.4f);
	const auto probabilities   = vision::DnnDigitRecognizer::toProbabilities(distribution);

	ASSERT_EQ(probabilities.size(), 4u);
	EXPECT_FLOAT_EQ(probabilities[3], 0.4f);
}

TEST(DnnDigitRecognizer, MissingModelIsRecognitionError) {
	EXPECT_THROW(vision::DnnDigitRecognizer("does/not/exist.onnx"), vision::RecognitionError);
}

} // namespace sudoku::gtest
