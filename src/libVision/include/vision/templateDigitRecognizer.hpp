#pragma once

#include "vision/IDigitRecognizer.hpp"

#include <opencv2/core/mat.hpp>

#include <vector>

namespace sudoku::vision {

/*! Recognizes printed digits by normalized cross-correlation against rendered glyphs.
 * Glyphs 1..9 are drawn with OpenCV Hershey fonts at several stroke weights and normalized exactly
 * like cell images. Needs no model file; suited to printed puzzles and synthetic test grids.
 */
class TemplateDigitRecognizer : public IDigitRecognizer {
public:
	explicit TemplateDigitRecognizer(int templateSize = 32, double paddingFraction = 0.2);

	Recognition recognize(const cv::Mat& image) override;
	bool isThreadSafe() const override;

	//! Per-digit best correlation (index 0 -> digit 1). Empty input yields all zeros.
	std::vector<float> scores(const cv::Mat& image) const;

	int templateSize() const;

private:
	struct Glyph {
		int digit;
		cv::Mat image; //!< CV_32F templateSize x templateSize.
	};

	void buildGlyphs();

private:
	int m_templateSize;
	double m_paddingFraction;
	std::vector<Glyph> m_glyphs;
};

} // namespace sudoku::vision
