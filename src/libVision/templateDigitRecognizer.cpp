#include "vision/templateDigitRecognizer.hpp"

#include "vision/digitImage.hpp"
#include "vision/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <string>

namespace sudoku::vision {

namespace {

//! Glyphs are drawn large and scaled down so stroke weight is the only variation.
static constexpr double GLYPH_FONT_SCALE = 4.0;
static constexpr int GLYPH_CANVAS        = 200;

static constexpr std::array<int, 2> GLYPH_FONTS       = {cv::FONT_HERSHEY_SIMPLEX, cv::FONT_HERSHEY_DUPLEX};
static constexpr std::array<int, 4> GLYPH_THICKNESSES = {3, 6, 9, 12};

cv::Mat renderGlyph(int digit, int font, int thickness) {
	const std::string text = std::to_string(digit);

	int baseline        = 0;
	const cv::Size size = cv::getTextSize(text, font, GLYPH_FONT_SCALE, thickness, &baseline);
	const cv::Point origin((GLYPH_CANVAS - size.width) / 2, (GLYPH_CANVAS + size.height) / 2);

	cv::Mat canvas = cv::Mat::zeros(GLYPH_CANVAS, GLYPH_CANVAS, CV_8UC1);
	cv::putText(canvas, text, origin, font, GLYPH_FONT_SCALE, cv::Scalar(255), thickness, cv::LINE_8);
	return canvas;
}

} // namespace

TemplateDigitRecognizer::TemplateDigitRecognizer(int templateSize, double paddingFraction) : m_templateSize(templateSize), m_paddingFraction(paddingFraction) {
	if (m_templateSize < 8) {
		throw RecognitionError("TemplateDigitRecognizer: template size must be at least 8 px");
	}
	buildGlyphs();
}

void TemplateDigitRecognizer::buildGlyphs() {
	m_glyphs.reserve(9u * GLYPH_FONTS.size() * GLYPH_THICKNESSES.size());
	for (int digit = 1; digit <= 9; ++digit) {
		for (int font: GLYPH_FONTS) {
			for (int thickness: GLYPH_THICKNESSES) {
				const cv::Mat normalized = centerOnSquare(renderGlyph(digit, font, thickness), m_templateSize, m_paddingFraction);

				cv::Mat glyph;
				normalized.convertTo(glyph, CV_32F);
				m_glyphs.push_back({digit, glyph});
			}
		}
	}
}

std::vector<float> TemplateDigitRecognizer::scores(const cv::Mat& image) const {
	std::vector<float> best(9u, 0.f);
	if (image.empty() || cv::countNonZero(image) == 0) {
		return best;
	}

	cv::Mat gray = image;
	if (gray.channels() != 1) {
		cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
	}
	if (gray.rows != m_templateSize || gray.cols != m_templateSize) {
		cv::resize(gray, gray, cv::Size(m_templateSize, m_templateSize), 0.0, 0.0, cv::INTER_AREA);
	}

	cv::Mat sample;
	gray.convertTo(sample, CV_32F);

	// Same-size matching: 1x1 result per glyph.
	cv::Mat result;
	for (const auto& glyph: m_glyphs) {
		cv::matchTemplate(sample, glyph.image, result, cv::TM_CCOEFF_NORMED);
		const float score = result.at<float>(0, 0);
		if (std::isfinite(score)) {
			float& slot = best[static_cast<std::size_t>(glyph.digit - 1)];
			slot        = std::max(slot, score);
		}
	}
	return best;
}

Recognition TemplateDigitRecognizer::recognize(const cv::Mat& image) {
	const std::vector<float> digitScores = scores(image);

	const auto bestIt = std::max_element(digitScores.begin(), digitScores.end());
	if (*bestIt <= 0.f) {
		return {"", 0.f};
	}

	const int digit = static_cast<int>(bestIt - digitScores.begin()) + 1;
	return {std::to_string(digit), std::clamp(*bestIt, 0.f, 1.f)};
}

bool TemplateDigitRecognizer::isThreadSafe() const {
	return true;
}

int TemplateDigitRecognizer::templateSize() const {
	return m_templateSize;
}

} // namespace sudoku::vision
