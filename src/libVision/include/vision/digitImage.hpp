#pragma once

#include <opencv2/core/mat.hpp>

namespace sudoku::vision {

//! Crop the ink bounding box, center it on a black square with a relative border and resize.
//! \param ink     CV_8UC1, non-zero pixels are ink.
//! \param size    Output side length.
//! \param padding Border added on each side relative to the longer bounding box side.
//! \returns size x size CV_8UC1; all black if there is no ink.
cv::Mat centerOnSquare(const cv::Mat& ink, int size, double padding);

} // namespace sudoku::vision
