#pragma once

#include "vision/config.hpp"
#include "vision/debugWriter.hpp"
#include "vision/types.hpp"

namespace sudoku::vision {

//! Homography mapping the boundary corners onto the corners of a side x side square.
//! \throws RectificationError if the corners are degenerate or the transform is singular.
cv::Mat computeGridHomography(const GridBoundary& boundary, int side, const std::string& source = {});

/*! Warp the grid region to an axis aligned square whose side is divisible by 9.
 * \param [in]     image    Normalized image the boundary was found on.
 * \param [in]     boundary Grid border, corners TL, TR, BR, BL.
 * \param [in]     settings Canonical side length.
 * \param [in,out] debug    Optional artifact writer.
 * \throws RectificationError on degenerate geometry.
 */
RectifiedGrid rectifyGrid(const NormalizedImage& image, const GridBoundary& boundary, const RectifierSettings& settings, IDebugWriter* debug = nullptr);

} // namespace sudoku::vision
