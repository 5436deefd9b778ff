#pragma once

#include "vision/config.hpp"
#include "vision/debugWriter.hpp"
#include "vision/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace sudoku::vision {

//! Read and decode an image file (PNG, JPG, BMP, TIFF).
//! \throws UnreadableImageError if the file cannot be read or decoded.
RawImage loadImage(const std::filesystem::path& path);

//! Decode an in-memory encoded image.
//! \param [in] bytes  Encoded file content.
//! \param [in] source Name used in error messages.
//! \throws UnreadableImageError if decoding fails.
RawImage decodeImage(const std::vector<unsigned char>& bytes, const std::string& source);

//! Convert to a single channel 8 bit image independent of channel count and depth.
//! \returns False for unsupported channel counts.
bool convertToGray(const cv::Mat& image, cv::Mat& outGray);

//! True if the image border is mostly dark, i.e. light ink on a dark background.
bool hasDarkBackground(const cv::Mat& gray);

/*! Produce the intensity image and adaptive ink mask the grid locator works on.
 * \param [in]     raw      Decoded image.
 * \param [in]     settings Thresholding parameters.
 * \param [in,out] debug    Optional artifact writer.
 * \throws UnreadableImageError if the image is empty or below the minimum resolution.
 */
NormalizedImage normalizeImage(const RawImage& raw, const NormalizeSettings& settings, IDebugWriter* debug = nullptr);

} // namespace sudoku::vision
