#pragma once

#include <stdexcept>
#include <string>

namespace sudoku::vision {

//! Base of every image-level failure. Aborts processing of the single image named by file().
class ScanError : public std::runtime_error {
public:
	ScanError(const std::string& file, const std::string& message);

	const std::string& file() const; //!< Name of the offending image (may be empty for in-memory input).

private:
	std::string m_file;
};

//! Image could not be decoded or is too small to resolve grid lines.
class UnreadableImageError : public ScanError {
public:
	using ScanError::ScanError;
};

//! No quadrilateral qualified as the sudoku border.
class GridNotFoundError : public ScanError {
public:
	using ScanError::ScanError;
};

//! Boundary corners are degenerate; no projective transform exists.
class RectificationError : public ScanError {
public:
	using ScanError::ScanError;
};

//! The whole-image deadline expired before the grid was assembled.
class ProcessingTimeoutError : public ScanError {
public:
	using ScanError::ScanError;
};

//! Failure inside a digit recognizer. Never escapes the cell classifier.
class RecognitionError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! Configuration file missing, unreadable or holding out-of-range values.
class ConfigError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

} // namespace sudoku::vision
