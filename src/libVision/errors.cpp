#include "vision/errors.hpp"

#include <format>

namespace sudoku::vision {

static std::string composeMessage(const std::string& file, const std::string& message) {
	if (file.empty()) {
		return message;
	}
	return std::format("{}: {}", file, message);
}

ScanError::ScanError(const std::string& file, const std::string& message) : std::runtime_error(composeMessage(file, message)), m_file(file) {
}

const std::string& ScanError::file() const {
	return m_file;
}

} // namespace sudoku::vision
