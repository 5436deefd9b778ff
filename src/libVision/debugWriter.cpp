#include "vision/debugWriter.hpp"

#include "Logging.hpp"

#include <opencv2/imgcodecs.hpp>

#include <format>
#include <system_error>
#include <utility>

namespace sudoku::vision {

DebugDirectoryWriter::DebugDirectoryWriter(std::filesystem::path directory) : m_directory(std::move(directory)) {
}

void DebugDirectoryWriter::save(const std::string& name, const cv::Mat& image) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto fileName = m_directory / std::format("{}_{}.png", m_index++, name);
	if (image.empty()) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[DebugWriter] Skipping empty artifact '{}'.", name));
		return;
	}

	std::error_code ec{};
	std::filesystem::create_directories(m_directory, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[DebugWriter] Could not create '{}': {}", m_directory.string(), ec.message()));
		return;
	}

	bool ok = false;
	try {
		ok = cv::imwrite(fileName.string(), image);
	} catch (const cv::Exception& e) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[DebugWriter] Writing '{}' failed: {}", fileName.string(), e.what()));
		return;
	}

	if (!ok) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[DebugWriter] Writing '{}' failed.", fileName.string()));
		return;
	}
	++m_written;
}

const std::filesystem::path& DebugDirectoryWriter::directory() const {
	return m_directory;
}

unsigned DebugDirectoryWriter::written() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_written;
}

} // namespace sudoku::vision
