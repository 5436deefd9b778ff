#include "app/batchRunner.hpp"

#include "Logging.hpp"
#include "vision/errors.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <utility>

namespace sudoku::app {

bool isSupportedImage(const std::filesystem::path& path) {
	static constexpr std::array<const char*, 6> EXTENSIONS = {".png", ".jpg", ".jpeg", ".bmp", ".tiff", ".tif"};

	std::string extension = path.extension().string();
	std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return std::find(EXTENSIONS.begin(), EXTENSIONS.end(), extension) != EXTENSIONS.end();
}

std::vector<std::filesystem::path> findImages(const std::filesystem::path& directory) {
	std::vector<std::filesystem::path> images;
	for (const auto& entry: std::filesystem::directory_iterator(directory)) {
		if (entry.is_regular_file() && isSupportedImage(entry.path())) {
			images.push_back(entry.path());
		}
	}
	std::sort(images.begin(), images.end());
	return images;
}

std::size_t BatchReport::succeeded() const {
	return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(), [](const ImageOutcome& o) { return o.success; }));
}

std::size_t BatchReport::failed() const {
	return outcomes.size() - succeeded();
}

BatchRunner::BatchRunner(vision::SudokuScanner& scanner, IResultExporter* exporter, std::filesystem::path outputDir)
    : m_scanner(scanner), m_exporter(exporter), m_outputDir(std::move(outputDir)) {}

ImageOutcome BatchRunner::processOne(const std::filesystem::path& path) {
	ImageOutcome outcome{};
	outcome.path = path;

	const std::string name = path.filename().string();
	try {
		outcome.scan = m_scanner.scan(path);
		if (m_exporter) {
			outcome.exported = m_exporter->write(*outcome.scan, m_outputDir);
		}
		outcome.success = true;

		if (outcome.scan->grid.ambiguousCount() != 0u) {
			Logger().Log(Logging::LogLevel::Warning,
			             std::format("[BatchRunner] '{}' has {} ambiguous cells.", name, outcome.scan->grid.ambiguousCount()));
		}
	} catch (const vision::ScanError& e) {
		outcome.error = e.what();
		Logger().Log(Logging::LogLevel::Error, std::format("[BatchRunner] Skipping '{}': {}", name, e.what()));
	} catch (const cv::Exception& e) {
		outcome.error = std::format("{}: OpenCV error: {}", name, e.what());
		Logger().Log(Logging::LogLevel::Error, std::format("[BatchRunner] OpenCV failure on '{}': {}", name, e.what()));
	} catch (const std::exception& e) {
		outcome.error = std::format("{}: {}", name, e.what());
		Logger().Log(Logging::LogLevel::Error, std::format("[BatchRunner] Failure on '{}': {}", name, e.what()));
	}
	return outcome;
}

BatchReport BatchRunner::run(const std::filesystem::path& directory) {
	const auto files = findImages(directory);
	Logger().Log(Logging::LogLevel::Info, std::format("[BatchRunner] Found {} images in '{}'.", files.size(), directory.string()));
	return run(files);
}

BatchReport BatchRunner::run(const std::vector<std::filesystem::path>& files) {
	BatchReport report{};
	report.outcomes.reserve(files.size());
	for (const auto& file: files) {
		report.outcomes.push_back(processOne(file));
	}

	Logger().Log(Logging::LogLevel::Info,
	             std::format("[BatchRunner] Batch done: {} succeeded, {} failed.", report.succeeded(), report.failed()));
	return report;
}

} // namespace sudoku::app
