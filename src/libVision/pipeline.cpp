#include "vision/pipeline.hpp"

#include "Logging.hpp"
#include "vision/SafeQueue.hpp"
#include "vision/cellSplitter.hpp"
#include "vision/errors.hpp"
#include "vision/gridAssembler.hpp"
#include "vision/gridLocator.hpp"
#include "vision/imageLoader.hpp"
#include "vision/rectifier.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <format>
#include <mutex>
#include <thread>
#include <utility>

namespace sudoku::vision {

Deadline makeDeadline(std::chrono::milliseconds timeout) {
	if (timeout.count() <= 0) {
		return std::nullopt;
	}
	return std::chrono::steady_clock::now() + timeout;
}

static bool isExpired(const Deadline& deadline) {
	return deadline && std::chrono::steady_clock::now() >= *deadline;
}

void checkDeadline(const Deadline& deadline, const std::string& source, const std::string& stage) {
	if (isExpired(deadline)) {
		throw ProcessingTimeoutError(source, std::format("Timed out during {}", stage));
	}
}

GridExtraction extractCells(const RawImage& image, const PipelineConfig& config, IDebugWriter* debug, const Deadline& deadline) {
	GridExtraction extraction{};

	extraction.normalized = normalizeImage(image, config.normalize, debug);
	checkDeadline(deadline, image.source, "normalization");

	extraction.boundary = locateGrid(extraction.normalized, config.locator, debug);
	checkDeadline(deadline, image.source, "grid location");

	extraction.rectified = rectifyGrid(extraction.normalized, extraction.boundary, config.rectifier, debug);
	checkDeadline(deadline, image.source, "rectification");

	extraction.cells = splitCells(extraction.rectified, config.splitter);
	if (debug) {
		debug->save("cells", buildCellMosaic(extraction.cells));
	}
	return extraction;
}

std::vector<CellResult> classifyCells(const std::vector<Cell>& cells, CellClassifier& classifier, unsigned workerLimit, const Deadline& deadline,
                                      const std::string& source) {
	std::vector<CellResult> results(cells.size());

	// Inline: no threads for a single worker.
	if (workerLimit <= 1u) {
		for (std::size_t i = 0u; i < cells.size(); ++i) {
			checkDeadline(deadline, source, "cell classification");
			results[i] = classifier.classify(cells[i]);
		}
		return results;
	}

	SafeQueue<std::size_t> jobs;
	for (std::size_t i = 0u; i < cells.size(); ++i) {
		jobs.Push(i);
	}
	jobs.Release(); // Workers stop once the queue is drained.

	std::atomic<bool> expired{false};
	std::exception_ptr firstError;
	std::mutex errorMutex;

	const auto worker = [&]() {
		while (const auto index = jobs.Pop()) {
			if (expired.load() || isExpired(deadline)) {
				expired.store(true);
				return;
			}
			try {
				results[*index] = classifier.classify(cells[*index]);
			} catch (const std::exception&) {
				std::lock_guard<std::mutex> lock(errorMutex);
				if (!firstError) {
					firstError = std::current_exception();
				}
				return;
			}
		}
	};

	const std::size_t threadCount = std::min<std::size_t>(workerLimit, cells.size());
	std::vector<std::thread> workers;
	workers.reserve(threadCount);
	try {
		for (std::size_t i = 0u; i < threadCount; ++i) {
			workers.emplace_back(worker);
		}
	} catch (const std::exception& e) {
		// Threads that did start must be joined before the vector destroys them.
		Logger().Log(Logging::LogLevel::Error, std::format("[Pipeline] Could not start worker {} of {}: {}", workers.size() + 1u, threadCount, e.what()));
		expired.store(true);
		for (auto& thread: workers) {
			thread.join();
		}
		throw;
	}
	for (auto& thread: workers) {
		thread.join();
	}

	if (firstError) {
		std::rethrow_exception(firstError);
	}
	if (expired.load()) {
		throw ProcessingTimeoutError(source, "Timed out during cell classification");
	}
	return results;
}

SudokuScanner::SudokuScanner(PipelineConfig config, std::shared_ptr<IDigitRecognizer> recognizer)
    : m_config(std::move(config)), m_classifier(std::move(recognizer), m_config.classifier) {
	validateConfig(m_config);
}

ScanResult SudokuScanner::scan(const std::filesystem::path& path) {
	const Deadline deadline = makeDeadline(m_config.timeout);
	const RawImage image    = loadImage(path);

	if (m_config.debugDirectory.empty()) {
		return process(image, nullptr, deadline);
	}
	DebugDirectoryWriter writer(m_config.debugDirectory / path.stem());
	return process(image, &writer, deadline);
}

ScanResult SudokuScanner::scan(const RawImage& image, IDebugWriter* debug) {
	const Deadline deadline = makeDeadline(m_config.timeout);
	if (debug || m_config.debugDirectory.empty()) {
		return process(image, debug, deadline);
	}

	const std::string stem = std::filesystem::path(image.source).stem().string();
	DebugDirectoryWriter writer(m_config.debugDirectory / (stem.empty() ? std::string("image") : stem));
	return process(image, &writer, deadline);
}

ScanResult SudokuScanner::process(const RawImage& image, IDebugWriter* debug, const Deadline& deadline) {
	const auto start = std::chrono::steady_clock::now();

	const GridExtraction extraction      = extractCells(image, m_config, debug, deadline);
	const std::vector<CellResult> results = classifyCells(extraction.cells, m_classifier, m_config.workerLimit, deadline, image.source);

	ScanResult scan{};
	scan.grid      = assembleGrid(results);
	scan.boundary  = extraction.boundary;
	scan.source    = image.source;
	scan.timestamp = std::chrono::system_clock::now();

	const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
	Logger().Log(Logging::LogLevel::Info, std::format("[Pipeline] '{}' done in {} ms: {} digits, {} empty, {} ambiguous.", image.source, elapsed.count(),
	                                                  scan.grid.digitCount(), scan.grid.emptyCount(), scan.grid.ambiguousCount()));
	return scan;
}

const PipelineConfig& SudokuScanner::config() const {
	return m_config;
}

unsigned SudokuScanner::recognizerInvocations() const {
	return m_classifier.invocationCount();
}

} // namespace sudoku::vision
