#include "app/batchRunner.hpp"
#include "app/resultExporter.hpp"
#include "vision/config.hpp"
#include "vision/dnnDigitRecognizer.hpp"
#include "vision/errors.hpp"
#include "vision/pipeline.hpp"
#include "vision/templateDigitRecognizer.hpp"

#include <charconv>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

static constexpr int EXIT_OK    = 0;
static constexpr int EXIT_FAIL  = 1;
static constexpr int EXIT_USAGE = 2;

struct Options {
	std::filesystem::path input;
	std::filesystem::path outputDir{"."};
	std::filesystem::path configPath;
	std::filesystem::path modelPath;
	std::filesystem::path debugDir;
	std::optional<unsigned> workers;
	bool batch{false};
};

void printUsage(std::ostream& out) {
	out << "Usage: sudokuScan <image|dir> [-o outDir] [-c config.yml] [-m model.onnx] [-d debugDir] [-j workers] [--batch]\n"
	       "  -o  Directory for the <name>_sudoku.csv results (default: current directory).\n"
	       "  -c  YAML/JSON pipeline configuration.\n"
	       "  -m  ONNX digit classifier. Without it printed digits are matched against rendered glyphs.\n"
	       "  -d  Write intermediate images per input into this directory.\n"
	       "  -j  Concurrent cell classifications.\n"
	       "  --batch  Treat the input as a directory of images.\n";
}

//! \returns Nullopt and prints the reason on malformed arguments.
std::optional<Options> parseArguments(int argc, char** argv) {
	Options options{};
	bool haveInput = false;

	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i];

		const auto value = [&]() -> std::optional<std::string> {
			if (i + 1 >= argc) {
				std::cerr << std::format("Missing value for {}\n", arg);
				return std::nullopt;
			}
			return std::string(argv[++i]);
		};

		if (arg == "-h" || arg == "--help") {
			return std::nullopt;
		} else if (arg == "--batch") {
			options.batch = true;
		} else if (arg == "-o" || arg == "-c" || arg == "-m" || arg == "-d" || arg == "-j") {
			const auto v = value();
			if (!v) {
				return std::nullopt;
			}

			if (arg == "-o") {
				options.outputDir = *v;
			} else if (arg == "-c") {
				options.configPath = *v;
			} else if (arg == "-m") {
				options.modelPath = *v;
			} else if (arg == "-d") {
				options.debugDir = *v;
			} else {
				unsigned workers = 0u;
				const auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), workers);
				if (ec != std::errc{} || ptr != v->data() + v->size() || workers == 0u) {
					std::cerr << std::format("Invalid worker count '{}'\n", *v);
					return std::nullopt;
				}
				options.workers = workers;
			}
		} else if (!arg.empty() && arg.front() == '-') {
			std::cerr << std::format("Unknown option '{}'\n", arg);
			return std::nullopt;
		} else if (!haveInput) {
			options.input = arg;
			haveInput     = true;
		} else {
			std::cerr << std::format("Unexpected argument '{}'\n", arg);
			return std::nullopt;
		}
	}

	if (!haveInput) {
		std::cerr << "No input given\n";
		return std::nullopt;
	}
	return options;
}

std::shared_ptr<sudoku::vision::IDigitRecognizer> makeRecognizer(const Options& options, const sudoku::vision::PipelineConfig& config) {
	if (!options.modelPath.empty()) {
		return std::make_shared<sudoku::vision::DnnDigitRecognizer>(options.modelPath);
	}
	return std::make_shared<sudoku::vision::TemplateDigitRecognizer>(config.classifier.recognizerInputSize, config.classifier.paddingFraction);
}

void printOutcome(const sudoku::app::ImageOutcome& outcome) {
	const std::string name = outcome.path.filename().string();
	if (!outcome.success) {
		std::cerr << std::format("[FAILED] {}\n", outcome.error);
		return;
	}

	const auto& grid = outcome.scan->grid;
	std::cout << std::format("{} ({} digits, {} empty, {} ambiguous)\n", name, grid.digitCount(), grid.emptyCount(), grid.ambiguousCount());
	std::cout << sudoku::app::formatGridPreview(grid);
	if (!outcome.exported.empty()) {
		std::cout << std::format("Saved {}\n", outcome.exported.string());
	}
}

} // namespace

int main(int argc, char** argv) {
	const auto options = parseArguments(argc, argv);
	if (!options) {
		printUsage(std::cerr);
		return EXIT_USAGE;
	}

	try {
		sudoku::vision::PipelineConfig config = options->configPath.empty() ? sudoku::vision::PipelineConfig{} : sudoku::vision::loadConfig(options->configPath);
		if (options->workers) {
			config.workerLimit = *options->workers;
		}
		if (!options->debugDir.empty()) {
			config.debugDirectory = options->debugDir;
		}

		sudoku::vision::SudokuScanner scanner(config, makeRecognizer(*options, config));
		sudoku::app::CsvResultExporter exporter;
		sudoku::app::BatchRunner runner(scanner, &exporter, options->outputDir);

		const bool isDirectory = std::filesystem::is_directory(options->input);
		if (options->batch && !isDirectory) {
			std::cerr << std::format("'{}' is not a directory\n", options->input.string());
			return EXIT_USAGE;
		}

		if (isDirectory) {
			const auto report = runner.run(options->input);
			for (const auto& outcome: report.outcomes) {
				printOutcome(outcome);
			}
			std::cout << std::format("Processed {} images: {} succeeded, {} failed.\n", report.outcomes.size(), report.succeeded(), report.failed());
			return report.failed() == 0u ? EXIT_OK : EXIT_FAIL;
		}

		const auto outcome = runner.processOne(options->input);
		printOutcome(outcome);
		return outcome.success ? EXIT_OK : EXIT_FAIL;

	} catch (const sudoku::vision::ConfigError& e) {
		std::cerr << std::format("Configuration error: {}\n", e.what());
	} catch (const sudoku::vision::RecognitionError& e) {
		std::cerr << std::format("Recognizer error: {}\n", e.what());
	} catch (const std::exception& e) {
		std::cerr << std::format("Error: {}\n", e.what());
	}
	return EXIT_FAIL;
}
