#include "app/resultExporter.hpp"

#include "Logging.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

namespace sudoku::app {

namespace {

//! Quote a CSV field if it contains separators or quotes.
std::string csvField(const std::string& value) {
	if (value.find_first_of(",\"\n\r") == std::string::npos) {
		return value;
	}

	std::string quoted = "\"";
	for (char c: value) {
		if (c == '"') {
			quoted += '"';
		}
		quoted += c;
	}
	quoted += '"';
	return quoted;
}

//! Only recognized digits are exported; empty and ambiguous cells stay blank.
std::string cellText(const vision::CellResult& cell) {
	if (cell.kind == vision::CellResult::Kind::Digit) {
		return std::to_string(cell.digit);
	}
	return {};
}

} // namespace

std::string formatTimestamp(std::chrono::system_clock::time_point timestamp) {
	return std::format("{:%Y-%m-%dT%H:%M:%SZ}", std::chrono::floor<std::chrono::seconds>(timestamp));
}

std::string formatGridPreview(const vision::SudokuGrid& grid) {
	static constexpr const char* SEPARATOR = "+-------+-------+-------+\n";

	std::ostringstream out;
	for (int row = 0; row < vision::GRID_DIM; ++row) {
		if (row % 3 == 0) {
			out << SEPARATOR;
		}
		for (int col = 0; col < vision::GRID_DIM; ++col) {
			if (col % 3 == 0) {
				out << "| ";
			}
			const auto& cell = grid.at(row, col);
			switch (cell.kind) {
			case vision::CellResult::Kind::Digit:
				out << cell.digit;
				break;
			case vision::CellResult::Kind::Ambiguous:
				out << '?';
				break;
			case vision::CellResult::Kind::Empty:
				out << '.';
				break;
			}
			out << ' ';
		}
		out << "|\n";
	}
	out << SEPARATOR;
	return out.str();
}

std::string CsvResultExporter::outputFileName(const std::string& source) {
	const std::string stem = std::filesystem::path(source).stem().string();
	return std::format("{}_sudoku.csv", stem.empty() ? std::string("image") : stem);
}

std::filesystem::path CsvResultExporter::write(const vision::ScanResult& result, const std::filesystem::path& outputDir) {
	std::error_code ec{};
	std::filesystem::create_directories(outputDir, ec);
	if (ec) {
		throw ExportError(std::format("Could not create output directory '{}': {}", outputDir.string(), ec.message()));
	}

	const auto path = outputDir / outputFileName(result.source);
	std::ofstream file(path, std::ios::trunc);
	if (!file) {
		throw ExportError(std::format("Could not open '{}' for writing", path.string()));
	}

	file << "Source File," << csvField(result.source) << '\n';
	file << "Timestamp," << formatTimestamp(result.timestamp) << '\n';
	file << "Ambiguous Cells," << result.grid.ambiguousCount() << '\n';
	file << '\n';

	for (int row = 0; row < vision::GRID_DIM; ++row) {
		for (int col = 0; col < vision::GRID_DIM; ++col) {
			if (col != 0) {
				file << ',';
			}
			file << cellText(result.grid.at(row, col));
		}
		file << '\n';
	}

	file.flush();
	if (!file) {
		throw ExportError(std::format("Writing '{}' failed", path.string()));
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Exporter] Wrote '{}'.", path.string()));
	return path;
}

} // namespace sudoku::app
