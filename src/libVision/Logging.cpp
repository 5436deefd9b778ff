#include "Logging.hpp"

#include "Logger/LogConfig.hpp"
#include "Logger/LogOutputConsole.hpp"
#include "Logger/LogOutputFile.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <mutex>

namespace sudoku::vision {

static Logging::LogConfig config;

//! Enable logging of any entries to an output file + console(for debug builds).
static void InitializeLogger() {
	config.SetLogEnabled(true);
	config.SetMinLogLevel(Logging::LogLevel::Any);

	const auto logPath = Logging::GetDefaultLogDir("SudokuScan/Vision");

	std::error_code ec{};
	std::filesystem::create_directories(logPath, ec);
	if (!ec) {
		config.AddLogOutput(std::make_shared<Logging::LogOutputFile>(logPath / "log.txt"));
	} else {
		std::cerr << std::format("[Logger] Could not create directory: {}\nVision library will not log to file.\n", logPath.string());
	}

#ifndef NDEBUG
	config.AddLogOutput(std::make_shared<Logging::LogOutputConsole>());
#endif
}

Logging::Logger Logger() {
	static std::once_flag logInitFlag;
	std::call_once(logInitFlag, InitializeLogger);

	return Logging::Logger(config);
}

} // namespace sudoku::vision
