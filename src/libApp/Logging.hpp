#pragma once

#include "Logger/Logger.hpp"

namespace sudoku::app {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace sudoku::app
