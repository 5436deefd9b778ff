#pragma once

#include "Logger/Logger.hpp"

namespace sudoku::vision {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace sudoku::vision
