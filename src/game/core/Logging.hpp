#pragma once

#include "Logger/Logger.hpp"

namespace mines {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace mines
