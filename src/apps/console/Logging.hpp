#pragma once

#include "Logger/Logger.hpp"

namespace connectk::console {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace connectk::console
