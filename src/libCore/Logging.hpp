#pragma once

#include "Logger/Logger.hpp"

namespace connectk {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace connectk
