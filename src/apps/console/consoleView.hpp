#pragma once

#include "core/gameState.hpp"

#include <iosfwd>

namespace connectk::console {

//! Clear the terminal and draw the grid with the player colours.
void drawGrid(const GameState& state, std::ostream& out);

} // namespace connectk::console
