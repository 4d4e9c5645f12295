#pragma once

#include <stdexcept>
#include <string>

namespace connectk {

//! Thrown when a game is set up with non-positive dimensions or run length.
class InvalidConfigurationError : public std::invalid_argument {
public:
	explicit InvalidConfigurationError(const std::string& message);
};

//! Construction inputs of a game. Defaults to the classic 6x7 board with four in a row.
struct GameConfig {
	int rows{6};              //!< Number of rows in the grid.
	int columns{7};           //!< Number of columns in the grid.
	int requiredRunLength{4}; //!< Tokens in a line required to win.

	//! Throws InvalidConfigurationError describing every non-positive value.
	void validate() const;
};

} // namespace connectk
