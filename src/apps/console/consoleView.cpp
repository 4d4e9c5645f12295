#include "consoleView.hpp"

#include <format>
#include <ostream>
#include <string>

namespace connectk::console {

static constexpr Colour kEmptyColour{128, 128, 128};

static std::string coin(const Colour colour) {
	return std::format("\033[38;2;{};{};{}m●\033[0m", colour.r, colour.g, colour.b);
}

void drawGrid(const GameState& state, std::ostream& out) {
	const auto rows    = static_cast<int>(state.grid().rows());
	const auto columns = static_cast<int>(state.grid().columns());

	out << "\033[2J\033[1;1H" << std::flush;

	for (int row = 0; row < rows; ++row) {
		out << "  ";
		for (int col = 0; col < columns; ++col) {
			const auto owner = state.cellOwner(row, col);
			out << coin(owner ? state.player(*owner).colour() : kEmptyColour) << "  ";
		}
		out << "\n";
	}

	out << "  ";
	for (int col = 0; col < columns; ++col) {
		out << std::format("{:<3}", col + 1);
	}
	out << std::endl;
}

} // namespace connectk::console
