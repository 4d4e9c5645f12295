#pragma once

#include "core/gameConfig.hpp"
#include "core/grid.hpp"
#include "core/player.hpp"
#include "core/types.hpp"

#include <array>
#include <cstddef>
#include <optional>

namespace connectk {

//! Rules of a game: turn order, placement, win and tie detection.
//! Value type. All mutation goes through submitMove.
class GameState {
public:
	//! Setup a game. Throws InvalidConfigurationError for non-positive dimensions or run length.
	GameState(const GameConfig& config, PlayerInfo first, PlayerInfo second);

	//! Drop a token of the active player into column.
	//! A rejected move leaves turn order, token count and outcome untouched.
	MoveResult submitMove(int column);

	Outcome outcome() const;          //!< Current outcome of the game.
	PlayerIndex activePlayer() const; //!< Player to make the next move.
	std::size_t placedTokens() const; //!< Number of accepted moves.

	//! Owner of a cell for rendering. Coordinates outside of the grid have no owner.
	std::optional<PlayerIndex> cellOwner(int row, int column) const;

	const Player& player(PlayerIndex index) const;
	const Grid& grid() const;
	const GameConfig& config() const;

private:
	MoveResult reject(int column, MoveError error) const;

private:
	GameConfig m_config;
	Grid m_grid;
	std::array<Player, 2> m_players;
	PlayerIndex m_activePlayer{0};
	std::size_t m_placedTokens{0};
	Outcome m_outcome{};
};

} // namespace connectk
