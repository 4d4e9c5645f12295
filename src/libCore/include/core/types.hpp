#pragma once

#include <cstdint>
#include <optional>

namespace connectk {

using Id          = unsigned; //!< Row or column index used by the core library.
using PlayerIndex = unsigned; //!< Index of a player in the game. Either 0 or 1.

//! Coordinate pair for the grid.
//! \note Row 0 is the top row, tokens fall towards row (rows - 1).
struct Coord {
	Id row, col;

	bool operator==(const Coord&) const = default;
};

//! Returns the index of the other player.
inline constexpr PlayerIndex opponent(PlayerIndex player) {
	return player == 0u ? 1u : 0u;
}

//! Reasons for a move to be rejected.
enum class MoveError {
	None,          //!< Move accepted.
	InvalidColumn, //!< Column index outside of the grid.
	ColumnFull,    //!< No empty cell left in the column.
	GameOver,      //!< Game already reached a terminal state.
	WrongPlayer    //!< Move submitted by the player not to move.
};

//! Status of a game.
enum class GameStatus {
	InProgress, //!< Moves are accepted.
	Won,        //!< A player completed a run.
	Tied        //!< Grid full without a run.
};

//! Terminal outcome of a game. Winner is only set for GameStatus::Won.
struct Outcome {
	GameStatus status{GameStatus::InProgress};
	std::optional<PlayerIndex> winner{};

	bool isTerminal() const {
		return status != GameStatus::InProgress;
	}
	bool operator==(const Outcome&) const = default;
};

//! Result of submitting a move to the game.
struct MoveResult {
	bool accepted;                    //!< Whether the move changed the game.
	std::optional<Coord> placedAt;    //!< Cell the token landed in. Set if accepted.
	Outcome outcome;                  //!< Outcome after the move.
	MoveError error{MoveError::None}; //!< Reason for rejection.
};

//! Returns a readable name of the error for log messages.
inline constexpr const char* toString(MoveError error) {
	switch (error) {
	case MoveError::None:
		return "None";
	case MoveError::InvalidColumn:
		return "InvalidColumn";
	case MoveError::ColumnFull:
		return "ColumnFull";
	case MoveError::GameOver:
		return "GameOver";
	case MoveError::WrongPlayer:
		return "WrongPlayer";
	}
	return "Unknown";
}

} // namespace connectk
