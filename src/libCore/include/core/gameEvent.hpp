#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <variant>

namespace connectk {

struct DropEvent {
	PlayerIndex player;
	int column;
};
struct ShutdownEvent {};
using GameEvent = std::variant<DropEvent, ShutdownEvent>;


//! Types of signals.
enum GameSignal : std::uint64_t {
	GS_None         = 0,
	GS_BoardChange  = 1 << 0, //!< Token was placed.
	GS_PlayerChange = 1 << 1, //!< Active player changed.
	GS_StateChange  = 1 << 2, //!< Game finished. Won or tied.
	GS_MoveRejected = 1 << 3, //!< Move was not applied.
};


//! Symbolises the game state change after one accepted move.
struct GameDelta {
	std::size_t moveId;     //!< Move number, starting at 1.
	PlayerIndex player;     //!< Player that made the move.
	Coord coord;            //!< Cell the token landed in.
	PlayerIndex nextPlayer; //!< Player to make the next move.
	Outcome outcome;        //!< Outcome after the move.
};

} // namespace connectk
