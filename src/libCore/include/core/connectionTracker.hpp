#pragma once

#include "core/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace connectk {

//! The eight neighbour directions of a cell. A direction and its opposite differ only in the lowest bit.
enum class Direction : std::uint8_t {
	East = 0,
	West,
	South,
	North,
	NorthEast,
	SouthWest,
	SouthEast,
	NorthWest,
};

//! Lines a run can be formed along. Each axis consists of two opposite directions.
enum class Axis : std::uint8_t {
	Horizontal = 0, //!< East - West
	Vertical,       //!< South - North
	DiagonalUp,     //!< NorthEast - SouthWest
	DiagonalDown,   //!< SouthEast - NorthWest
};

inline constexpr std::array<Axis, 4> kAxes{Axis::Horizontal, Axis::Vertical, Axis::DiagonalUp, Axis::DiagonalDown};

//! Returns the direction pointing the other way.
inline constexpr Direction opposite(Direction direction) {
	return static_cast<Direction>(static_cast<std::uint8_t>(direction) ^ 1u);
}

//! Adjacency graph over the cells of one player.
//! Every recorded cell stores a bit per direction in which a cell of the same player is adjacent.
class ConnectionTracker {
public:
	ConnectionTracker(std::size_t rows, std::size_t columns);

	//! Record a newly placed cell and connect it to every adjacent cell recorded before.
	//! \returns The neighbours that received an edge to the new cell.
	//! \note The cell must not have been recorded before.
	std::vector<Coord> record(Coord c);

	//! Number of consecutive connected cells through c along axis, c included.
	std::size_t runLength(Coord c, Axis axis) const;

	//! Returns whether a run of at least minRunLength passes through c on any axis.
	bool hasWinningRun(Coord c, std::size_t minRunLength) const;

	bool isRecorded(Coord c) const;                   //!< Returns whether c belongs to the player.
	bool hasEdge(Coord c, Direction direction) const; //!< Returns whether c is connected to its neighbour in direction.
	std::size_t cellCount() const;                    //!< Number of recorded cells.

private:
	std::size_t index(Coord c) const;

private:
	std::size_t m_rows;                //!< Grid rows.
	std::size_t m_columns;             //!< Grid columns.
	std::vector<std::uint8_t> m_edges; //!< Direction bitset per cell, row major.
	std::vector<bool> m_recorded;      //!< Cells owned by the player.
	std::size_t m_cellCount{0};        //!< Number of recorded cells.
};

} // namespace connectk
