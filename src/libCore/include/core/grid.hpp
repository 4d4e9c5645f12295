#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace connectk {

//! Storage of the cells of a game and gravity placement of tokens.
//! \note Row 0 is the top row. Occupied cells of a column always form a block starting at the bottom row.
class Grid {
public:
	Grid(std::size_t rows, std::size_t columns);

	std::size_t rows() const;
	std::size_t columns() const;

	//! Drop a token of player into column. It lands in the lowest empty cell.
	//! \param [out] outCoord Cell the token landed in. Only written on success.
	//! \returns MoveError::None on success. The grid is unchanged on failure.
	MoveError drop(Id column, PlayerIndex player, Coord& outCoord);

	std::optional<PlayerIndex> ownerAt(Coord c) const; //!< Owner of cell (row, col) \in [0, rows-1] x [0, columns-1]
	bool isEmpty(Coord c) const;                       //!< Returns whether a cell is free.
	bool contains(Coord c) const;                      //!< Returns whether the coordinate lies within the grid.

	std::size_t columnHeight(Id column) const; //!< Number of tokens in a column.
	bool isColumnFull(Id column) const;        //!< Returns whether no token fits into the column.
	bool isFull() const;                       //!< Returns whether every cell is occupied.
	std::size_t tokenCount() const;            //!< Number of tokens on the grid.

private:
	std::size_t m_rows;                              //!< Number of rows.
	std::size_t m_columns;                           //!< Number of columns.
	std::vector<std::optional<PlayerIndex>> m_cells; //!< Cell owners, row major.
	std::vector<std::size_t> m_heights;              //!< Occupied cells per column counted from the bottom.
	std::size_t m_tokenCount{0};                     //!< Total tokens placed.
};

} // namespace connectk
