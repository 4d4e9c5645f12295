#include "core/grid.hpp"

#include <cassert>

namespace connectk {

Grid::Grid(const std::size_t rows, const std::size_t columns)
    : m_rows(rows), m_columns(columns), m_cells(rows * columns, std::nullopt), m_heights(columns, 0u) {
	assert(rows > 0 && columns > 0); // GameConfig validates dimensions.
}

std::size_t Grid::rows() const {
	return m_rows;
}

std::size_t Grid::columns() const {
	return m_columns;
}

MoveError Grid::drop(const Id column, const PlayerIndex player, Coord& outCoord) {
	assert(player == 0u || player == 1u);

	if (column >= m_columns) {
		return MoveError::InvalidColumn;
	}
	if (isColumnFull(column)) {
		return MoveError::ColumnFull;
	}

	const auto row = static_cast<Id>(m_rows - 1 - m_heights[column]);
	assert(isEmpty({row, column}));

	m_cells[row * m_columns + column] = player;
	++m_heights[column];
	++m_tokenCount;

	outCoord = {row, column};
	return MoveError::None;
}

std::optional<PlayerIndex> Grid::ownerAt(const Coord c) const {
	assert(contains(c)); // Callers check bounds.
	return m_cells[c.row * m_columns + c.col];
}

bool Grid::isEmpty(const Coord c) const {
	return !ownerAt(c).has_value();
}

bool Grid::contains(const Coord c) const {
	return c.row < m_rows && c.col < m_columns;
}

std::size_t Grid::columnHeight(const Id column) const {
	assert(column < m_columns);
	return m_heights[column];
}

bool Grid::isColumnFull(const Id column) const {
	return columnHeight(column) == m_rows;
}

bool Grid::isFull() const {
	return m_tokenCount == m_rows * m_columns;
}

std::size_t Grid::tokenCount() const {
	return m_tokenCount;
}

} // namespace connectk
