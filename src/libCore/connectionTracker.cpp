#include "core/connectionTracker.hpp"

#include <cassert>

namespace connectk {

// Offsets indexed by Direction.
static constexpr std::array<int, 8> kDRow{0, 0, 1, -1, -1, 1, 1, -1};
static constexpr std::array<int, 8> kDCol{1, -1, 0, 0, 1, -1, 1, -1};

static constexpr std::uint8_t bit(const Direction direction) {
	return static_cast<std::uint8_t>(1u << static_cast<unsigned>(direction));
}

//! Coordinate one step from c in direction. Only valid if the neighbour lies inside the grid.
static Coord step(const Coord c, const Direction direction) {
	const auto d = static_cast<std::size_t>(direction);
	return {static_cast<Id>(static_cast<int>(c.row) + kDRow[d]), static_cast<Id>(static_cast<int>(c.col) + kDCol[d])};
}

ConnectionTracker::ConnectionTracker(const std::size_t rows, const std::size_t columns)
    : m_rows(rows), m_columns(columns), m_edges(rows * columns, 0u), m_recorded(rows * columns, false) {
}

std::size_t ConnectionTracker::index(const Coord c) const {
	assert(c.row < m_rows && c.col < m_columns);
	return c.row * m_columns + c.col;
}

std::vector<Coord> ConnectionTracker::record(const Coord c) {
	assert(!isRecorded(c)); // Tokens are never placed twice.

	const auto id  = index(c);
	m_recorded[id] = true;
	++m_cellCount;

	std::vector<Coord> connected;
	for (std::size_t d = 0; d < kDRow.size(); ++d) {
		const int nr = static_cast<int>(c.row) + kDRow[d];
		const int nc = static_cast<int>(c.col) + kDCol[d];
		if (nr < 0 || nc < 0 || nr >= static_cast<int>(m_rows) || nc >= static_cast<int>(m_columns))
			continue;

		const Coord neighbour{static_cast<Id>(nr), static_cast<Id>(nc)};
		const auto nid = index(neighbour);
		if (!m_recorded[nid])
			continue;

		const auto direction = static_cast<Direction>(d);
		m_edges[id] |= bit(direction);
		m_edges[nid] |= bit(opposite(direction));
		connected.push_back(neighbour);
	}

	return connected;
}

std::size_t ConnectionTracker::runLength(const Coord c, const Axis axis) const {
	assert(isRecorded(c));

	const auto first = static_cast<Direction>(2u * static_cast<unsigned>(axis));
	const std::array<Direction, 2> directions{first, opposite(first)};

	std::size_t length = 1;
	for (const auto direction: directions) {
		// Only edges with exactly this offset are followed. Other axes touching the same cells are ignored.
		auto current = c;
		while (m_edges[index(current)] & bit(direction)) {
			current = step(current, direction);
			++length;
		}
	}
	return length;
}

bool ConnectionTracker::hasWinningRun(const Coord c, const std::size_t minRunLength) const {
	for (const auto axis: kAxes) {
		if (runLength(c, axis) >= minRunLength) {
			return true;
		}
	}
	return false;
}

bool ConnectionTracker::isRecorded(const Coord c) const {
	return m_recorded[index(c)];
}

bool ConnectionTracker::hasEdge(const Coord c, const Direction direction) const {
	return m_edges[index(c)] & bit(direction);
}

std::size_t ConnectionTracker::cellCount() const {
	return m_cellCount;
}

} // namespace connectk
