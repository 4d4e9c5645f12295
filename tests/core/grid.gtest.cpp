#include "core/grid.hpp"

#include <gtest/gtest.h>

namespace connectk::gtest {

// Tokens stack bottom up without gaps.
TEST(Grid, DropFillsColumnBottomUp) {
	Grid grid(4u, 3u);

	for (Id i = 0; i != 4; ++i) {
		Coord placed{};
		EXPECT_EQ(grid.drop(1u, i % 2u, placed), MoveError::None);
		EXPECT_EQ(placed, (Coord{3u - i, 1u}));
		EXPECT_EQ(grid.columnHeight(1u), i + 1u);
	}

	for (Id row = 0; row != 4; ++row) {
		EXPECT_EQ(grid.ownerAt({row, 1u}), std::optional<PlayerIndex>{(3u - row) % 2u});
		EXPECT_TRUE(grid.isEmpty({row, 0u}));
		EXPECT_TRUE(grid.isEmpty({row, 2u}));
	}
	EXPECT_EQ(grid.tokenCount(), 4u);
}

TEST(Grid, DropIntoFullColumn) {
	Grid grid(2u, 2u);
	Coord placed{};
	ASSERT_EQ(grid.drop(0u, 0u, placed), MoveError::None);
	ASSERT_EQ(grid.drop(0u, 1u, placed), MoveError::None);
	EXPECT_TRUE(grid.isColumnFull(0u));

	Coord untouched{7u, 7u};
	EXPECT_EQ(grid.drop(0u, 0u, untouched), MoveError::ColumnFull);
	EXPECT_EQ(untouched, (Coord{7u, 7u}));
	EXPECT_EQ(grid.tokenCount(), 2u);
	EXPECT_EQ(grid.ownerAt({0u, 0u}), std::optional<PlayerIndex>{1u});
}

TEST(Grid, DropIntoInvalidColumn) {
	Grid grid(3u, 3u);
	Coord placed{};
	EXPECT_EQ(grid.drop(3u, 0u, placed), MoveError::InvalidColumn);
	EXPECT_EQ(grid.drop(100u, 1u, placed), MoveError::InvalidColumn);
	EXPECT_EQ(grid.tokenCount(), 0u);
	for (Id col = 0; col != 3; ++col) {
		EXPECT_EQ(grid.columnHeight(col), 0u);
	}
}

TEST(Grid, FullGrid) {
	Grid grid(2u, 3u);
	EXPECT_FALSE(grid.isFull());

	Coord placed{};
	for (Id col = 0; col != 3; ++col) {
		EXPECT_EQ(grid.drop(col, 0u, placed), MoveError::None);
		EXPECT_EQ(grid.drop(col, 1u, placed), MoveError::None);
	}
	EXPECT_TRUE(grid.isFull());
	EXPECT_EQ(grid.tokenCount(), 6u);
}

TEST(Grid, Contains) {
	Grid grid(6u, 7u);
	EXPECT_TRUE(grid.contains({0u, 0u}));
	EXPECT_TRUE(grid.contains({5u, 6u}));
	EXPECT_FALSE(grid.contains({6u, 0u}));
	EXPECT_FALSE(grid.contains({0u, 7u}));
}

} // namespace connectk::gtest
