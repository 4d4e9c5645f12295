#include "core/gameState.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <string>

namespace connectk::gtest {

static GameState makeGame(int rows, int columns, int runLength) {
	return GameState{GameConfig{rows, columns, runLength}, PlayerInfo{"A", {255, 0, 0}}, PlayerInfo{"B", {2, 145, 247}}};
}

//! Submit all moves, expecting every one to be accepted.
static MoveResult playAll(GameState& state, std::initializer_list<int> columns) {
	MoveResult last{};
	for (const auto column: columns) {
		last = state.submitMove(column);
		EXPECT_TRUE(last.accepted) << "column " << column;
	}
	return last;
}

TEST(GameState, InitialState) {
	const auto state = makeGame(6, 7, 4);
	EXPECT_EQ(state.outcome().status, GameStatus::InProgress);
	EXPECT_FALSE(state.outcome().winner.has_value());
	EXPECT_EQ(state.activePlayer(), 0u);
	EXPECT_EQ(state.placedTokens(), 0u);
	EXPECT_EQ(state.player(0u).name(), "A");
	EXPECT_EQ(state.player(1u).name(), "B");
	for (int row = 0; row != 6; ++row) {
		for (int col = 0; col != 7; ++col) {
			EXPECT_FALSE(state.cellOwner(row, col).has_value());
		}
	}
}

TEST(GameState, DefaultConfig) {
	const GameState state{GameConfig{}, PlayerInfo{"A", {255, 0, 0}}, PlayerInfo{"B", {255, 255, 0}}};
	EXPECT_EQ(state.grid().rows(), 6u);
	EXPECT_EQ(state.grid().columns(), 7u);
	EXPECT_EQ(state.config().requiredRunLength, 4);
}

// Accepted moves alternate players and land at the bottom.
TEST(GameState, MovesAlternate) {
	auto state = makeGame(4, 4, 4);

	auto result = state.submitMove(2);
	EXPECT_TRUE(result.accepted);
	EXPECT_EQ(result.error, MoveError::None);
	ASSERT_TRUE(result.placedAt.has_value());
	EXPECT_EQ(*result.placedAt, (Coord{3u, 2u}));
	EXPECT_EQ(state.activePlayer(), 1u);
	EXPECT_EQ(state.cellOwner(3, 2), std::optional<PlayerIndex>{0u});

	result = state.submitMove(2);
	EXPECT_TRUE(result.accepted);
	EXPECT_EQ(*result.placedAt, (Coord{2u, 2u}));
	EXPECT_EQ(state.activePlayer(), 0u);
	EXPECT_EQ(state.cellOwner(2, 2), std::optional<PlayerIndex>{1u});
	EXPECT_EQ(state.placedTokens(), 2u);
}

TEST(GameState, InvalidColumn) {
	auto state = makeGame(4, 4, 3);
	playAll(state, {0});

	for (const auto column: {4, 5, -1}) {
		const auto result = state.submitMove(column);
		EXPECT_FALSE(result.accepted);
		EXPECT_EQ(result.error, MoveError::InvalidColumn);
		EXPECT_FALSE(result.placedAt.has_value());
		EXPECT_EQ(result.outcome.status, GameStatus::InProgress);
	}
	EXPECT_EQ(state.activePlayer(), 1u);
	EXPECT_EQ(state.placedTokens(), 1u);
	EXPECT_EQ(state.grid().tokenCount(), 1u);
}

TEST(GameState, ColumnFull) {
	auto state = makeGame(2, 3, 3);
	playAll(state, {0, 0});

	const auto result = state.submitMove(0);
	EXPECT_FALSE(result.accepted);
	EXPECT_EQ(result.error, MoveError::ColumnFull);
	EXPECT_EQ(state.activePlayer(), 0u);
	EXPECT_EQ(state.placedTokens(), 2u);
}

// 4x4, run of three: A takes the bottom of columns 0 to 2 while B stacks column 3.
TEST(GameState, HorizontalWin) {
	auto state = makeGame(4, 4, 3);

	const auto result = playAll(state, {0, 3, 1, 3, 2});
	EXPECT_EQ(result.outcome.status, GameStatus::Won);
	EXPECT_EQ(result.outcome.winner, std::optional<PlayerIndex>{0u});
	EXPECT_EQ(*result.placedAt, (Coord{3u, 2u}));
	EXPECT_EQ(state.outcome(), result.outcome);
	EXPECT_EQ(state.placedTokens(), 5u);
}

TEST(GameState, VerticalWin) {
	auto state = makeGame(6, 7, 4);

	auto result = playAll(state, {0, 1, 0, 1, 0, 1});
	EXPECT_EQ(result.outcome.status, GameStatus::InProgress);

	result = state.submitMove(0);
	EXPECT_EQ(result.outcome.status, GameStatus::Won);
	EXPECT_EQ(result.outcome.winner, std::optional<PlayerIndex>{0u});
}

// The second player can win as well.
TEST(GameState, SecondPlayerWins) {
	auto state = makeGame(6, 7, 4);

	const auto result = playAll(state, {0, 1, 0, 2, 0, 3, 6, 4});
	EXPECT_EQ(result.outcome.status, GameStatus::Won);
	EXPECT_EQ(result.outcome.winner, std::optional<PlayerIndex>{1u});
	EXPECT_EQ(state.activePlayer(), 1u);
}

// A builds the rising diagonal (3,0) (2,1) (1,2) (0,3) on top of supporting stacks.
TEST(GameState, DiagonalWin) {
	auto state = makeGame(4, 4, 4);

	auto result = playAll(state, {0, 1, 1, 2, 3, 2, 2, 3, 0, 3});
	EXPECT_EQ(result.outcome.status, GameStatus::InProgress);
	EXPECT_EQ(state.cellOwner(3, 0), std::optional<PlayerIndex>{0u});
	EXPECT_EQ(state.cellOwner(2, 1), std::optional<PlayerIndex>{0u});
	EXPECT_EQ(state.cellOwner(1, 2), std::optional<PlayerIndex>{0u});

	result = state.submitMove(3);
	EXPECT_TRUE(result.accepted);
	EXPECT_EQ(*result.placedAt, (Coord{0u, 3u}));
	EXPECT_EQ(result.outcome.status, GameStatus::Won);
	EXPECT_EQ(result.outcome.winner, std::optional<PlayerIndex>{0u});
	EXPECT_EQ(state.player(0u).tracker().runLength({0u, 3u}, Axis::DiagonalUp), 4u);
}

// Final grid (top row first): A B A / A B B / B A A
TEST(GameState, FullGridIsTie) {
	auto state = makeGame(3, 3, 3);

	auto result = playAll(state, {1, 0, 2, 1, 0, 2, 0, 1});
	EXPECT_EQ(result.outcome.status, GameStatus::InProgress);

	result = state.submitMove(2);
	EXPECT_TRUE(result.accepted);
	EXPECT_EQ(result.outcome.status, GameStatus::Tied);
	EXPECT_FALSE(result.outcome.winner.has_value());
	EXPECT_EQ(state.placedTokens(), 9u);
	EXPECT_TRUE(state.grid().isFull());
}

// Win with the last free cell is a win, not a tie.
TEST(GameState, WinOnLastCell) {
	auto state = makeGame(1, 3, 2);

	auto result = playAll(state, {0, 2});
	result      = state.submitMove(1);
	EXPECT_EQ(result.outcome.status, GameStatus::Won);
	EXPECT_EQ(result.outcome.winner, std::optional<PlayerIndex>{0u});
}

TEST(GameState, TerminalStateRejectsMoves) {
	auto state = makeGame(4, 4, 3);
	playAll(state, {0, 3, 1, 3, 2});
	ASSERT_EQ(state.outcome().status, GameStatus::Won);

	const auto before = state.outcome();
	for (int column = 0; column != 4; ++column) {
		const auto result = state.submitMove(column);
		EXPECT_FALSE(result.accepted);
		EXPECT_EQ(result.error, MoveError::GameOver);
		EXPECT_EQ(result.outcome, before);
	}
	EXPECT_EQ(state.outcome(), before);
	EXPECT_EQ(state.activePlayer(), 0u);
	EXPECT_EQ(state.placedTokens(), 5u);
	EXPECT_EQ(state.grid().tokenCount(), 5u);
}

// Token count follows accepted moves only and never exceeds the grid size.
TEST(GameState, TokenCountMatchesAcceptedMoves) {
	auto state = makeGame(3, 4, 5);

	std::size_t accepted = 0;
	for (int i = 0; i != 40; ++i) {
		if (state.submitMove((i * 7) % 6).accepted) {
			++accepted;
		}
		EXPECT_EQ(state.placedTokens(), accepted);
		EXPECT_EQ(state.grid().tokenCount(), accepted);
		EXPECT_LE(accepted, 12u);
	}
	EXPECT_EQ(accepted, 12u);
	EXPECT_EQ(state.outcome().status, GameStatus::Tied);
}

TEST(GameState, CellOwnerOutsideGrid) {
	const auto state = makeGame(4, 4, 3);
	EXPECT_FALSE(state.cellOwner(-1, 0).has_value());
	EXPECT_FALSE(state.cellOwner(0, -1).has_value());
	EXPECT_FALSE(state.cellOwner(4, 0).has_value());
	EXPECT_FALSE(state.cellOwner(0, 4).has_value());
}

TEST(GameState, InvalidConfiguration) {
	EXPECT_THROW(makeGame(0, 7, 4), InvalidConfigurationError);
	EXPECT_THROW(makeGame(6, -1, 4), InvalidConfigurationError);
	EXPECT_THROW(makeGame(6, 7, 0), InvalidConfigurationError);

	try {
		makeGame(0, 0, -3);
		FAIL() << "Expected InvalidConfigurationError";
	} catch (const InvalidConfigurationError& e) {
		const std::string message = e.what();
		EXPECT_NE(message.find("number of rows"), std::string::npos);
		EXPECT_NE(message.find("number of columns"), std::string::npos);
		EXPECT_NE(message.find("run length"), std::string::npos);
	}
}

TEST(GameConfig, ValidConfiguration) {
	EXPECT_NO_THROW((GameConfig{1, 1, 1}.validate()));
	EXPECT_NO_THROW(GameConfig{}.validate());
	// Unreachable run lengths are allowed, the game can only end in a tie.
	EXPECT_NO_THROW((GameConfig{3, 3, 10}.validate()));
}

} // namespace connectk::gtest
