#include "core/gameState.hpp"

#include "Logging.hpp"

#include <cassert>
#include <format>
#include <utility>

namespace connectk {

//! Validate before any member depending on the dimensions is constructed.
static const GameConfig& validated(const GameConfig& config) {
	config.validate();
	return config;
}

GameState::GameState(const GameConfig& config, PlayerInfo first, PlayerInfo second)
    : m_config(validated(config)), m_grid(static_cast<std::size_t>(config.rows), static_cast<std::size_t>(config.columns)),
      m_players{Player{std::move(first), m_grid.rows(), m_grid.columns()}, Player{std::move(second), m_grid.rows(), m_grid.columns()}} {
}

MoveResult GameState::submitMove(const int column) {
	if (m_outcome.isTerminal()) {
		return reject(column, MoveError::GameOver);
	}
	if (column < 0) {
		return reject(column, MoveError::InvalidColumn);
	}

	Coord placed{};
	const auto error = m_grid.drop(static_cast<Id>(column), m_activePlayer, placed);
	if (error != MoveError::None) {
		return reject(column, error);
	}

	auto& player = m_players[m_activePlayer];
	player.tracker().record(placed);
	++m_placedTokens;

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Debug, std::format("[GameState] Player '{}' dropped into ({}, {}).", player.name(), placed.row, placed.col));

	if (player.tracker().hasWinningRun(placed, static_cast<std::size_t>(m_config.requiredRunLength))) {
		m_outcome = {GameStatus::Won, m_activePlayer};
		logger.Log(Logging::LogLevel::Info, std::format("[GameState] Player '{}' wins after {} moves.", player.name(), m_placedTokens));
	} else if (m_placedTokens == m_grid.rows() * m_grid.columns()) {
		m_outcome = {GameStatus::Tied, std::nullopt};
		logger.Log(Logging::LogLevel::Info, "[GameState] Grid full. Game tied.");
	} else {
		m_activePlayer = opponent(m_activePlayer);
	}

	assert(m_placedTokens == m_grid.tokenCount());
	return {.accepted = true, .placedAt = placed, .outcome = m_outcome, .error = MoveError::None};
}

MoveResult GameState::reject(const int column, const MoveError error) const {
	Logger().Log(Logging::LogLevel::Warning, std::format("[GameState] Rejecting move in column {}: {}.", column, toString(error)));
	return {.accepted = false, .placedAt = std::nullopt, .outcome = m_outcome, .error = error};
}

Outcome GameState::outcome() const {
	return m_outcome;
}

PlayerIndex GameState::activePlayer() const {
	return m_activePlayer;
}

std::size_t GameState::placedTokens() const {
	return m_placedTokens;
}

std::optional<PlayerIndex> GameState::cellOwner(const int row, const int column) const {
	if (row < 0 || column < 0) {
		return std::nullopt;
	}
	const Coord c{static_cast<Id>(row), static_cast<Id>(column)};
	if (!m_grid.contains(c)) {
		return std::nullopt;
	}
	return m_grid.ownerAt(c);
}

const Player& GameState::player(const PlayerIndex index) const {
	assert(index < m_players.size());
	return m_players[index];
}

const Grid& GameState::grid() const {
	return m_grid;
}

const GameConfig& GameState::config() const {
	return m_config;
}

} // namespace connectk
