#include "core/game.hpp"

#include "Logging.hpp"

#include <format>
#include <utility>

namespace connectk {

Game::Game(const GameConfig& config, PlayerInfo first, PlayerInfo second) : m_state{config, std::move(first), std::move(second)} {
}

void Game::pushEvent(GameEvent event) {
	m_eventQueue.Push(event);
}

void Game::run() {
	// Blocking loop: intended to live on its own thread.
	m_loopActive = true;

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, "[Game] Event loop started.");

	while (m_loopActive) {
		try {
			const auto event = m_eventQueue.Pop();
			std::visit([&](auto&& ev) { handleEvent(ev); }, event);
		} catch (const QueueReleasedError&) {
			m_loopActive = false;
		}
	}

	logger.Log(Logging::LogLevel::Info, "[Game] Event loop stopped.");
	logger.Flush();
}

bool Game::isActive() const {
	return m_loopActive;
}

GameState Game::state() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_state;
}

void Game::handleEvent(const DropEvent& event) {
	MoveResult result{};
	PlayerIndex nextPlayer{};
	std::size_t moveId{};
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);

		if (event.player != m_state.activePlayer()) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[Game] Ignoring drop of player {}: not their turn.", event.player));
			result = {.accepted = false, .placedAt = std::nullopt, .outcome = m_state.outcome(), .error = MoveError::WrongPlayer};
		} else {
			result = m_state.submitMove(event.column);
		}
		nextPlayer = m_state.activePlayer();
		moveId     = m_state.placedTokens();
	}

	if (!result.accepted) {
		m_eventHub.signal(GS_MoveRejected);
		return;
	}

	m_eventHub.signal(GS_BoardChange);
	m_eventHub.signal(result.outcome.isTerminal() ? GS_StateChange : GS_PlayerChange);
	m_eventHub.signalDelta(GameDelta{
	        .moveId     = moveId,
	        .player     = event.player,
	        .coord      = *result.placedAt,
	        .nextPlayer = nextPlayer,
	        .outcome    = result.outcome,
	});
}

void Game::handleEvent(const ShutdownEvent&) {
	m_loopActive = false;
	m_eventQueue.Release();
}

void Game::subscribeSignals(IGameSignalListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void Game::unsubscribeSignals(IGameSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}

void Game::subscribeState(IGameStateListener* listener) {
	m_eventHub.subscribe(listener);
}

void Game::unsubscribeState(IGameStateListener* listener) {
	m_eventHub.unsubscribe(listener);
}

} // namespace connectk
