#pragma once

#include "core/SafeQueue.hpp"
#include "core/eventHub.hpp"
#include "core/gameEvent.hpp"
#include "core/gameState.hpp"

#include <atomic>
#include <mutex>

namespace connectk {

using EventQueue = SafeQueue<GameEvent>;

//! Event loop around a game state.
//! The loop thread is the only writer. External code pushes events, listens and reads copies of the state.
class Game {
public:
	//! Setup a game without starting the event loop. Throws InvalidConfigurationError on bad input.
	Game(const GameConfig& config, PlayerInfo first, PlayerInfo second);

	void run();                      //!< Run the event loop until a ShutdownEvent is handled (blocking).
	void pushEvent(GameEvent event); //!< Push an event to the event queue.
	bool isActive() const;           //!< Return if the event loop is running.

	GameState state() const; //!< Consistent copy of the current game state.

public:
	void subscribeSignals(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribeSignals(IGameSignalListener* listener);
	void subscribeState(IGameStateListener* listener);
	void unsubscribeState(IGameStateListener* listener);

private:
	void handleEvent(const DropEvent& event);
	void handleEvent(const ShutdownEvent& event);

private:
	std::atomic<bool> m_loopActive{false};

	mutable std::mutex m_stateMutex; //!< Guards reads of the state from other threads.
	GameState m_state;
	EventQueue m_eventQueue; //!< Queue of internal game events we have to handle.
	EventHub m_eventHub;     //!< Hub to signal updates of the game state to external components.
};

} // namespace connectk
