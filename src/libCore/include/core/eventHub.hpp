#pragma once

#include "core/IGameSignalListener.hpp"
#include "core/IGameStateListener.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace connectk {

//! Forwards game signals and deltas to subscribed listeners.
//! \note Listeners run synchronously on the game loop thread and must outlive their subscription.
class EventHub {
	struct SignalListenerEntry {
		IGameSignalListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;           //!< What signals the listener cares about.
	};

public:
	void subscribe(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IGameSignalListener* listener);

	void subscribe(IGameStateListener* listener);
	void unsubscribe(IGameStateListener* listener);

	void signal(GameSignal signal);           //!< Notify listeners whose mask contains signal.
	void signalDelta(const GameDelta& delta); //!< Notify all state listeners of an accepted move.

private:
	std::mutex m_listenerMutex;
	std::vector<SignalListenerEntry> m_signalListeners;
	std::vector<IGameStateListener*> m_stateListeners;
};

} // namespace connectk
