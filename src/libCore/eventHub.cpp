#include "core/eventHub.hpp"

#include <algorithm>

namespace connectk {

void EventHub::subscribe(IGameSignalListener* listener, uint64_t signalMask) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);
	m_signalListeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IGameSignalListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);
	std::erase_if(m_signalListeners, [&](const SignalListenerEntry& e) { return e.listener == listener; });
}

void EventHub::subscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);
	m_stateListeners.push_back(listener);
}

void EventHub::unsubscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);
	std::erase(m_stateListeners, listener);
}

void EventHub::signal(GameSignal signal) {
	std::vector<IGameSignalListener*> receivers;
	{
		std::lock_guard<std::mutex> lock(m_listenerMutex);
		for (const auto& [listener, signalMask]: m_signalListeners) {
			if (signalMask & signal)
				receivers.push_back(listener);
		}
	}

	// Called without the lock so listeners may unsubscribe from within the callback.
	for (auto* listener: receivers) {
		listener->onGameEvent(signal);
	}
}

void EventHub::signalDelta(const GameDelta& delta) {
	std::vector<IGameStateListener*> receivers;
	{
		std::lock_guard<std::mutex> lock(m_listenerMutex);
		receivers = m_stateListeners;
	}

	for (auto* listener: receivers) {
		listener->onGameDelta(delta);
	}
}

} // namespace connectk
