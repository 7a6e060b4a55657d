#include "core/eventHub.hpp"

#include <algorithm>
#include <cassert>

namespace mines {

void EventHub::subscribe(IGameSignalListener* listener, uint64_t signalMask) {
	assert(listener);

	// Subscribing again replaces the mask.
	const auto it = std::find_if(m_signalListeners.begin(), m_signalListeners.end(), [&](const SignalListenerEntry& e) { return e.listener == listener; });
	if (it != m_signalListeners.end()) {
		it->signalMask = signalMask;
		return;
	}
	m_signalListeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IGameSignalListener* listener) {
	if (m_dispatchDepth != 0u) {
		// Entries must keep their index while signal iterates. Removed after dispatch.
		for (auto& entry: m_signalListeners) {
			if (entry.listener == listener) {
				entry.listener = nullptr;
			}
		}
		return;
	}

	m_signalListeners.erase(
	        std::remove_if(m_signalListeners.begin(), m_signalListeners.end(), [&](const SignalListenerEntry& e) { return e.listener == listener; }),
	        m_signalListeners.end());
}

void EventHub::signal(GameSignal signal) {
	// Listeners subscribed during dispatch get the next signal.
	const auto count = m_signalListeners.size();

	++m_dispatchDepth;
	for (std::size_t i = 0; i < count; ++i) {
		const auto entry = m_signalListeners[i];
		if (entry.listener && (entry.signalMask & signal)) {
			entry.listener->onGameEvent(signal);
		}
	}
	--m_dispatchDepth;

	if (m_dispatchDepth == 0u) {
		m_signalListeners.erase(
		        std::remove_if(m_signalListeners.begin(), m_signalListeners.end(), [](const SignalListenerEntry& e) { return e.listener == nullptr; }),
		        m_signalListeners.end());
	}
}

} // namespace mines
