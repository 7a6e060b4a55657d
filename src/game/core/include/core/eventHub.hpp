#pragma once

#include "core/IGameSignalListener.hpp"

#include <cstddef>
#include <vector>

namespace mines {

//! Allows external components to be updated on internal game events.
//! \note Signals are synchronous and run on the caller thread.
//! \note Listeners may unsubscribe themselves or others from within a callback. Removed listeners are not called again.
class EventHub {
	struct SignalListenerEntry {
		IGameSignalListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;           //!< What events the listener cares about.
	};

public:
	void subscribe(IGameSignalListener* listener, uint64_t signalMask); //!< Subscribing a listener again replaces its mask.
	void unsubscribe(IGameSignalListener* listener);

	void signal(GameSignal signal); //!< Signal a game event.

private:
	std::vector<SignalListenerEntry> m_signalListeners;
	std::size_t m_dispatchDepth{0u}; //!< Nesting level of signal calls. Unsubscribed entries are nulled while dispatching.
};

} // namespace mines
