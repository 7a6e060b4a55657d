#pragma once

#include "core/gameEvent.hpp"
#include "model/difficulty.hpp"

#include <optional>

namespace mines {

//! Read access to persisted best times. Implemented by the persistence side.
class IScoreStore {
public:
	virtual ~IScoreStore()                                                 = default;
	virtual std::optional<Duration> bestTime(DifficultyLevel level) const = 0; //!< Stored best time or empty if none.
};

} // namespace mines
