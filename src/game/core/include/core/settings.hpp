#pragma once

#include "core/highScores.hpp"
#include "model/difficulty.hpp"

#include <optional>
#include <string>

namespace mines {

//! Engine state worth keeping between application runs.
//! Stored by the persistence side. The engine only converts it from and to JSON.
struct GameSettings {
	Difficulty difficulty{Difficulty::beginner()}; //!< Difficulty of the next game.
	HighScoreTable highScores{};                   //!< Best times per preset level.
};

// Serialize settings to a JSON document.
std::string toJson(const GameSettings& settings);

// Parse a JSON document into settings. Returns empty on invalid input.
// High scores are sorted and cut to the table size on load.
std::optional<GameSettings> settingsFromJson(const std::string& message);

} // namespace mines
