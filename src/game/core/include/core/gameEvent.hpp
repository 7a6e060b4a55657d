#pragma once

#include "model/coordinate.hpp"
#include "model/difficulty.hpp"
#include "model/gameStatus.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace mines {

using Duration = std::chrono::milliseconds;

//! Types of signals.
enum GameSignal : std::uint64_t {
	GS_None         = 0,
	GS_BoardChange  = 1 << 0, //!< Cells were revealed.
	GS_FlagChange   = 1 << 1, //!< A flag was placed or removed.
	GS_StatusChange = 1 << 2, //!< Game status changed. Started, won or lost.
};

//! Result type of reveal and chord actions.
enum class RevealOutcome {
	Safe,            //!< One or more safe cells revealed.
	Mine,            //!< A mine was revealed. Game lost.
	AlreadyRevealed, //!< Target already revealed. Nothing changed.
	Flagged,         //!< Target is flagged. Nothing changed.
	NotSatisfied,    //!< Chord target is not a revealed number with matching flags. Nothing changed.
	OutOfBounds,     //!< Coordinate not on the board.
	Paused,          //!< Game is paused.
	GameOver         //!< Game already won or lost.
};

//! Result type of flag actions.
enum class FlagOutcome {
	Flagged,     //!< Flag placed.
	Unflagged,   //!< Flag removed.
	Rejected,    //!< Cell already revealed.
	OutOfBounds, //!< Coordinate not on the board.
	Paused,      //!< Game is paused.
	GameOver     //!< Game already won or lost.
};

//! A best time proposal for a preset difficulty.
struct ScoreRecord {
	DifficultyLevel level; //!< Preset the game was played on.
	Duration time;         //!< Time needed to clear the board.

	bool operator==(const ScoreRecord&) const = default;
};

struct RevealResult {
	RevealOutcome outcome;
	std::vector<Coord> revealed;       //!< Newly revealed cells, in reveal order. Includes auto revealed mines on loss.
	GameStatus status;                 //!< Game status after the action.
	std::optional<Coord> detonated{};    //!< Set if the action hit a mine.
	std::optional<ScoreRecord> record{}; //!< Set if the action won the game with a new best time.
};

struct FlagResult {
	FlagOutcome outcome;
	GameStatus status;       //!< Game status after the action.
	std::size_t flagsPlaced; //!< Number of flags on the board after the action.
};

//! True if the outcome changed the board.
inline constexpr bool isApplied(RevealOutcome outcome) {
	return outcome == RevealOutcome::Safe || outcome == RevealOutcome::Mine;
}

inline constexpr bool isApplied(FlagOutcome outcome) {
	return outcome == FlagOutcome::Flagged || outcome == FlagOutcome::Unflagged;
}

} // namespace mines
