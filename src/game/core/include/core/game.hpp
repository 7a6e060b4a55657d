#pragma once

#include "core/IScoreStore.hpp"
#include "core/eventHub.hpp"
#include "core/gameEvent.hpp"
#include "core/snapshot.hpp"
#include "model/board.hpp"
#include "model/difficulty.hpp"
#include "model/gameStatus.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace mines {

//! One game of minesweeper.
//! Owns the board and is the only component mutating it. Replace the whole game for a new round or difficulty change.
//! \note Not thread safe. The caller serializes actions.
class Game {
public:
	//! New game with mines placed on first reveal from a random seed.
	explicit Game(const Difficulty& difficulty);
	Game(const Difficulty& difficulty, std::uint64_t seed);

	//! New game with a fixed mine layout. No first click protection.
	//! \returns Empty if the layout does not match the difficulty (count, duplicates, bounds).
	static std::optional<Game> withLayout(const Difficulty& difficulty, const std::vector<Coord>& mines);

	RevealResult reveal(Coord c);   //!< Reveal a cell. First reveal places the mines and starts the game.
	RevealResult chord(Coord c);    //!< Reveal the neighbours of a satisfied number.
	FlagResult toggleFlag(Coord c); //!< Flag or unflag a hidden cell. Starts the game without placing mines.

	void tick(Duration delta); //!< Advance the game timer. Ignored unless playing and not paused.
	bool pause();              //!< Pause a running game. False if not playing or already paused.
	bool resume();             //!< Resume a paused game. False if not paused.

	void setScoreStore(const IScoreStore* store); //!< Best times to compare a won game against. May be null.

	GameStatus status() const;
	bool isPaused() const;
	Duration elapsed() const;
	std::size_t flagsPlaced() const;
	long long flagsRemaining() const; //!< Mines minus flags. Negative if over flagged.
	const Difficulty& difficulty() const;
	const Board& board() const;
	std::optional<Coord> detonated() const;          //!< Mine that lost the game.
	std::optional<ScoreRecord> scoreRecord() const; //!< Best time proposal of a won game.

	BoardSnapshot snapshot() const; //!< Get board data for rendering.

public:
	void subscribeSignals(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribeSignals(IGameSignalListener* listener);

private:
	void start();
	void finish(GameStatus status);
	void conclude(RevealResult& result);
	std::optional<ScoreRecord> proposeRecord() const;

private:
	Difficulty m_difficulty;
	Board m_board;
	GameStatus m_status{GameStatus::NotStarted};
	bool m_paused{false};
	Duration m_elapsed{0};

	std::mt19937_64 m_rng; //!< Random source for mine placement.
	std::optional<Coord> m_detonated{};
	std::optional<ScoreRecord> m_record{};
	const IScoreStore* m_scoreStore{nullptr};

	EventHub m_eventHub; //!< Hub to signal updates of the game state to external components.
};

} // namespace mines
