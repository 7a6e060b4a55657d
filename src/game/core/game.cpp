#include "core/game.hpp"

#include "Logging.hpp"
#include "core/revealEngine.hpp"

#include <cassert>
#include <format>

namespace mines {

static constexpr char LOG_NEW_GAME[]   = "[Game] New game {}.";
static constexpr char LOG_PLACED[]     = "[Game] Placed {} mines. Safe start at ({}, {}).";
static constexpr char LOG_REJECTED[]   = "[Game] Rejected action at ({}, {}): {}.";
static constexpr char LOG_LOST[]       = "[Game] Mine hit at ({}, {}) after {} ms.";
static constexpr char LOG_WON[]        = "[Game] Board cleared after {} ms.";
static constexpr char LOG_NEW_RECORD[] = "[Game] New best time for {}: {} ms.";

//! Reason an action cannot be applied to the game at all.
enum class Rejection { None, GameOver, OutOfBounds, Paused };

static Rejection checkAction(const Game& game, const Coord c) {
	if (isGameOver(game.status()))
		return Rejection::GameOver;
	if (!game.board().isInBounds(c))
		return Rejection::OutOfBounds;
	if (game.isPaused())
		return Rejection::Paused;
	return Rejection::None;
}

static const char* toString(const Rejection rejection) {
	switch (rejection) {
	case Rejection::GameOver:
		return "game over";
	case Rejection::OutOfBounds:
		return "out of bounds";
	case Rejection::Paused:
		return "paused";
	case Rejection::None:
		break;
	}
	return "none";
}

static RevealOutcome toRevealOutcome(const Rejection rejection) {
	switch (rejection) {
	case Rejection::GameOver:
		return RevealOutcome::GameOver;
	case Rejection::OutOfBounds:
		return RevealOutcome::OutOfBounds;
	case Rejection::Paused:
		return RevealOutcome::Paused;
	case Rejection::None:
		break;
	}
	assert(false);
	return RevealOutcome::GameOver;
}

static FlagOutcome toFlagOutcome(const Rejection rejection) {
	switch (rejection) {
	case Rejection::GameOver:
		return FlagOutcome::GameOver;
	case Rejection::OutOfBounds:
		return FlagOutcome::OutOfBounds;
	case Rejection::Paused:
		return FlagOutcome::Paused;
	case Rejection::None:
		break;
	}
	assert(false);
	return FlagOutcome::GameOver;
}

Game::Game(const Difficulty& difficulty) : Game(difficulty, std::random_device{}()) {
}

Game::Game(const Difficulty& difficulty, const std::uint64_t seed) : m_difficulty(difficulty), m_board(difficulty), m_rng(seed) {
	Logger().Log(Logging::LogLevel::Info, std::format(LOG_NEW_GAME, toString(m_difficulty)));
}

std::optional<Game> Game::withLayout(const Difficulty& difficulty, const std::vector<Coord>& mines) {
	Game game(difficulty, 0u);
	if (!game.m_board.placeMines(mines)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Game] Invalid mine layout of {} mines for {}.", mines.size(), toString(difficulty)));
		return {};
	}
	return game;
}

RevealResult Game::reveal(const Coord c) {
	if (const auto rejection = checkAction(*this, c); rejection != Rejection::None) {
		Logger().Log(Logging::LogLevel::Warning, std::format(LOG_REJECTED, c.x, c.y, toString(rejection)));
		return {.outcome = toRevealOutcome(rejection), .revealed = {}, .status = m_status};
	}

	// Flags protect cells. Must not trigger mine placement either.
	if (m_board.at(c).isFlagged()) {
		return {.outcome = RevealOutcome::Flagged, .revealed = {}, .status = m_status};
	}

	if (!m_board.minesPlaced()) {
		[[maybe_unused]] const bool placed = m_board.placeMines(c, m_rng);
		assert(placed);
		Logger().Log(Logging::LogLevel::Debug, std::format(LOG_PLACED, m_board.mineCount(), c.x, c.y));
	}
	start();

	RevealResult result{.outcome = RevealOutcome::Safe, .revealed = {}, .status = m_status};
	result.outcome = floodReveal(m_board, c, result.revealed, result.detonated);
	conclude(result);
	return result;
}

RevealResult Game::chord(const Coord c) {
	if (const auto rejection = checkAction(*this, c); rejection != Rejection::None) {
		Logger().Log(Logging::LogLevel::Warning, std::format(LOG_REJECTED, c.x, c.y, toString(rejection)));
		return {.outcome = toRevealOutcome(rejection), .revealed = {}, .status = m_status};
	}

	// Nothing revealed yet, so there is no number to chord on.
	if (!m_board.minesPlaced()) {
		return {.outcome = RevealOutcome::NotSatisfied, .revealed = {}, .status = m_status};
	}

	RevealResult result{.outcome = RevealOutcome::NotSatisfied, .revealed = {}, .status = m_status};
	result.outcome = chordReveal(m_board, c, result.revealed, result.detonated);
	conclude(result);
	return result;
}

FlagResult Game::toggleFlag(const Coord c) {
	if (const auto rejection = checkAction(*this, c); rejection != Rejection::None) {
		Logger().Log(Logging::LogLevel::Warning, std::format(LOG_REJECTED, c.x, c.y, toString(rejection)));
		return {.outcome = toFlagOutcome(rejection), .status = m_status, .flagsPlaced = m_board.flagCount()};
	}

	FlagOutcome outcome = FlagOutcome::Rejected;
	switch (m_board.toggleFlag(c)) {
	case Cell::FlagOutcome::Flagged:
		outcome = FlagOutcome::Flagged;
		break;
	case Cell::FlagOutcome::Unflagged:
		outcome = FlagOutcome::Unflagged;
		break;
	case Cell::FlagOutcome::Rejected:
		outcome = FlagOutcome::Rejected;
		break;
	}

	if (isApplied(outcome)) {
		start();
		m_eventHub.signal(GS_FlagChange);
	}
	return {.outcome = outcome, .status = m_status, .flagsPlaced = m_board.flagCount()};
}

void Game::tick(const Duration delta) {
	if (m_status != GameStatus::Playing || m_paused || delta <= Duration::zero())
		return;

	// Saturate instead of overflowing.
	m_elapsed = delta > Duration::max() - m_elapsed ? Duration::max() : m_elapsed + delta;
}

bool Game::pause() {
	if (m_status != GameStatus::Playing || m_paused)
		return false;
	m_paused = true;
	return true;
}

bool Game::resume() {
	if (!m_paused)
		return false;
	m_paused = false;
	return true;
}

void Game::setScoreStore(const IScoreStore* store) {
	m_scoreStore = store;
}

GameStatus Game::status() const {
	return m_status;
}

bool Game::isPaused() const {
	return m_paused;
}

Duration Game::elapsed() const {
	return m_elapsed;
}

std::size_t Game::flagsPlaced() const {
	return m_board.flagCount();
}

long long Game::flagsRemaining() const {
	return static_cast<long long>(m_board.mineCount()) - static_cast<long long>(m_board.flagCount());
}

const Difficulty& Game::difficulty() const {
	return m_difficulty;
}

const Board& Game::board() const {
	return m_board;
}

std::optional<Coord> Game::detonated() const {
	return m_detonated;
}

std::optional<ScoreRecord> Game::scoreRecord() const {
	return m_record;
}

BoardSnapshot Game::snapshot() const {
	const bool over = isGameOver(m_status);

	BoardSnapshot snapshot{.width = m_board.width(), .height = m_board.height(), .cells = {}};
	snapshot.cells.reserve(m_board.cellCount());
	for (unsigned y = 0; y < m_board.height(); ++y) {
		for (unsigned x = 0; x < m_board.width(); ++x) {
			const Coord c{x, y};
			const auto& cell = m_board.at(c);

			CellView view{.state = cell.state()};
			if (cell.isRevealed() || over) {
				view.mine          = cell.isMine();
				view.adjacentMines = cell.isMine() ? 0u : cell.adjacentMines();
			}
			view.detonated = m_detonated && *m_detonated == c;
			snapshot.cells.push_back(view);
		}
	}
	return snapshot;
}

void Game::subscribeSignals(IGameSignalListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void Game::unsubscribeSignals(IGameSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}

void Game::start() {
	if (m_status != GameStatus::NotStarted)
		return;

	m_status = GameStatus::Playing;
	m_eventHub.signal(GS_StatusChange);
}

void Game::finish(const GameStatus status) {
	assert(status == GameStatus::Won || status == GameStatus::Lost);
	assert(m_status == GameStatus::Playing);

	m_status = status;
	m_paused = false;
	m_eventHub.signal(GS_StatusChange);
}

void Game::conclude(RevealResult& result) {
	if (result.outcome == RevealOutcome::Mine) {
		assert(result.detonated);
		m_detonated = result.detonated;
		Logger().Log(Logging::LogLevel::Info, std::format(LOG_LOST, m_detonated->x, m_detonated->y, m_elapsed.count()));

		// Show the full layout. Mines are revealed without propagation.
		const auto mines = m_board.revealMines();
		result.revealed.insert(result.revealed.end(), mines.begin(), mines.end());

		m_eventHub.signal(GS_BoardChange);
		finish(GameStatus::Lost);
	} else if (result.outcome == RevealOutcome::Safe) {
		m_eventHub.signal(GS_BoardChange);

		if (m_board.isCleared()) {
			Logger().Log(Logging::LogLevel::Info, std::format(LOG_WON, m_elapsed.count()));
			m_record = proposeRecord();
			if (m_record) {
				Logger().Log(Logging::LogLevel::Info, std::format(LOG_NEW_RECORD, toString(m_record->level), m_record->time.count()));
			}
			result.record = m_record;
			finish(GameStatus::Won);
		}
	}

	result.status = m_status;
}

std::optional<ScoreRecord> Game::proposeRecord() const {
	const auto level = m_difficulty.level();
	if (!level)
		return {}; // Custom games are not ranked.

	if (m_scoreStore) {
		const auto best = m_scoreStore->bestTime(*level);
		if (best && *best <= m_elapsed)
			return {};
	}
	return ScoreRecord{.level = *level, .time = m_elapsed};
}

} // namespace mines
