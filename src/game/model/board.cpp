#include "model/board.hpp"

#include <algorithm>
#include <cassert>

namespace mines {

NeighborRange::Iterator::Iterator(const NeighborRange* range, const unsigned offset) : m_range(range), m_offset(offset) {
	skipInvalid();
}

Coord NeighborRange::Iterator::operator*() const {
	assert(m_range && m_offset < 9u);
	return {m_range->m_center.x + m_offset % 3u - 1u, m_range->m_center.y + m_offset / 3u - 1u};
}

NeighborRange::Iterator& NeighborRange::Iterator::operator++() {
	++m_offset;
	skipInvalid();
	return *this;
}

NeighborRange::Iterator NeighborRange::Iterator::operator++(int) {
	auto copy = *this;
	++*this;
	return copy;
}

bool NeighborRange::Iterator::operator==(const Iterator& other) const {
	return m_offset == other.m_offset;
}

void NeighborRange::Iterator::skipInvalid() {
	if (!m_range) {
		m_offset = 9u;
		return;
	}

	for (; m_offset < 9u; ++m_offset) {
		if (m_offset == 4u)
			continue; // Centre

		// Unsigned wrap on the top/left border makes the coordinate huge, so one check covers both sides.
		const auto x = m_range->m_center.x + m_offset % 3u - 1u;
		const auto y = m_range->m_center.y + m_offset / 3u - 1u;
		if (x < m_range->m_width && y < m_range->m_height)
			return;
	}
}

NeighborRange::NeighborRange(const Coord center, const unsigned width, const unsigned height) : m_center(center), m_width(width), m_height(height) {
}

NeighborRange::Iterator NeighborRange::begin() const {
	return {this, 0u};
}

NeighborRange::Iterator NeighborRange::end() const {
	return {this, 9u};
}


Board::Board(const Difficulty& difficulty)
    : m_width(difficulty.width()), m_height(difficulty.height()), m_mineCount(difficulty.mineCount()), m_cells(difficulty.cellCount()) {
	assert(m_mineCount < m_cells.size());
}

unsigned Board::width() const {
	return m_width;
}

unsigned Board::height() const {
	return m_height;
}

unsigned Board::mineCount() const {
	return m_mineCount;
}

std::size_t Board::cellCount() const {
	return m_cells.size();
}

bool Board::isInBounds(const Coord c) const {
	return c.x < m_width && c.y < m_height;
}

bool Board::minesPlaced() const {
	return m_minesPlaced;
}

bool Board::placeMines(const Coord exclude, std::mt19937_64& rng) {
	assert(isInBounds(exclude));
	if (m_minesPlaced)
		return false;

	std::vector<bool> safe(m_cells.size(), false);
	safe[index(exclude)]  = true;
	std::size_t safeCount = 1u;
	for (const auto n: neighbors(exclude)) {
		safe[index(n)] = true;
		++safeCount;
	}
	if (m_cells.size() - safeCount < m_mineCount) {
		// Board too crowded for a safe zone. Only the clicked cell stays free.
		std::fill(safe.begin(), safe.end(), false);
		safe[index(exclude)] = true;
	}

	std::vector<std::size_t> candidates;
	candidates.reserve(m_cells.size());
	for (std::size_t i = 0; i < m_cells.size(); ++i) {
		if (!safe[i])
			candidates.push_back(i);
	}
	assert(candidates.size() >= m_mineCount);

	// Partial Fisher-Yates: the first m_mineCount candidates become mines.
	for (std::size_t i = 0; i < m_mineCount; ++i) {
		std::uniform_int_distribution<std::size_t> pick(i, candidates.size() - 1u);
		std::swap(candidates[i], candidates[pick(rng)]);
		m_cells[candidates[i]].markMine();
	}

	m_minesPlaced = true;
	computeAdjacency();
	return true;
}

bool Board::placeMines(const std::vector<Coord>& mines) {
	if (m_minesPlaced || mines.size() != m_mineCount)
		return false;

	std::vector<bool> seen(m_cells.size(), false);
	for (const auto c: mines) {
		if (!isInBounds(c) || seen[index(c)])
			return false;
		seen[index(c)] = true;
	}

	for (const auto c: mines) {
		m_cells[index(c)].markMine();
	}

	m_minesPlaced = true;
	computeAdjacency();
	return true;
}

NeighborRange Board::neighbors(const Coord c) const {
	return {c, m_width, m_height};
}

const Cell& Board::at(const Coord c) const {
	assert(isInBounds(c)); // Game should verify valid coordinate.
	return m_cells[index(c)];
}

Cell::RevealOutcome Board::revealCell(const Coord c) {
	assert(isInBounds(c)); // Game should verify valid coordinate.
	assert(m_minesPlaced);

	const auto outcome = m_cells[index(c)].reveal();
	if (outcome == Cell::RevealOutcome::Safe) {
		++m_revealedSafe;
	}
	return outcome;
}

Cell::FlagOutcome Board::toggleFlag(const Coord c) {
	assert(isInBounds(c)); // Game should verify valid coordinate.

	const auto outcome = m_cells[index(c)].toggleFlag();
	if (outcome == Cell::FlagOutcome::Flagged) {
		++m_flagCount;
	} else if (outcome == Cell::FlagOutcome::Unflagged) {
		assert(m_flagCount > 0u);
		--m_flagCount;
	}
	return outcome;
}

std::vector<Coord> Board::revealMines() {
	std::vector<Coord> revealed;
	for (std::size_t i = 0; i < m_cells.size(); ++i) {
		auto& cell = m_cells[i];
		if (!cell.isMine() || cell.isRevealed())
			continue;

		if (cell.isFlagged()) {
			cell.toggleFlag();
			--m_flagCount;
		}
		cell.reveal();
		revealed.push_back(coordOf(i));
	}
	return revealed;
}

std::size_t Board::flagCount() const {
	return m_flagCount;
}

std::size_t Board::revealedSafe() const {
	return m_revealedSafe;
}

unsigned Board::flaggedNeighbors(const Coord c) const {
	unsigned count = 0u;
	for (const auto n: neighbors(c)) {
		if (at(n).isFlagged())
			++count;
	}
	return count;
}

bool Board::isCleared() const {
	return m_minesPlaced && m_revealedSafe == m_cells.size() - m_mineCount;
}

void Board::computeAdjacency() {
	for (std::size_t i = 0; i < m_cells.size(); ++i) {
		if (m_cells[i].isMine())
			continue;

		unsigned count = 0u;
		for (const auto n: neighbors(coordOf(i))) {
			if (m_cells[index(n)].isMine())
				++count;
		}
		m_cells[i].setAdjacency(count);
	}
}

std::size_t Board::index(const Coord c) const {
	return static_cast<std::size_t>(c.y) * m_width + c.x;
}

Coord Board::coordOf(const std::size_t index) const {
	return {static_cast<Id>(index % m_width), static_cast<Id>(index / m_width)};
}

} // namespace mines
