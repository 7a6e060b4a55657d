#pragma once

#include "model/cell.hpp"
#include "model/coordinate.hpp"
#include "model/difficulty.hpp"

#include <cstddef>
#include <iterator>
#include <random>
#include <vector>

namespace mines {

//! Lazily enumerates the in-bounds neighbours of a coordinate (up to 8).
//! Pure function of the centre and the board bounds. Can be iterated any number of times.
class NeighborRange {
public:
	class Iterator {
	public:
		using iterator_category = std::input_iterator_tag;
		using value_type        = Coord;
		using difference_type   = std::ptrdiff_t;
		using pointer           = const Coord*;
		using reference         = Coord;

		Iterator() = default;
		Iterator(const NeighborRange* range, unsigned offset);

		Coord operator*() const;
		Iterator& operator++();
		Iterator operator++(int);
		bool operator==(const Iterator& other) const;

	private:
		void skipInvalid();

	private:
		const NeighborRange* m_range{nullptr};
		unsigned m_offset{9u}; //!< Position in the 3x3 window around the centre. 9 is end.
	};

public:
	NeighborRange(Coord center, unsigned width, unsigned height);

	Iterator begin() const;
	Iterator end() const;

private:
	Coord m_center;
	unsigned m_width;
	unsigned m_height;
};

//! The minefield. Rectangular grid of cells with a fixed number of mines.
//! \note Mines are not placed on construction. The first reveal triggers placement.
//! \note Coordinates passed to mutators must be in bounds. The Game checks isInBounds before.
class Board {
public:
	explicit Board(const Difficulty& difficulty);

	unsigned width() const;
	unsigned height() const;
	unsigned mineCount() const;
	std::size_t cellCount() const;

	bool isInBounds(Coord c) const;
	bool minesPlaced() const;

	//! Randomly place all mines, keeping the safe zone around exclude free.
	//! Safe zone is exclude and its neighbours. If the remaining cells cannot hold all mines, only exclude is kept free.
	//! \returns False if mines were already placed. Board unchanged in that case.
	bool placeMines(Coord exclude, std::mt19937_64& rng);

	//! Place mines at exactly the given coordinates.
	//! \returns False if already placed, or the layout has the wrong size, duplicates or out of bounds coordinates.
	bool placeMines(const std::vector<Coord>& mines);

	NeighborRange neighbors(Coord c) const; //!< In-bounds neighbours of c.
	const Cell& at(Coord c) const;          //!< Cell at given coordinate.

	Cell::RevealOutcome revealCell(Coord c); //!< Reveal a single cell without propagation.
	Cell::FlagOutcome toggleFlag(Coord c);   //!< Toggle flag on a hidden cell.
	std::vector<Coord> revealMines();        //!< Reveal every mine not yet revealed. Returns the changed cells.

	std::size_t flagCount() const;     //!< Number of flagged cells.
	std::size_t revealedSafe() const;  //!< Number of revealed non-mine cells.
	unsigned flaggedNeighbors(Coord c) const;
	bool isCleared() const;            //!< True if every non-mine cell is revealed.

private:
	void computeAdjacency();

	std::size_t index(Coord c) const;
	Coord coordOf(std::size_t index) const;

private:
	unsigned m_width;
	unsigned m_height;
	unsigned m_mineCount;
	bool m_minesPlaced{false};

	std::size_t m_flagCount{0u};
	std::size_t m_revealedSafe{0u};

	std::vector<Cell> m_cells{}; //!< Row major cell data.
};

} // namespace mines
