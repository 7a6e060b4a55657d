#pragma once

#include "model/cell.hpp"
#include "model/coordinate.hpp"

#include <cassert>
#include <cstddef>
#include <vector>

namespace mines {

//! Render data of a single cell.
struct CellView {
	Cell::State state{Cell::State::Hidden};
	bool mine{false};          //!< Reported for revealed cells, and for every cell once the game is over.
	bool detonated{false};     //!< The mine that ended the game.
	unsigned adjacentMines{0}; //!< Reported like mine. Zero for mines.

	bool operator==(const CellView&) const = default;
};

//! Read only copy of the board for rendering.
struct BoardSnapshot {
	unsigned width{0};
	unsigned height{0};
	std::vector<CellView> cells{}; //!< Row major.

	const CellView& at(Coord c) const {
		assert(c.x < width && c.y < height);
		return cells[static_cast<std::size_t>(c.y) * width + c.x];
	}

	bool operator==(const BoardSnapshot&) const = default;
};

} // namespace mines
