#pragma once

namespace mines {

using Id = unsigned; //!< Board ID used by the engine.

//! Coordinate pair for the board.
//! \note Origin is the top left cell. x is the column, y is the row.
struct Coord {
	Id x, y;

	bool operator==(const Coord&) const = default;
};

} // namespace mines
