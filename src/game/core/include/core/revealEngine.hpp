#pragma once

#include "core/gameEvent.hpp"
#include "model/board.hpp"

#include <optional>
#include <vector>

namespace mines {

//! Reveal a cell and flood reveal all connected cells without neighbouring mines.
//! Numbered cells at the border of the flooded area are revealed but not expanded. Flags are never revealed.
//! \note Mines must be placed and c must be in bounds.
//! \param [out] outRevealed  Newly revealed cells are appended in breadth-first order.
//! \param [out] outDetonated Set to c if c is a mine.
RevealOutcome floodReveal(Board& board, Coord c, std::vector<Coord>& outRevealed, std::optional<Coord>& outDetonated);

//! Reveal all hidden neighbours of a revealed number whose flagged neighbour count matches the number.
//! Every neighbour is revealed with floodReveal. Mine if any neighbour was a mine.
//! \note Mines must be placed and c must be in bounds.
RevealOutcome chordReveal(Board& board, Coord c, std::vector<Coord>& outRevealed, std::optional<Coord>& outDetonated);

//! True if c is a revealed number with exactly as many flagged neighbours.
bool isChordSatisfied(const Board& board, Coord c);

} // namespace mines
