#include "core/revealEngine.hpp"

#include <cassert>
#include <deque>

namespace mines {

RevealOutcome floodReveal(Board& board, const Coord c, std::vector<Coord>& outRevealed, std::optional<Coord>& outDetonated) {
	assert(board.minesPlaced());
	assert(board.isInBounds(c));

	switch (board.revealCell(c)) {
	case Cell::RevealOutcome::AlreadyRevealed:
		return RevealOutcome::AlreadyRevealed;
	case Cell::RevealOutcome::Flagged:
		return RevealOutcome::Flagged;
	case Cell::RevealOutcome::Mine:
		outRevealed.push_back(c);
		if (!outDetonated)
			outDetonated = c;
		return RevealOutcome::Mine;
	case Cell::RevealOutcome::Safe:
		break;
	}

	outRevealed.push_back(c);
	if (board.at(c).adjacentMines() != 0u)
		return RevealOutcome::Safe;

	// Neighbour relation is symmetric. Every cell enters the queue at most once.
	std::vector<std::vector<bool>> visited(board.width(), std::vector<bool>(board.height(), false));
	visited[c.x][c.y] = true;

	std::deque<Coord> queue{c};
	while (!queue.empty()) {
		const auto current = queue.front();
		queue.pop_front();

		for (const auto neighbor: board.neighbors(current)) {
			if (visited[neighbor.x][neighbor.y])
				continue;
			visited[neighbor.x][neighbor.y] = true;

			const auto& cell = board.at(neighbor);
			if (!cell.isHidden())
				continue; // Flagged or already revealed.

			assert(!cell.isMine()); // Only zero cells expand, so their neighbours are safe.
			board.revealCell(neighbor);
			outRevealed.push_back(neighbor);

			if (cell.adjacentMines() == 0u) {
				queue.push_back(neighbor);
			}
		}
	}

	return RevealOutcome::Safe;
}

bool isChordSatisfied(const Board& board, const Coord c) {
	const auto& cell = board.at(c);
	if (!cell.isRevealed() || cell.isMine() || cell.adjacentMines() == 0u)
		return false;

	return board.flaggedNeighbors(c) == cell.adjacentMines();
}

RevealOutcome chordReveal(Board& board, const Coord c, std::vector<Coord>& outRevealed, std::optional<Coord>& outDetonated) {
	assert(board.minesPlaced());
	assert(board.isInBounds(c));

	if (!isChordSatisfied(board, c))
		return RevealOutcome::NotSatisfied;

	const auto revealedBefore = outRevealed.size();
	bool hitMine              = false;
	for (const auto neighbor: board.neighbors(c)) {
		// An earlier neighbour's flood may already have revealed this one.
		if (!board.at(neighbor).isHidden())
			continue;

		if (floodReveal(board, neighbor, outRevealed, outDetonated) == RevealOutcome::Mine) {
			hitMine = true;
		}
	}

	if (hitMine)
		return RevealOutcome::Mine;
	return outRevealed.size() == revealedBefore ? RevealOutcome::AlreadyRevealed : RevealOutcome::Safe;
}

} // namespace mines
