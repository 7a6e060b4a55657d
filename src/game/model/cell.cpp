#include "model/cell.hpp"

#include <cassert>

namespace mines {

void Cell::markMine() {
	m_mine = true;
}

void Cell::setAdjacency(const unsigned count) {
	assert(count <= 8u);
	m_adjacent = static_cast<std::uint8_t>(count);
}

Cell::RevealOutcome Cell::reveal() {
	switch (m_state) {
	case State::Revealed:
		return RevealOutcome::AlreadyRevealed;
	case State::Flagged:
		return RevealOutcome::Flagged;
	case State::Hidden:
		break;
	}

	m_state = State::Revealed;
	return m_mine ? RevealOutcome::Mine : RevealOutcome::Safe;
}

Cell::FlagOutcome Cell::toggleFlag() {
	switch (m_state) {
	case State::Hidden:
		m_state = State::Flagged;
		return FlagOutcome::Flagged;
	case State::Flagged:
		m_state = State::Hidden;
		return FlagOutcome::Unflagged;
	case State::Revealed:
		break;
	}
	return FlagOutcome::Rejected;
}

bool Cell::isMine() const {
	return m_mine;
}

Cell::State Cell::state() const {
	return m_state;
}

unsigned Cell::adjacentMines() const {
	return m_adjacent;
}

bool Cell::isHidden() const {
	return m_state == State::Hidden;
}

bool Cell::isFlagged() const {
	return m_state == State::Flagged;
}

bool Cell::isRevealed() const {
	return m_state == State::Revealed;
}

} // namespace mines
