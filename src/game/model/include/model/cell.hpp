#pragma once

#include <cstdint>

namespace mines {

//! A single field of the minefield.
class Cell {
public:
	enum class State : std::uint8_t { Hidden, Flagged, Revealed };

	//! Result of revealing this cell.
	enum class RevealOutcome {
		AlreadyRevealed, //!< Nothing changed.
		Flagged,         //!< Flag protects the cell. Nothing changed.
		Mine,            //!< Cell revealed and is a mine.
		Safe             //!< Cell revealed. See adjacentMines().
	};

	//! Result of toggling the flag on this cell.
	enum class FlagOutcome {
		Flagged,   //!< Hidden -> Flagged.
		Unflagged, //!< Flagged -> Hidden.
		Rejected   //!< Cell already revealed.
	};

public:
	void markMine();                   //!< Turn the cell into a mine. Only done during mine placement.
	void setAdjacency(unsigned count); //!< Set number of neighbouring mines \in [0, 8].

	RevealOutcome reveal();
	FlagOutcome toggleFlag();

	bool isMine() const;
	State state() const;
	unsigned adjacentMines() const;

	bool isHidden() const;
	bool isFlagged() const;
	bool isRevealed() const;

private:
	bool m_mine{false};
	State m_state{State::Hidden};
	std::uint8_t m_adjacent{0u};
};

} // namespace mines
