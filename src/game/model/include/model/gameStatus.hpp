#pragma once

namespace mines {

enum class GameStatus {
	NotStarted, //!< No cell revealed or flagged yet.
	Playing,    //!< Game being played. Timer runs.
	Won,        //!< Every safe cell revealed.
	Lost        //!< A mine was revealed.
};

//! True if no further action is accepted.
inline constexpr bool isGameOver(GameStatus status) {
	return status == GameStatus::Won || status == GameStatus::Lost;
}

} // namespace mines
