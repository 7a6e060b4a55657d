#pragma once

#include "core/IScoreStore.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mines {

struct HighScore {
	std::string name; //!< Player name. At most HighScoreTable::MaxNameLength bytes.
	Duration time;    //!< Time needed to clear the board.

	bool operator==(const HighScore&) const = default;
};

//! Best times per preset level, fastest first.
class HighScoreTable : public IScoreStore {
public:
	static constexpr std::size_t MaxEntriesPerLevel = 3u;
	static constexpr std::size_t MaxNameLength      = 32u;

public:
	//! Insert a score at its rank. Longer names are cut.
	//! \returns Rank of the new entry or empty if it is not fast enough for the table.
	std::optional<std::size_t> insert(DifficultyLevel level, HighScore score);

	bool rename(DifficultyLevel level, std::size_t rank, const std::string& name); //!< False if rank unknown or name too long.
	bool remove(DifficultyLevel level, std::size_t rank);                          //!< False if rank unknown.

	bool qualifies(DifficultyLevel level, Duration time) const; //!< True if insert would accept this time.
	const std::vector<HighScore>& scores(DifficultyLevel level) const;

	std::optional<Duration> bestTime(DifficultyLevel level) const override;

private:
	std::map<DifficultyLevel, std::vector<HighScore>> m_scores;
};

} // namespace mines
