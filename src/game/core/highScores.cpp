#include "core/highScores.hpp"

namespace mines {

static const std::vector<HighScore> kNoScores{};

//! Index the time would be inserted at. Ties rank behind existing entries.
static std::size_t rankOf(const std::vector<HighScore>& scores, const Duration time) {
	std::size_t rank = 0u;
	while (rank < scores.size() && scores[rank].time <= time) {
		++rank;
	}
	return rank;
}

std::optional<std::size_t> HighScoreTable::insert(const DifficultyLevel level, HighScore score) {
	if (!qualifies(level, score.time))
		return {};

	if (score.name.size() > MaxNameLength) {
		score.name.resize(MaxNameLength);
	}

	auto& scores    = m_scores[level];
	const auto rank = rankOf(scores, score.time);
	scores.insert(scores.begin() + static_cast<std::ptrdiff_t>(rank), std::move(score));
	if (scores.size() > MaxEntriesPerLevel) {
		scores.resize(MaxEntriesPerLevel);
	}
	return rank;
}

bool HighScoreTable::rename(const DifficultyLevel level, const std::size_t rank, const std::string& name) {
	if (name.size() > MaxNameLength)
		return false;

	const auto it = m_scores.find(level);
	if (it == m_scores.end() || rank >= it->second.size())
		return false;

	it->second[rank].name = name;
	return true;
}

bool HighScoreTable::remove(const DifficultyLevel level, const std::size_t rank) {
	const auto it = m_scores.find(level);
	if (it == m_scores.end() || rank >= it->second.size())
		return false;

	it->second.erase(it->second.begin() + static_cast<std::ptrdiff_t>(rank));
	if (it->second.empty()) {
		m_scores.erase(it);
	}
	return true;
}

bool HighScoreTable::qualifies(const DifficultyLevel level, const Duration time) const {
	if (time < Duration::zero())
		return false;
	return rankOf(scores(level), time) < MaxEntriesPerLevel;
}

const std::vector<HighScore>& HighScoreTable::scores(const DifficultyLevel level) const {
	const auto it = m_scores.find(level);
	return it == m_scores.end() ? kNoScores : it->second;
}

std::optional<Duration> HighScoreTable::bestTime(const DifficultyLevel level) const {
	const auto& entries = scores(level);
	if (entries.empty())
		return {};
	return entries.front().time;
}

} // namespace mines
