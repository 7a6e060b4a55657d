#include "core/highScores.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

namespace mines::gtest {

using namespace std::chrono_literals;

TEST(HighScores, Empty) {
	const HighScoreTable table{};

	EXPECT_TRUE(table.scores(DifficultyLevel::Beginner).empty());
	EXPECT_FALSE(table.bestTime(DifficultyLevel::Expert).has_value());
	EXPECT_TRUE(table.qualifies(DifficultyLevel::Intermediate, 999s));
}

TEST(HighScores, InsertSorted) {
	HighScoreTable table;

	EXPECT_EQ(table.insert(DifficultyLevel::Beginner, {.name = "b", .time = 20s}), 0u);
	EXPECT_EQ(table.insert(DifficultyLevel::Beginner, {.name = "a", .time = 10s}), 0u);
	EXPECT_EQ(table.insert(DifficultyLevel::Beginner, {.name = "c", .time = 30s}), 2u);

	const auto& scores = table.scores(DifficultyLevel::Beginner);
	ASSERT_EQ(scores.size(), 3u);
	EXPECT_EQ(scores[0], (HighScore{.name = "a", .time = 10s}));
	EXPECT_EQ(scores[1], (HighScore{.name = "b", .time = 20s}));
	EXPECT_EQ(scores[2], (HighScore{.name = "c", .time = 30s}));
	EXPECT_EQ(table.bestTime(DifficultyLevel::Beginner), 10s);

	// Levels are independent
	EXPECT_TRUE(table.scores(DifficultyLevel::Expert).empty());
}

TEST(HighScores, TableFull) {
	HighScoreTable table;
	table.insert(DifficultyLevel::Expert, {.name = "a", .time = 100s});
	table.insert(DifficultyLevel::Expert, {.name = "b", .time = 200s});
	table.insert(DifficultyLevel::Expert, {.name = "c", .time = 300s});

	EXPECT_FALSE(table.qualifies(DifficultyLevel::Expert, 300s));
	EXPECT_FALSE(table.insert(DifficultyLevel::Expert, {.name = "d", .time = 400s}).has_value());
	EXPECT_TRUE(table.qualifies(DifficultyLevel::Expert, 299s));

	// Slowest entry drops out
	EXPECT_EQ(table.insert(DifficultyLevel::Expert, {.name = "e", .time = 150s}), 1u);
	const auto& scores = table.scores(DifficultyLevel::Expert);
	ASSERT_EQ(scores.size(), HighScoreTable::MaxEntriesPerLevel);
	EXPECT_EQ(scores[0].name, "a");
	EXPECT_EQ(scores[1].name, "e");
	EXPECT_EQ(scores[2].name, "b");
}

TEST(HighScores, TieRanksBehind) {
	HighScoreTable table;
	table.insert(DifficultyLevel::Beginner, {.name = "first", .time = 10s});

	EXPECT_EQ(table.insert(DifficultyLevel::Beginner, {.name = "second", .time = 10s}), 1u);
	EXPECT_EQ(table.scores(DifficultyLevel::Beginner)[0].name, "first");
}

TEST(HighScores, NegativeTime) {
	HighScoreTable table;

	EXPECT_FALSE(table.qualifies(DifficultyLevel::Beginner, -1ms));
	EXPECT_FALSE(table.insert(DifficultyLevel::Beginner, {.name = "a", .time = -1ms}).has_value());
	EXPECT_TRUE(table.scores(DifficultyLevel::Beginner).empty());
}

TEST(HighScores, LongNameCut) {
	HighScoreTable table;
	const std::string name(40u, 'x');

	ASSERT_TRUE(table.insert(DifficultyLevel::Beginner, {.name = name, .time = 5s}).has_value());
	EXPECT_EQ(table.scores(DifficultyLevel::Beginner)[0].name, std::string(HighScoreTable::MaxNameLength, 'x'));
}

TEST(HighScores, Rename) {
	HighScoreTable table;
	table.insert(DifficultyLevel::Intermediate, {.name = "", .time = 50s});

	EXPECT_TRUE(table.rename(DifficultyLevel::Intermediate, 0u, "player"));
	EXPECT_EQ(table.scores(DifficultyLevel::Intermediate)[0].name, "player");

	EXPECT_FALSE(table.rename(DifficultyLevel::Intermediate, 1u, "other"));
	EXPECT_FALSE(table.rename(DifficultyLevel::Expert, 0u, "other"));
	EXPECT_FALSE(table.rename(DifficultyLevel::Intermediate, 0u, std::string(33u, 'y')));
	EXPECT_EQ(table.scores(DifficultyLevel::Intermediate)[0].name, "player");
}

TEST(HighScores, Remove) {
	HighScoreTable table;
	table.insert(DifficultyLevel::Beginner, {.name = "a", .time = 10s});
	table.insert(DifficultyLevel::Beginner, {.name = "b", .time = 20s});

	EXPECT_FALSE(table.remove(DifficultyLevel::Beginner, 2u));
	EXPECT_TRUE(table.remove(DifficultyLevel::Beginner, 0u));
	EXPECT_EQ(table.bestTime(DifficultyLevel::Beginner), 20s);

	EXPECT_TRUE(table.remove(DifficultyLevel::Beginner, 0u));
	EXPECT_TRUE(table.scores(DifficultyLevel::Beginner).empty());
	EXPECT_FALSE(table.remove(DifficultyLevel::Beginner, 0u));
}

} // namespace mines::gtest
