#include "model/difficulty.hpp"

#include <gtest/gtest.h>

namespace mines::gtest {

TEST(Difficulty, Presets) {
	const auto beginner = Difficulty::beginner();
	EXPECT_EQ(beginner.width(), 9u);
	EXPECT_EQ(beginner.height(), 9u);
	EXPECT_EQ(beginner.mineCount(), 10u);

	const auto intermediate = Difficulty::intermediate();
	EXPECT_EQ(intermediate.width(), 16u);
	EXPECT_EQ(intermediate.height(), 16u);
	EXPECT_EQ(intermediate.mineCount(), 40u);

	const auto expert = Difficulty::expert();
	EXPECT_EQ(expert.width(), 30u);
	EXPECT_EQ(expert.height(), 16u);
	EXPECT_EQ(expert.mineCount(), 99u);
	EXPECT_EQ(expert.cellCount(), 480u);

	EXPECT_EQ(Difficulty::preset(DifficultyLevel::Expert), expert);
}

TEST(Difficulty, CustomValidation) {
	EXPECT_TRUE(Difficulty::custom(3u, 3u, 8u).has_value());
	EXPECT_TRUE(Difficulty::custom(1u, 1u, 0u).has_value());
	EXPECT_TRUE(Difficulty::custom(45u, 24u, 150u).has_value());

	// Mines must leave at least one free cell
	EXPECT_FALSE(Difficulty::custom(3u, 3u, 9u).has_value());
	EXPECT_FALSE(Difficulty::custom(3u, 3u, 100u).has_value());
	EXPECT_FALSE(Difficulty::custom(0u, 5u, 0u).has_value());
	EXPECT_FALSE(Difficulty::custom(5u, 0u, 0u).has_value());

	// Dimension limit
	EXPECT_TRUE(Difficulty::custom(Difficulty::MaxDimension, 1u, 0u).has_value());
	EXPECT_FALSE(Difficulty::custom(Difficulty::MaxDimension + 1u, 1u, 0u).has_value());
	EXPECT_FALSE(Difficulty::custom(100000u, 100000u, 10u).has_value());
}

TEST(Difficulty, Level) {
	EXPECT_EQ(Difficulty::beginner().level(), DifficultyLevel::Beginner);
	EXPECT_EQ(Difficulty::intermediate().level(), DifficultyLevel::Intermediate);
	EXPECT_EQ(Difficulty::expert().level(), DifficultyLevel::Expert);

	// A custom game with preset dimensions is the preset
	EXPECT_EQ(Difficulty::custom(16u, 16u, 40u)->level(), DifficultyLevel::Intermediate);
	EXPECT_FALSE(Difficulty::custom(16u, 16u, 41u)->level().has_value());
	EXPECT_FALSE(Difficulty::custom(16u, 30u, 99u)->level().has_value());
}

TEST(Difficulty, Names) {
	EXPECT_EQ(toString(Difficulty::beginner()), "Beginner (w:9, h:9, m:10)");
	EXPECT_EQ(toString(*Difficulty::custom(45u, 24u, 150u)), "Custom (w:45, h:24, m:150)");

	for (const auto level: {DifficultyLevel::Beginner, DifficultyLevel::Intermediate, DifficultyLevel::Expert}) {
		EXPECT_EQ(levelFromString(toString(level)), level);
	}
	EXPECT_FALSE(levelFromString("Custom").has_value());
	EXPECT_FALSE(levelFromString("beginner").has_value());
}

} // namespace mines::gtest
