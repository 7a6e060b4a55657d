#include "model/difficulty.hpp"

#include <format>

namespace mines {

Difficulty::Difficulty(const unsigned width, const unsigned height, const unsigned mineCount)
    : m_width(width), m_height(height), m_mineCount(mineCount) {
}

Difficulty Difficulty::beginner() {
	return {9u, 9u, 10u};
}

Difficulty Difficulty::intermediate() {
	return {16u, 16u, 40u};
}

Difficulty Difficulty::expert() {
	return {30u, 16u, 99u};
}

Difficulty Difficulty::preset(const DifficultyLevel level) {
	switch (level) {
	case DifficultyLevel::Beginner:
		return beginner();
	case DifficultyLevel::Intermediate:
		return intermediate();
	case DifficultyLevel::Expert:
		return expert();
	}
	return beginner();
}

std::optional<Difficulty> Difficulty::custom(const unsigned width, const unsigned height, const unsigned mineCount) {
	if (width == 0u || height == 0u || width > MaxDimension || height > MaxDimension) {
		return {};
	}
	if (static_cast<std::size_t>(mineCount) >= static_cast<std::size_t>(width) * height) {
		return {};
	}
	return Difficulty{width, height, mineCount};
}

unsigned Difficulty::width() const {
	return m_width;
}

unsigned Difficulty::height() const {
	return m_height;
}

unsigned Difficulty::mineCount() const {
	return m_mineCount;
}

std::size_t Difficulty::cellCount() const {
	return static_cast<std::size_t>(m_width) * m_height;
}

std::optional<DifficultyLevel> Difficulty::level() const {
	for (const auto level: {DifficultyLevel::Beginner, DifficultyLevel::Intermediate, DifficultyLevel::Expert}) {
		if (*this == preset(level)) {
			return level;
		}
	}
	return {};
}

std::string toString(const DifficultyLevel level) {
	switch (level) {
	case DifficultyLevel::Beginner:
		return "Beginner";
	case DifficultyLevel::Intermediate:
		return "Intermediate";
	case DifficultyLevel::Expert:
		return "Expert";
	}
	return {};
}

std::string toString(const Difficulty& difficulty) {
	const auto level = difficulty.level();
	return std::format("{} (w:{}, h:{}, m:{})", level ? toString(*level) : "Custom", difficulty.width(), difficulty.height(), difficulty.mineCount());
}

std::optional<DifficultyLevel> levelFromString(const std::string& name) {
	for (const auto level: {DifficultyLevel::Beginner, DifficultyLevel::Intermediate, DifficultyLevel::Expert}) {
		if (toString(level) == name) {
			return level;
		}
	}
	return {};
}

} // namespace mines
