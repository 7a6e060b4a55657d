#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace mines {

//! Standard difficulty presets. Custom games have no level.
enum class DifficultyLevel { Beginner, Intermediate, Expert };

//! Board dimensions and mine count of a game.
//! \note Always valid: mineCount < width * height, width and height in [1, MaxDimension].
class Difficulty {
public:
	static constexpr unsigned MaxDimension = 65535u; //!< Largest width or height of a custom game.

public:
	static Difficulty beginner();     //!< 9x9, 10 mines.
	static Difficulty intermediate(); //!< 16x16, 40 mines.
	static Difficulty expert();       //!< 30x16, 99 mines.
	static Difficulty preset(DifficultyLevel level);

	//! Custom game. Returns empty if a dimension is 0 or above MaxDimension, or the mines do not fit on the board.
	static std::optional<Difficulty> custom(unsigned width, unsigned height, unsigned mineCount);

	unsigned width() const;
	unsigned height() const;
	unsigned mineCount() const;
	std::size_t cellCount() const;

	//! Preset level matching these dimensions, empty for custom games.
	std::optional<DifficultyLevel> level() const;

	bool operator==(const Difficulty&) const = default;

private:
	Difficulty(unsigned width, unsigned height, unsigned mineCount);

private:
	unsigned m_width;
	unsigned m_height;
	unsigned m_mineCount;
};

std::string toString(DifficultyLevel level);     //!< "Beginner", "Intermediate", "Expert"
std::string toString(const Difficulty& difficulty); //!< e.g. "Beginner (w:9, h:9, m:10)"

//! Parse the output of toString(DifficultyLevel).
std::optional<DifficultyLevel> levelFromString(const std::string& name);

} // namespace mines
