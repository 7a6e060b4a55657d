#include "core/settings.hpp"

#include "Logging.hpp"

#include <cstdint>
#include <format>
#include <limits>
#include <nlohmann/json.hpp>

namespace mines {

using nlohmann::json;

static constexpr char KEY_DIFFICULTY[]  = "difficulty";
static constexpr char KEY_WIDTH[]       = "width";
static constexpr char KEY_HEIGHT[]      = "height";
static constexpr char KEY_MINES[]       = "mines";
static constexpr char KEY_HIGH_SCORES[] = "highScores";
static constexpr char KEY_NAME[]        = "name";
static constexpr char KEY_TIME[]        = "timeMs";

static constexpr DifficultyLevel kLevels[] = {DifficultyLevel::Beginner, DifficultyLevel::Intermediate, DifficultyLevel::Expert};

std::string toJson(const GameSettings& settings) {
	json scores = json::object();
	for (const auto level: kLevels) {
		const auto& entries = settings.highScores.scores(level);
		if (entries.empty())
			continue;

		json list = json::array();
		for (const auto& entry: entries) {
			list.push_back({{KEY_NAME, entry.name}, {KEY_TIME, entry.time.count()}});
		}
		scores[toString(level)] = std::move(list);
	}

	const json document{
	        {KEY_DIFFICULTY,
	         {
	                 {KEY_WIDTH, settings.difficulty.width()},
	                 {KEY_HEIGHT, settings.difficulty.height()},
	                 {KEY_MINES, settings.difficulty.mineCount()},
	         }},
	        {KEY_HIGH_SCORES, std::move(scores)},
	};
	return document.dump();
}

//! Unsigned JSON number that fits into T. Empty for other types or values out of range.
template<typename T>
static std::optional<T> unsignedFromJson(const json& value) {
	if (!value.is_number_unsigned())
		return {};

	const auto number = value.get<std::uint64_t>();
	if (number > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
		return {};
	return static_cast<T>(number);
}

static std::optional<Difficulty> difficultyFromJson(const json& value) {
	if (!value.is_object() || !value.contains(KEY_WIDTH) || !value.contains(KEY_HEIGHT) || !value.contains(KEY_MINES))
		return {};

	const auto width  = unsignedFromJson<unsigned>(value.at(KEY_WIDTH));
	const auto height = unsignedFromJson<unsigned>(value.at(KEY_HEIGHT));
	const auto mines  = unsignedFromJson<unsigned>(value.at(KEY_MINES));
	if (!width || !height || !mines)
		return {};

	return Difficulty::custom(*width, *height, *mines);
}

static bool highScoresFromJson(const json& value, HighScoreTable& table) {
	if (!value.is_object())
		return false;

	for (const auto& [name, entries]: value.items()) {
		const auto level = levelFromString(name);
		if (!level || !entries.is_array())
			return false;

		for (const auto& entry: entries) {
			if (!entry.is_object() || !entry.contains(KEY_NAME) || !entry.contains(KEY_TIME))
				return false;
			const auto time = unsignedFromJson<Duration::rep>(entry.at(KEY_TIME));
			if (!entry.at(KEY_NAME).is_string() || !time)
				return false;

			// Slow entries simply do not make it into the table.
			table.insert(*level, {.name = entry.at(KEY_NAME).get<std::string>(), .time = Duration{*time}});
		}
	}
	return true;
}

std::optional<GameSettings> settingsFromJson(const std::string& message) {
	const auto document = json::parse(message, nullptr, false);
	if (document.is_discarded() || !document.is_object() || !document.contains(KEY_DIFFICULTY)) {
		Logger().Log(Logging::LogLevel::Warning, "[Settings] Settings document is not valid JSON or misses the difficulty.");
		return {};
	}

	const auto difficulty = difficultyFromJson(document.at(KEY_DIFFICULTY));
	if (!difficulty) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Settings] Invalid difficulty: {}", document.at(KEY_DIFFICULTY).dump()));
		return {};
	}

	GameSettings settings{.difficulty = *difficulty, .highScores = {}};
	if (document.contains(KEY_HIGH_SCORES) && !highScoresFromJson(document.at(KEY_HIGH_SCORES), settings.highScores)) {
		Logger().Log(Logging::LogLevel::Warning, "[Settings] Invalid high score table.");
		return {};
	}
	return settings;
}

} // namespace mines
