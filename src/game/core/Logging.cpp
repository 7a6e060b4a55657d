#include "Logging.hpp"

#include "Logger/LogConfig.hpp"
#include "Logger/LogOutputConsole.hpp"
#include "Logger/LogOutputFile.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>

namespace mines {

static constexpr char LOG_DIR[]  = "Minesweep/Core";
static constexpr char LOG_FILE[] = "engine.log";

static Logging::LogConfig engineConfig;

//! File output always. Console output and debug entries only for debug builds.
//! Rejected player actions are logged per action, so release builds skip the debug level.
static void InitializeEngineLogger() {
	engineConfig.SetLogEnabled(true);
#ifdef NDEBUG
	engineConfig.SetMinLogLevel(Logging::LogLevel::Info);
#else
	engineConfig.SetMinLogLevel(Logging::LogLevel::Any);
	engineConfig.AddLogOutput(std::make_shared<Logging::LogOutputConsole>());
#endif

	const auto logDir = Logging::GetDefaultLogDir(LOG_DIR);

	std::error_code ec{};
	if (!std::filesystem::create_directories(logDir, ec) && ec) {
		std::cerr << std::format("[Logger] Cannot create log directory {}: {}. Engine logs to console only.\n", logDir.string(), ec.message());
		return;
	}
	engineConfig.AddLogOutput(std::make_shared<Logging::LogOutputFile>(logDir / LOG_FILE));
}

Logging::Logger Logger() {
	static std::once_flag initFlag;
	std::call_once(initFlag, InitializeEngineLogger);

	return Logging::Logger(engineConfig);
}

} // namespace mines
