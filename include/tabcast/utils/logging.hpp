#pragma once

#ifndef TABCAST_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace tabcast::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every component of the engine logs through the same "tabcast" logger, which
 * can be configured once at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

	/**
	 * @brief Initializes the logger from a level name ("trace" .. "critical", "off").
	 * @throws std::invalid_argument If the name is not a known level.
	 */
	static void init(const std::string &level_name);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace tabcast::utils

// --- Logger Macros for convenient access ---
#define TABCAST_TRACE(...)    tabcast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define TABCAST_DEBUG(...)    tabcast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define TABCAST_INFO(...)     tabcast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define TABCAST_WARN(...)     tabcast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define TABCAST_ERROR(...)    tabcast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define TABCAST_CRITICAL(...) tabcast::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// No-op logging when spdlog is not linked
#include <string>

namespace tabcast::utils {

class Logging {
public:
	static void init() {}
	static void init(const std::string &) {}
};

} // namespace tabcast::utils

#define TABCAST_TRACE(...)    do {} while(0)
#define TABCAST_DEBUG(...)    do {} while(0)
#define TABCAST_INFO(...)     do {} while(0)
#define TABCAST_WARN(...)     do {} while(0)
#define TABCAST_ERROR(...)    do {} while(0)
#define TABCAST_CRITICAL(...) do {} while(0)

#endif // TABCAST_NO_LOGGING
