#pragma once

#ifndef SALESCAST_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace salescast::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * This class ensures that a single logger instance is used throughout the
 * engine, which can be configured at startup.
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

	/// Initializes the logger from a level name ("trace" ... "off").
	static void init(const std::string &level_name);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace salescast::utils

#define SALESCAST_TRACE(...)    salescast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define SALESCAST_DEBUG(...)    salescast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define SALESCAST_INFO(...)     salescast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define SALESCAST_WARN(...)     salescast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define SALESCAST_ERROR(...)    salescast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define SALESCAST_CRITICAL(...) salescast::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// No-op logging when spdlog is not available

#include <string>

namespace salescast::utils {

class Logging {
public:
	static void init() {}
	static void init(const std::string &) {}
};

} // namespace salescast::utils

#define SALESCAST_TRACE(...)    do {} while(0)
#define SALESCAST_DEBUG(...)    do {} while(0)
#define SALESCAST_INFO(...)     do {} while(0)
#define SALESCAST_WARN(...)     do {} while(0)
#define SALESCAST_ERROR(...)    do {} while(0)
#define SALESCAST_CRITICAL(...) do {} while(0)

#endif // SALESCAST_NO_LOGGING
