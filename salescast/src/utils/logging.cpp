#include "salescast/utils/logging.hpp"

#ifndef SALESCAST_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <stdexcept>
#include <utility>

namespace salescast::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

namespace {

std::once_flag logger_created;

} // namespace

void Logging::init(spdlog::level::level_enum level) {
	auto &logger = getLogger();
	logger->set_level(level);
	logger->flush_on(level);
}

void Logging::init(const std::string &level_name) {
	const auto level = spdlog::level::from_str(level_name);
	// from_str maps unknown names to "off"; only accept that when it was asked for.
	if (level == spdlog::level::off && level_name != "off") {
		throw std::invalid_argument("Unknown log level '" + level_name + "'.");
	}
	init(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	// Worker threads may log first; the logger is created exactly once and never replaced.
	std::call_once(logger_created, []() {
		auto logger = spdlog::get("salescast");
		if (!logger) {
			logger = spdlog::stdout_color_mt("salescast");
			logger->set_level(spdlog::level::info);
			logger->flush_on(spdlog::level::info);
		}
		logger_ = std::move(logger);
	});
	return logger_;
}

} // namespace salescast::utils

#endif // SALESCAST_NO_LOGGING
