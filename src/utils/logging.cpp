#include "tabcast/utils/logging.hpp"

#ifndef TABCAST_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>

namespace tabcast::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("tabcast");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("tabcast");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

void Logging::init(const std::string &level_name) {
	const auto level = spdlog::level::from_str(level_name);
	// from_str maps unknown names to "off"
	if (level == spdlog::level::off && level_name != "off") {
		throw std::invalid_argument("Unknown log level '" + level_name + "'.");
	}
	init(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace tabcast::utils

#endif // TABCAST_NO_LOGGING
