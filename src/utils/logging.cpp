#include "stockwise/utils/logging.hpp"

#ifndef STOCKWISE_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace stockwise::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

namespace {
std::mutex &loggerMutex() {
	static std::mutex mutex;
	return mutex;
}
} // namespace

void Logging::init(spdlog::level::level_enum level) {
	std::lock_guard<std::mutex> lock(loggerMutex());
	if (!logger_) {
		logger_ = spdlog::get("stockwise");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("stockwise");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace stockwise::utils

#endif // STOCKWISE_NO_LOGGING
