#pragma once

#ifndef STOCKWISE_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace stockwise::utils {

/**
 * @class Logging
 * @brief Process-wide spdlog logger shared by the classification, demand and
 * health models.
 *
 * The logger is created lazily on first use; call init() at startup to pick a
 * level other than info.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Sets the minimum level (and flush level) of the shared logger.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace stockwise::utils

#define STOCKWISE_TRACE(...)    stockwise::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define STOCKWISE_DEBUG(...)    stockwise::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define STOCKWISE_INFO(...)     stockwise::utils::Logging::getLogger()->info(__VA_ARGS__)
#define STOCKWISE_WARN(...)     stockwise::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define STOCKWISE_ERROR(...)    stockwise::utils::Logging::getLogger()->error(__VA_ARGS__)
#define STOCKWISE_CRITICAL(...) stockwise::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else

namespace stockwise::utils {

class Logging {
public:
	static void init() {}
};

} // namespace stockwise::utils

#define STOCKWISE_TRACE(...)    do {} while(0)
#define STOCKWISE_DEBUG(...)    do {} while(0)
#define STOCKWISE_INFO(...)     do {} while(0)
#define STOCKWISE_WARN(...)     do {} while(0)
#define STOCKWISE_ERROR(...)    do {} while(0)
#define STOCKWISE_CRITICAL(...) do {} while(0)

#endif // STOCKWISE_NO_LOGGING
