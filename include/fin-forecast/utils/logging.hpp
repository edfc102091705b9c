#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace finforecast::utils {

/**
 * @class Logging
 * @brief Process-wide access point to the spdlog logger used by the forecasting engine.
 *
 * Every model and budgeting stage logs through the same named logger so the host
 * application can raise or lower verbosity in one place.
 */
class Logging {
public:
	/**
	 * @brief Gets the shared logger, creating it at info level on first use.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Creates the logger if needed and sets its level and flush threshold.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace finforecast::utils

#define FINFORECAST_TRACE(...)    finforecast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define FINFORECAST_DEBUG(...)    finforecast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define FINFORECAST_INFO(...)     finforecast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define FINFORECAST_WARN(...)     finforecast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define FINFORECAST_ERROR(...)    finforecast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define FINFORECAST_CRITICAL(...) finforecast::utils::Logging::getLogger()->critical(__VA_ARGS__)
