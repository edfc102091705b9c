#include "fin-forecast/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace finforecast::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		// Reuse a logger registered by an earlier init in another translation unit.
		logger_ = spdlog::get("fin-forecast");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("fin-forecast");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	// Models and the store log from worker threads; creation must happen once.
	static std::once_flag created;
	std::call_once(created, [] {
		if (!logger_) {
			init();
		}
	});
	return logger_;
}

} // namespace finforecast::utils
