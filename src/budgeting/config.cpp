#include "fin-forecast/budgeting/config.hpp"

#include <stdexcept>

namespace finforecast::budgeting {

void ForecastingConfig::validate() const {
	if (min_history_months < 3) {
		throw std::invalid_argument("min_history_months must be at least 3.");
	}
	if (moving_average_window <= 0) {
		throw std::invalid_argument("moving_average_window must be positive.");
	}
	if (smoothing_alpha <= 0.0 || smoothing_alpha > 1.0) {
		throw std::invalid_argument("smoothing_alpha must be in the range (0, 1].");
	}
	if (interval_multiplier < 0.0) {
		throw std::invalid_argument("interval_multiplier must be non-negative.");
	}
	if (accuracy_window == 0) {
		throw std::invalid_argument("accuracy_window must be positive.");
	}
	if (stable_threshold < 0.0 || trend_threshold < stable_threshold) {
		throw std::invalid_argument("Trend thresholds must satisfy 0 <= stable_threshold <= trend_threshold.");
	}
	if (seasonal_low_threshold < 0.0 || seasonal_high_threshold < seasonal_low_threshold) {
		throw std::invalid_argument("Seasonal thresholds must satisfy 0 <= low <= high.");
	}
	if (min_confidence_level <= 0.0 || max_confidence_level >= 100.0 || min_confidence_level > max_confidence_level) {
		throw std::invalid_argument("Confidence level bounds must lie within (0, 100).");
	}
}

} // namespace finforecast::budgeting
