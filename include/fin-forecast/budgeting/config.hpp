#pragma once

#include "fin-forecast/models/model_factory.hpp"

#include <cstddef>

namespace finforecast::budgeting {

/**
 * @struct ForecastingConfig
 * @brief Tunables of the budgeting pipeline. The defaults reproduce the documented rules.
 */
struct ForecastingConfig {
	/// Months of history below which generation fails. Never lower than 3.
	std::size_t min_history_months = 3;

	int moving_average_window = 3;
	double smoothing_alpha = 0.3;
	double interval_multiplier = 1.96;

	/// Tracked entries averaged into accuracy_score.
	std::size_t accuracy_window = 10;

	/// |trend %| at or beyond which the forecast is increasing/decreasing.
	double trend_threshold = 10.0;
	/// |trend %| below which the forecast is stable.
	double stable_threshold = 5.0;

	double review_category_threshold = 15.0;
	double unusual_spike_threshold = 20.0;

	double seasonal_high_threshold = 1.2;
	double seasonal_low_threshold = 0.8;

	double min_confidence_level = 80.0;
	double max_confidence_level = 99.0;

	/// @throws std::invalid_argument when a value is out of range.
	void validate() const;

	models::ModelSettings modelSettings() const {
		models::ModelSettings settings;
		settings.moving_average_window = moving_average_window;
		settings.smoothing_alpha = smoothing_alpha;
		settings.interval_multiplier = interval_multiplier;
		return settings;
	}
};

} // namespace finforecast::budgeting
