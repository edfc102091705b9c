#include "fin-forecast/budgeting/aggregate_calculator.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace finforecast::budgeting {

core::Trend classifyTrend(double trend_percentage, const ForecastingConfig &config) {
	if (trend_percentage >= config.trend_threshold) {
		return core::Trend::Increasing;
	}
	if (trend_percentage <= -config.trend_threshold) {
		return core::Trend::Decreasing;
	}
	if (std::abs(trend_percentage) < config.stable_threshold) {
		return core::Trend::Stable;
	}
	return core::Trend::Volatile;
}

core::AggregateForecast calculateAggregate(const std::vector<core::Prediction> &predictions,
                                           const core::MonthlySeries &history, const ForecastingConfig &config) {
	if (predictions.empty()) {
		throw std::invalid_argument("Cannot aggregate an empty prediction set.");
	}

	core::AggregateForecast aggregate;
	for (const auto &prediction : predictions) {
		aggregate.total_predicted += prediction.predicted_amount;
	}
	aggregate.average_monthly = aggregate.total_predicted / static_cast<double>(predictions.size());

	const double historical_average = history.average();
	if (std::abs(historical_average) > std::numeric_limits<double>::epsilon()) {
		aggregate.trend_percentage = (aggregate.average_monthly - historical_average) / historical_average * 100.0;
	}
	aggregate.trend = classifyTrend(aggregate.trend_percentage, config);
	return aggregate;
}

} // namespace finforecast::budgeting
