#pragma once

#include "fin-forecast/budgeting/config.hpp"
#include "fin-forecast/core/budget_forecast.hpp"

#include <vector>

namespace finforecast::budgeting {

/**
 * @class Advisor
 * @brief Rule-based recommendations and alerts derived from a finished forecast.
 *
 * Pure functions of the aggregate and comparison; nothing is fetched.
 */
class Advisor {
public:
	explicit Advisor(ForecastingConfig config = {});

	std::vector<core::Recommendation> recommend(const core::AggregateForecast &aggregate,
	                                            const core::Comparison &comparison) const;

	/// Alerts are stamped with @p now and start unacknowledged.
	std::vector<core::Alert> alerts(const core::AggregateForecast &aggregate, const core::Comparison &comparison,
	                                const core::TimePoint &now) const;

private:
	ForecastingConfig config_;
};

} // namespace finforecast::budgeting
