#pragma once

#include "fin-forecast/core/budget_forecast.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace finforecast::budgeting {

inline constexpr const char *kAllCategoriesLabel = "All Categories";

struct CategorySummary {
	std::string category;
	double predicted = 0.0;
	core::Trend trend = core::Trend::Stable;
	/// Null until the forecast has at least one tracked month.
	std::optional<double> accuracy;
};

struct AlertCounts {
	std::size_t critical = 0;
	std::size_t high = 0;
	std::size_t medium = 0;
	std::size_t low = 0;
	std::size_t total_unacknowledged = 0;
};

struct AccuracySummary {
	std::optional<double> overall;
	std::map<std::string, double> by_category;
};

struct DashboardSummary {
	std::size_t total_forecasts = 0;
	double total_predicted_spending = 0.0;
	std::vector<CategorySummary> categories;
	AlertCounts alerts;
	AccuracySummary accuracy;
};

/**
 * @brief Rolls the given forecasts up for the dashboard.
 *
 * Overall accuracy averages model_metadata.accuracy_score over forecasts with tracked
 * entries only; forecasts without any are left out rather than counted as zero.
 */
DashboardSummary summarizeForecasts(const std::vector<core::BudgetForecast> &forecasts);

} // namespace finforecast::budgeting
