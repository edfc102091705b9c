#include "fin-forecast/budgeting/summary_aggregator.hpp"

namespace finforecast::budgeting {

DashboardSummary summarizeForecasts(const std::vector<core::BudgetForecast> &forecasts) {
	DashboardSummary summary;
	summary.total_forecasts = forecasts.size();

	double accuracy_total = 0.0;
	std::size_t accuracy_count = 0;

	for (const auto &forecast : forecasts) {
		const auto &aggregate = forecast.aggregate_forecast;
		summary.total_predicted_spending += aggregate.total_predicted;

		std::optional<double> accuracy;
		if (!forecast.accuracy_tracking.empty()) {
			accuracy = forecast.model_metadata.accuracy_score;
		}

		CategorySummary row;
		row.category = forecast.category.value_or(kAllCategoriesLabel);
		row.predicted = aggregate.total_predicted;
		row.trend = aggregate.trend;
		row.accuracy = accuracy;
		summary.categories.push_back(std::move(row));

		for (const auto &alert : forecast.alerts) {
			if (alert.acknowledged) {
				continue;
			}
			++summary.alerts.total_unacknowledged;
			switch (alert.severity) {
			case core::Severity::Critical:
				++summary.alerts.critical;
				break;
			case core::Severity::High:
				++summary.alerts.high;
				break;
			case core::Severity::Medium:
				++summary.alerts.medium;
				break;
			case core::Severity::Low:
				++summary.alerts.low;
				break;
			}
		}

		if (accuracy) {
			accuracy_total += *accuracy;
			++accuracy_count;
			if (forecast.category) {
				summary.accuracy.by_category[*forecast.category] = *accuracy;
			}
		}
	}

	if (accuracy_count > 0) {
		summary.accuracy.overall = accuracy_total / static_cast<double>(accuracy_count);
	}
	return summary;
}

} // namespace finforecast::budgeting
