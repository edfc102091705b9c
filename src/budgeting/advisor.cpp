#include "fin-forecast/budgeting/advisor.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace finforecast::budgeting {

Advisor::Advisor(ForecastingConfig config) : config_(config) {
}

std::vector<core::Recommendation> Advisor::recommend(const core::AggregateForecast &aggregate,
                                                     const core::Comparison &comparison) const {
	std::vector<core::Recommendation> recommendations;
	const auto &vs_budget = comparison.vs_budget;

	if (vs_budget.will_exceed && vs_budget.forecast_vs_budget) {
		const double exceeded_by = *vs_budget.forecast_vs_budget;
		core::Recommendation recommendation;
		recommendation.recommendation_type = core::RecommendationType::IncreaseBudget;
		recommendation.title = "Budget Increase Recommended";
		recommendation.description =
		    fmt::format("Forecast indicates spending will exceed budget by ${:.2f}. Consider increasing budget or "
		                "reducing spending.",
		                exceeded_by);
		recommendation.impact_amount = exceeded_by;
		recommendation.priority = core::Priority::High;
		recommendations.push_back(std::move(recommendation));
	}

	if (aggregate.trend == core::Trend::Increasing && aggregate.trend_percentage > config_.review_category_threshold) {
		core::Recommendation recommendation;
		recommendation.recommendation_type = core::RecommendationType::ReviewCategory;
		recommendation.title = "Rising Spending Trend Detected";
		recommendation.description = fmt::format(
		    "Spending is projected to increase by {:.1f}%. Review expenses to identify cost-saving opportunities.",
		    aggregate.trend_percentage);
		recommendation.priority = core::Priority::Medium;
		recommendations.push_back(std::move(recommendation));
	}

	if (aggregate.trend == core::Trend::Decreasing && !vs_budget.will_exceed) {
		core::Recommendation recommendation;
		recommendation.recommendation_type = core::RecommendationType::SaveMore;
		recommendation.title = "Savings Opportunity";
		if (vs_budget.forecast_vs_budget) {
			const double savings = std::abs(*vs_budget.forecast_vs_budget);
			recommendation.impact_amount = savings;
			recommendation.description = fmt::format(
			    "Spending is decreasing. Consider allocating ${:.2f} to savings or investments.", savings);
		} else {
			recommendation.description =
			    "Spending is decreasing. Consider allocating the difference to savings or investments.";
		}
		recommendation.priority = core::Priority::Low;
		recommendations.push_back(std::move(recommendation));
	}

	return recommendations;
}

std::vector<core::Alert> Advisor::alerts(const core::AggregateForecast &aggregate, const core::Comparison &comparison,
                                         const core::TimePoint &now) const {
	std::vector<core::Alert> alerts;
	const auto &vs_budget = comparison.vs_budget;

	if (vs_budget.will_exceed && vs_budget.forecast_vs_budget) {
		core::Alert alert;
		alert.alert_type = core::AlertType::ForecastExceedsBudget;
		alert.severity = core::Severity::High;
		alert.message =
		    fmt::format("Your forecast indicates you will exceed your budget by ${:.2f}", *vs_budget.forecast_vs_budget);
		alert.triggered_at = now;
		alerts.push_back(std::move(alert));
	}

	// Independent of the review threshold: a large rise yields both a recommendation and an alert.
	if (aggregate.trend == core::Trend::Increasing && aggregate.trend_percentage > config_.unusual_spike_threshold) {
		core::Alert alert;
		alert.alert_type = core::AlertType::UnusualSpike;
		alert.severity = core::Severity::Medium;
		alert.message = fmt::format("Spending is projected to increase significantly by {:.1f}%",
		                            aggregate.trend_percentage);
		alert.triggered_at = now;
		alerts.push_back(std::move(alert));
	}

	return alerts;
}

} // namespace finforecast::budgeting
