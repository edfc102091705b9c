#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "fin-forecast/budgeting/advisor.hpp"
#include "common/monthly_helpers.hpp"

using namespace finforecast;
using budgeting::Advisor;

namespace {

core::AggregateForecast makeAggregate(core::Trend trend, double trend_percentage) {
	core::AggregateForecast aggregate;
	aggregate.total_predicted = 1200.0;
	aggregate.average_monthly = 1200.0;
	aggregate.trend = trend;
	aggregate.trend_percentage = trend_percentage;
	return aggregate;
}

core::Comparison withBudget(double budget, double total) {
	core::Comparison comparison;
	comparison.vs_budget.budget_amount = budget;
	comparison.vs_budget.forecast_vs_budget = total - budget;
	comparison.vs_budget.will_exceed = total > budget;
	return comparison;
}

} // namespace

TEST_CASE("Advisor recommends a budget increase when over budget", "[budgeting][advisor]") {
	const Advisor advisor;
	const auto aggregate = makeAggregate(core::Trend::Stable, 0.0);
	const auto comparison = withBudget(1000.0, 1200.0);

	const auto recommendations = advisor.recommend(aggregate, comparison);
	REQUIRE(recommendations.size() == 1);
	REQUIRE(recommendations[0].recommendation_type == core::RecommendationType::IncreaseBudget);
	REQUIRE(recommendations[0].priority == core::Priority::High);
	REQUIRE(recommendations[0].impact_amount.value() == Catch::Approx(200.0));
	REQUIRE(recommendations[0].description.find("$200.00") != std::string::npos);

	const auto now = tests::helpers::utcDate(2024, 6, 1);
	const auto alerts = advisor.alerts(aggregate, comparison, now);
	REQUIRE(alerts.size() == 1);
	REQUIRE(alerts[0].alert_type == core::AlertType::ForecastExceedsBudget);
	REQUIRE(alerts[0].severity == core::Severity::High);
	REQUIRE(alerts[0].message == "Your forecast indicates you will exceed your budget by $200.00");
	REQUIRE(alerts[0].triggered_at == now);
	REQUIRE_FALSE(alerts[0].acknowledged);
}

TEST_CASE("Advisor reacts to rising spending", "[budgeting][advisor]") {
	const Advisor advisor;
	const core::Comparison no_budget{};
	const auto now = tests::helpers::utcDate(2024, 6, 1);

	SECTION("moderate rise only reviews the category") {
		const auto aggregate = makeAggregate(core::Trend::Increasing, 16.0);
		const auto recommendations = advisor.recommend(aggregate, no_budget);
		REQUIRE(recommendations.size() == 1);
		REQUIRE(recommendations[0].recommendation_type == core::RecommendationType::ReviewCategory);
		REQUIRE(recommendations[0].priority == core::Priority::Medium);
		REQUIRE_FALSE(recommendations[0].impact_amount.has_value());
		REQUIRE(advisor.alerts(aggregate, no_budget, now).empty());
	}

	SECTION("large rise also raises a spike alert") {
		const auto aggregate = makeAggregate(core::Trend::Increasing, 25.0);
		REQUIRE(advisor.recommend(aggregate, no_budget).size() == 1);
		const auto alerts = advisor.alerts(aggregate, no_budget, now);
		REQUIRE(alerts.size() == 1);
		REQUIRE(alerts[0].alert_type == core::AlertType::UnusualSpike);
		REQUIRE(alerts[0].severity == core::Severity::Medium);
		REQUIRE(alerts[0].message == "Spending is projected to increase significantly by 25.0%");
	}

	SECTION("small rise produces nothing") {
		const auto aggregate = makeAggregate(core::Trend::Increasing, 12.0);
		REQUIRE(advisor.recommend(aggregate, no_budget).empty());
		REQUIRE(advisor.alerts(aggregate, no_budget, now).empty());
	}
}

TEST_CASE("Advisor suggests saving when spending falls", "[budgeting][advisor]") {
	const Advisor advisor;
	const auto aggregate = makeAggregate(core::Trend::Decreasing, -15.0);

	const auto with_budget = advisor.recommend(aggregate, withBudget(1500.0, 1200.0));
	REQUIRE(with_budget.size() == 1);
	REQUIRE(with_budget[0].recommendation_type == core::RecommendationType::SaveMore);
	REQUIRE(with_budget[0].priority == core::Priority::Low);
	REQUIRE(with_budget[0].impact_amount.value() == Catch::Approx(300.0));

	const auto without_budget = advisor.recommend(aggregate, core::Comparison{});
	REQUIRE(without_budget.size() == 1);
	REQUIRE_FALSE(without_budget[0].impact_amount.has_value());

	// Over budget wins over the savings suggestion.
	const auto over = advisor.recommend(aggregate, withBudget(1000.0, 1200.0));
	REQUIRE(over.size() == 1);
	REQUIRE(over[0].recommendation_type == core::RecommendationType::IncreaseBudget);
}
