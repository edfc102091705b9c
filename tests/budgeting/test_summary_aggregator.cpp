#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "fin-forecast/budgeting/summary_aggregator.hpp"
#include "common/monthly_helpers.hpp"

using namespace finforecast;
using budgeting::summarizeForecasts;
using tests::helpers::utcDate;

namespace {

core::BudgetForecast makeForecast(std::optional<std::string> category, double total, core::Trend trend) {
	core::BudgetForecast forecast;
	forecast.user_id = "alice";
	forecast.category = std::move(category);
	forecast.aggregate_forecast.total_predicted = total;
	forecast.aggregate_forecast.trend = trend;
	forecast.model_metadata.accuracy_score = 75.0;
	return forecast;
}

core::Alert makeAlert(core::Severity severity, bool acknowledged = false) {
	core::Alert alert;
	alert.severity = severity;
	alert.acknowledged = acknowledged;
	return alert;
}

} // namespace

TEST_CASE("Summary of no forecasts is empty", "[budgeting][summary]") {
	const auto summary = summarizeForecasts({});
	REQUIRE(summary.total_forecasts == 0);
	REQUIRE(summary.total_predicted_spending == Catch::Approx(0.0));
	REQUIRE(summary.categories.empty());
	REQUIRE(summary.alerts.total_unacknowledged == 0);
	REQUIRE_FALSE(summary.accuracy.overall.has_value());
}

TEST_CASE("Summary totals spending and labels categories", "[budgeting][summary]") {
	const std::vector<core::BudgetForecast> forecasts{
	    makeForecast(std::string("food"), 300.0, core::Trend::Increasing),
	    makeForecast(std::nullopt, 1500.0, core::Trend::Stable),
	};
	const auto summary = summarizeForecasts(forecasts);

	REQUIRE(summary.total_forecasts == 2);
	REQUIRE(summary.total_predicted_spending == Catch::Approx(1800.0));
	REQUIRE(summary.categories.size() == 2);
	REQUIRE(summary.categories[0].category == "food");
	REQUIRE(summary.categories[0].trend == core::Trend::Increasing);
	REQUIRE(summary.categories[1].category == budgeting::kAllCategoriesLabel);
}

TEST_CASE("Summary accuracy only counts tracked forecasts", "[budgeting][summary][accuracy]") {
	auto tracked = makeForecast(std::string("food"), 300.0, core::Trend::Stable);
	tracked.trackAccuracy(utcDate(2024, 1, 10), 100.0, 110.0, utcDate(2024, 2, 1));
	auto other = makeForecast(std::string("rent"), 900.0, core::Trend::Stable);
	other.trackAccuracy(utcDate(2024, 1, 10), 100.0, 70.0, utcDate(2024, 2, 1));
	const auto untracked = makeForecast(std::string("fun"), 50.0, core::Trend::Stable);

	const auto summary = summarizeForecasts({tracked, other, untracked});
	REQUIRE(summary.accuracy.overall.value() == Catch::Approx(80.0));
	REQUIRE(summary.accuracy.by_category.size() == 2);
	REQUIRE(summary.accuracy.by_category.at("food") == Catch::Approx(90.0));
	REQUIRE(summary.accuracy.by_category.at("rent") == Catch::Approx(70.0));
	REQUIRE(summary.categories[0].accuracy.value() == Catch::Approx(90.0));
	REQUIRE_FALSE(summary.categories[2].accuracy.has_value());
}

TEST_CASE("Summary counts unacknowledged alerts by severity", "[budgeting][summary][alerts]") {
	auto first = makeForecast(std::string("food"), 300.0, core::Trend::Stable);
	first.alerts = {makeAlert(core::Severity::High), makeAlert(core::Severity::Medium),
	                makeAlert(core::Severity::Critical, true)};
	auto second = makeForecast(std::nullopt, 300.0, core::Trend::Stable);
	second.alerts = {makeAlert(core::Severity::High), makeAlert(core::Severity::Low)};

	const auto summary = summarizeForecasts({first, second});
	REQUIRE(summary.alerts.critical == 0);
	REQUIRE(summary.alerts.high == 2);
	REQUIRE(summary.alerts.medium == 1);
	REQUIRE(summary.alerts.low == 1);
	REQUIRE(summary.alerts.total_unacknowledged == 4);
}
