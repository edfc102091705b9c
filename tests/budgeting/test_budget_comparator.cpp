#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "fin-forecast/budgeting/budget_comparator.hpp"
#include "fin-forecast/core/errors.hpp"
#include "common/fake_sources.hpp"
#include "common/monthly_helpers.hpp"

#include <limits>

using namespace finforecast;
using budgeting::BudgetComparator;

namespace {

core::AggregateForecast makeAggregate(double total, double average) {
	core::AggregateForecast aggregate;
	aggregate.total_predicted = total;
	aggregate.average_monthly = average;
	return aggregate;
}

} // namespace

TEST_CASE("Budget comparison flags overspend", "[budgeting][comparator]") {
	const auto comparison = BudgetComparator::compareToBudget(sources::Budget{1000.0}, 1200.0);
	REQUIRE(comparison.budget_amount.value() == Catch::Approx(1000.0));
	REQUIRE(comparison.forecast_vs_budget.value() == Catch::Approx(200.0));
	REQUIRE(comparison.will_exceed);
}

TEST_CASE("Budget comparison at or under budget does not exceed", "[budgeting][comparator]") {
	const auto exact = BudgetComparator::compareToBudget(sources::Budget{1000.0}, 1000.0);
	REQUIRE(exact.forecast_vs_budget.value() == Catch::Approx(0.0));
	REQUIRE_FALSE(exact.will_exceed);

	const auto under = BudgetComparator::compareToBudget(sources::Budget{1000.0}, 700.0);
	REQUIRE(under.forecast_vs_budget.value() == Catch::Approx(-300.0));
	REQUIRE_FALSE(under.will_exceed);
}

TEST_CASE("Budget comparison without a budget is empty", "[budgeting][comparator]") {
	const auto comparison = BudgetComparator::compareToBudget(std::nullopt, 1200.0);
	REQUIRE_FALSE(comparison.budget_amount.has_value());
	REQUIRE_FALSE(comparison.forecast_vs_budget.has_value());
	REQUIRE_FALSE(comparison.will_exceed);

	REQUIRE_THROWS_AS(
	    BudgetComparator::compareToBudget(sources::Budget{std::numeric_limits<double>::quiet_NaN()}, 10.0),
	    core::UpstreamDataError);
}

TEST_CASE("Comparison against the last historical month", "[budgeting][comparator]") {
	const auto history = tests::helpers::makeMonthlySeries({100.0, 200.0});
	const auto last = BudgetComparator::compareToLastPeriod(makeAggregate(250.0, 250.0), history);
	REQUIRE(last.has_value());
	REQUIRE(last->amount_change == Catch::Approx(50.0));
	REQUIRE(last->percentage_change == Catch::Approx(25.0));

	const auto zero = BudgetComparator::compareToLastPeriod(makeAggregate(50.0, 50.0),
	                                                        tests::helpers::makeMonthlySeries({10.0, 0.0}));
	REQUIRE(zero->percentage_change == Catch::Approx(0.0));

	REQUIRE_FALSE(BudgetComparator::compareToLastPeriod(makeAggregate(1.0, 1.0), core::MonthlySeries{}).has_value());
}

TEST_CASE("Comparator looks up the budget for the same scope", "[budgeting][comparator]") {
	tests::fakes::FakeBudgetSource budgets;
	budgets.set("alice", "food", 300.0);
	budgets.set("alice", "", 2000.0);
	const BudgetComparator comparator(budgets);
	const auto history = tests::helpers::makeMonthlySeries({100.0, 100.0, 100.0});

	const auto food = comparator.compare("alice", std::string("food"), makeAggregate(360.0, 120.0), history);
	REQUIRE(food.vs_budget.budget_amount.value() == Catch::Approx(300.0));
	REQUIRE(food.vs_budget.will_exceed);
	REQUIRE(food.vs_last_period.has_value());

	const auto overall = comparator.compare("alice", std::nullopt, makeAggregate(360.0, 120.0), history);
	REQUIRE(overall.vs_budget.budget_amount.value() == Catch::Approx(2000.0));
	REQUIRE_FALSE(overall.vs_budget.will_exceed);

	const auto none = comparator.compare("bob", std::nullopt, makeAggregate(360.0, 120.0), history);
	REQUIRE_FALSE(none.vs_budget.budget_amount.has_value());
}
