#include "fin-forecast/budgeting/budget_comparator.hpp"

#include "fin-forecast/core/errors.hpp"
#include "fin-forecast/utils/logging.hpp"

#include <cmath>
#include <limits>

namespace finforecast::budgeting {

BudgetComparator::BudgetComparator(sources::BudgetSource &budgets) : budgets_(budgets) {
}

core::BudgetComparison BudgetComparator::compareToBudget(const std::optional<sources::Budget> &budget,
                                                         double total_predicted) {
	core::BudgetComparison comparison;
	if (!budget) {
		return comparison;
	}
	if (!std::isfinite(budget->amount)) {
		throw core::UpstreamDataError("Budget source returned a non-finite amount.");
	}
	comparison.budget_amount = budget->amount;
	comparison.forecast_vs_budget = total_predicted - budget->amount;
	comparison.will_exceed = *comparison.forecast_vs_budget > 0.0;
	return comparison;
}

std::optional<core::PeriodComparison> BudgetComparator::compareToLastPeriod(const core::AggregateForecast &aggregate,
                                                                            const core::MonthlySeries &history) {
	if (history.empty()) {
		return std::nullopt;
	}
	const double last_amount = history.getValues().back();
	core::PeriodComparison comparison;
	comparison.amount_change = aggregate.average_monthly - last_amount;
	if (std::abs(last_amount) > std::numeric_limits<double>::epsilon()) {
		comparison.percentage_change = comparison.amount_change / last_amount * 100.0;
	}
	return comparison;
}

core::Comparison BudgetComparator::compare(const std::string &user_id, const std::optional<std::string> &category,
                                           const core::AggregateForecast &aggregate,
                                           const core::MonthlySeries &history) const {
	core::Comparison comparison;
	const auto budget = budgets_.fetchActiveBudget(user_id, category);
	comparison.vs_budget = compareToBudget(budget, aggregate.total_predicted);
	comparison.vs_last_period = compareToLastPeriod(aggregate, history);

	if (comparison.vs_budget.will_exceed) {
		FINFORECAST_INFO("Forecast for user {} exceeds budget by {:.2f}.", user_id,
		                 *comparison.vs_budget.forecast_vs_budget);
	}
	return comparison;
}

} // namespace finforecast::budgeting
