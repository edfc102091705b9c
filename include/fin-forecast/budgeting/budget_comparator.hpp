#pragma once

#include "fin-forecast/core/budget_forecast.hpp"
#include "fin-forecast/core/monthly_series.hpp"
#include "fin-forecast/sources/collaborators.hpp"

#include <optional>
#include <string>

namespace finforecast::budgeting {

class BudgetComparator {
public:
	explicit BudgetComparator(sources::BudgetSource &budgets);

	/// Looks up the active budget for the same scope and compares the forecast against it.
	core::Comparison compare(const std::string &user_id, const std::optional<std::string> &category,
	                         const core::AggregateForecast &aggregate, const core::MonthlySeries &history) const;

	/// Absent budget yields {null, null, false}.
	static core::BudgetComparison compareToBudget(const std::optional<sources::Budget> &budget,
	                                              double total_predicted);

	/// Forecast monthly average against the most recent historical month.
	static std::optional<core::PeriodComparison> compareToLastPeriod(const core::AggregateForecast &aggregate,
	                                                                 const core::MonthlySeries &history);

private:
	sources::BudgetSource &budgets_;
};

} // namespace finforecast::budgeting
