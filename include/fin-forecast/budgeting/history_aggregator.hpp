#pragma once

#include "fin-forecast/core/monthly_series.hpp"
#include "fin-forecast/sources/collaborators.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace finforecast::budgeting {

/**
 * @class HistoryAggregator
 * @brief Turns a user's raw transactions into calendar-month spending totals.
 *
 * History is always bucketed by calendar month, whatever the requested period type;
 * a weekly forecast therefore still fits on monthly totals.
 */
class HistoryAggregator {
public:
	HistoryAggregator(sources::TransactionSource &transactions, std::size_t min_months = 3);

	/**
	 * @brief Fetches and groups the window's transactions.
	 * @throws core::InsufficientHistoryError when fewer than the minimum months are present.
	 * @throws core::UpstreamDataError when the source returns a non-finite amount.
	 */
	core::MonthlySeries aggregate(const std::string &user_id, const std::optional<std::string> &category,
	                              const core::TimePoint &start, const core::TimePoint &end) const;

	/// Sums transactions within [start, end] per calendar month, ascending.
	static core::MonthlySeries groupByMonth(const std::vector<sources::Transaction> &transactions,
	                                        const core::TimePoint &start, const core::TimePoint &end);

private:
	sources::TransactionSource &transactions_;
	std::size_t min_months_;
};

} // namespace finforecast::budgeting
