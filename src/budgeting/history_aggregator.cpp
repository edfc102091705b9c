#include "fin-forecast/budgeting/history_aggregator.hpp"

#include "fin-forecast/core/errors.hpp"
#include "fin-forecast/utils/logging.hpp"

#include <cmath>
#include <map>

namespace finforecast::budgeting {

HistoryAggregator::HistoryAggregator(sources::TransactionSource &transactions, std::size_t min_months)
    : transactions_(transactions), min_months_(min_months) {
}

core::MonthlySeries HistoryAggregator::groupByMonth(const std::vector<sources::Transaction> &transactions,
                                                    const core::TimePoint &start, const core::TimePoint &end) {
	std::map<core::YearMonth, double> totals;
	for (const auto &transaction : transactions) {
		if (transaction.date < start || transaction.date > end) {
			continue;
		}
		if (!std::isfinite(transaction.amount)) {
			throw core::UpstreamDataError("Transaction source returned a non-finite amount.");
		}
		totals[core::calendar::yearMonthOf(transaction.date)] += transaction.amount;
	}

	std::vector<core::TimePoint> dates;
	std::vector<double> amounts;
	dates.reserve(totals.size());
	amounts.reserve(totals.size());
	for (const auto &entry : totals) {
		dates.push_back(core::calendar::startOfMonth(entry.first));
		amounts.push_back(entry.second);
	}
	return core::MonthlySeries(std::move(dates), std::move(amounts));
}

core::MonthlySeries HistoryAggregator::aggregate(const std::string &user_id,
                                                 const std::optional<std::string> &category,
                                                 const core::TimePoint &start, const core::TimePoint &end) const {
	const auto transactions = transactions_.fetchTransactions(user_id, category, start, end);
	auto series = groupByMonth(transactions, start, end);

	FINFORECAST_DEBUG("Aggregated {} transactions into {} months for user {}.", transactions.size(), series.size(),
	                  user_id);

	if (series.size() < min_months_) {
		throw core::InsufficientHistoryError(series.size(), min_months_);
	}
	return series;
}

} // namespace finforecast::budgeting
