#pragma once

#include "fin-forecast/core/calendar.hpp"

#include <optional>
#include <string>
#include <vector>

namespace finforecast::sources {

struct Transaction {
	core::TimePoint date;
	double amount = 0.0;
};

struct Budget {
	double amount = 0.0;
};

/**
 * @class TransactionSource
 * @brief Read access to a user's recorded expenses.
 *
 * Implementations report failures by throwing (typically core::UpstreamDataError);
 * the engine lets those exceptions propagate unchanged.
 */
class TransactionSource {
public:
	virtual ~TransactionSource() = default;

	/// Expenses dated within [start, end], restricted to @p category when given.
	virtual std::vector<Transaction> fetchTransactions(const std::string &user_id,
	                                                   const std::optional<std::string> &category,
	                                                   const core::TimePoint &start,
	                                                   const core::TimePoint &end) = 0;
};

class BudgetSource {
public:
	virtual ~BudgetSource() = default;

	/// The user's active budget for the category, or the overall budget when no category is given.
	virtual std::optional<Budget> fetchActiveBudget(const std::string &user_id,
	                                                const std::optional<std::string> &category) = 0;
};

class ActualSpendSource {
public:
	virtual ~ActualSpendSource() = default;

	/// Realised spend within [month_start, month_end]; nullopt when nothing was recorded yet.
	virtual std::optional<double> fetchActualSpending(const std::string &user_id,
	                                                  const std::optional<std::string> &category,
	                                                  const core::TimePoint &month_start,
	                                                  const core::TimePoint &month_end) = 0;
};

} // namespace finforecast::sources
