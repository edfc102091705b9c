#pragma once

#include "fin-forecast/core/calendar.hpp"

#include <cstddef>
#include <vector>

namespace finforecast::core {

/**
 * @struct HistoricalPoint
 * @brief Total spend of one calendar month, dated at the first of the month.
 */
struct HistoricalPoint {
	TimePoint date;
	double amount = 0.0;
};

/**
 * @class MonthlySeries
 * @brief An ordered sequence of monthly spending totals.
 *
 * Dates are stored separately from amounts so models can work on the plain value
 * vector. Construction guarantees that months are strictly increasing and unique.
 */
class MonthlySeries {
public:
	MonthlySeries() = default;

	/**
	 * @throws std::invalid_argument If the sizes differ, months repeat or are out of order,
	 *         or an amount is not finite.
	 */
	MonthlySeries(std::vector<TimePoint> dates, std::vector<double> amounts);

	explicit MonthlySeries(const std::vector<HistoricalPoint> &points);

	const std::vector<TimePoint> &getDates() const {
		return dates_;
	}

	const std::vector<double> &getValues() const {
		return amounts_;
	}

	std::size_t size() const {
		return amounts_.size();
	}

	bool empty() const {
		return amounts_.empty();
	}

	HistoricalPoint at(std::size_t index) const;

	std::vector<HistoricalPoint> points() const;

	/// Mean of all amounts; 0 for an empty series.
	double average() const;

private:
	void validate() const;

	std::vector<TimePoint> dates_;
	std::vector<double> amounts_;
};

} // namespace finforecast::core
