#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace finforecast::core {

using TimePoint = std::chrono::system_clock::time_point;

/// Source of "now"; injected so expiry and tracking can be tested against fixed dates.
using Clock = std::function<TimePoint()>;

inline Clock systemClock() {
	return [] { return std::chrono::system_clock::now(); };
}

/**
 * @struct YearMonth
 * @brief Calendar month key used to bucket spending; months are 1-based.
 */
struct YearMonth {
	int year = 1970;
	int month = 1;

	bool operator==(const YearMonth &other) const {
		return year == other.year && month == other.month;
	}
	bool operator!=(const YearMonth &other) const {
		return !(*this == other);
	}
	bool operator<(const YearMonth &other) const {
		return year != other.year ? year < other.year : month < other.month;
	}

	/// Formats as "YYYY-MM".
	std::string toString() const;
};

struct CivilDate {
	int year = 1970;
	int month = 1;
	int day = 1;
};

/**
 * Calendar arithmetic on system_clock time points. All conversions use UTC so that
 * month bucketing does not depend on the host time zone.
 */
namespace calendar {

std::int64_t daysFromCivil(int year, int month, int day);
CivilDate civilFromDays(std::int64_t days);

int daysInMonth(int year, int month);

/// Midnight UTC of the given civil date.
TimePoint fromCivil(int year, int month, int day);
CivilDate toCivil(const TimePoint &tp);

YearMonth yearMonthOf(const TimePoint &tp);
TimePoint startOfMonth(const YearMonth &ym);
TimePoint startOfMonth(const TimePoint &tp);
/// Last millisecond of the month, matching an inclusive upper bound.
TimePoint endOfMonth(const YearMonth &ym);

TimePoint addDays(const TimePoint &tp, int days);
/// Adds calendar months, keeping the time of day and clamping the day to the target month length.
TimePoint addMonths(const TimePoint &tp, int months);

bool sameMonth(const TimePoint &a, const TimePoint &b);

} // namespace calendar

} // namespace finforecast::core
