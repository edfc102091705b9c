#include "fin-forecast/core/calendar.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace finforecast::core {

namespace {

constexpr std::int64_t kSecondsPerDay = 24 * 60 * 60;

std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
	std::int64_t q = a / b;
	if ((a % b != 0) && ((a < 0) != (b < 0))) {
		--q;
	}
	return q;
}

std::int64_t dayKey(const TimePoint &tp) {
	const auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
	return floorDiv(secs, kSecondsPerDay);
}

} // namespace

std::string YearMonth::toString() const {
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02d", year, month);
	return buffer;
}

namespace calendar {

// Proleptic Gregorian day count relative to 1970-01-01.
std::int64_t daysFromCivil(int year, int month, int day) {
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be in the range 1-12.");
	}
	const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
	const std::int64_t era = floorDiv(y, 400);
	const std::int64_t yoe = y - era * 400;
	const std::int64_t mp = (month + 9) % 12;
	const std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
	const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + doe - 719468;
}

CivilDate civilFromDays(std::int64_t days) {
	const std::int64_t z = days + 719468;
	const std::int64_t era = floorDiv(z, 146097);
	const std::int64_t doe = z - era * 146097;
	const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const std::int64_t mp = (5 * doy + 2) / 153;
	const std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
	const std::int64_t m = mp < 10 ? mp + 3 : mp - 9;
	const std::int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
	return CivilDate{static_cast<int>(y), static_cast<int>(m), static_cast<int>(d)};
}

int daysInMonth(int year, int month) {
	static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be in the range 1-12.");
	}
	if (month == 2) {
		const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
		return leap ? 29 : 28;
	}
	return kDays[month - 1];
}

TimePoint fromCivil(int year, int month, int day) {
	const auto days = daysFromCivil(year, month, day);
	return TimePoint{} + std::chrono::seconds{days * kSecondsPerDay};
}

CivilDate toCivil(const TimePoint &tp) {
	return civilFromDays(dayKey(tp));
}

YearMonth yearMonthOf(const TimePoint &tp) {
	const auto civil = toCivil(tp);
	return YearMonth{civil.year, civil.month};
}

TimePoint startOfMonth(const YearMonth &ym) {
	return fromCivil(ym.year, ym.month, 1);
}

TimePoint startOfMonth(const TimePoint &tp) {
	return startOfMonth(yearMonthOf(tp));
}

TimePoint endOfMonth(const YearMonth &ym) {
	const auto last_day = fromCivil(ym.year, ym.month, daysInMonth(ym.year, ym.month));
	return last_day + std::chrono::hours{24} - std::chrono::milliseconds{1};
}

TimePoint addDays(const TimePoint &tp, int days) {
	return tp + std::chrono::seconds{static_cast<std::int64_t>(days) * kSecondsPerDay};
}

TimePoint addMonths(const TimePoint &tp, int months) {
	const auto day_start = TimePoint{} + std::chrono::seconds{dayKey(tp) * kSecondsPerDay};
	const auto time_of_day = tp - day_start;

	const auto civil = toCivil(tp);
	const std::int64_t total = static_cast<std::int64_t>(civil.year) * 12 + (civil.month - 1) + months;
	const int year = static_cast<int>(floorDiv(total, 12));
	const int month = static_cast<int>(total - static_cast<std::int64_t>(year) * 12) + 1;
	const int day = std::min(civil.day, daysInMonth(year, month));

	return fromCivil(year, month, day) + time_of_day;
}

bool sameMonth(const TimePoint &a, const TimePoint &b) {
	return yearMonthOf(a) == yearMonthOf(b);
}

} // namespace calendar

} // namespace finforecast::core
