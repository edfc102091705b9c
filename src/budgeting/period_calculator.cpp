#include "fin-forecast/budgeting/period_calculator.hpp"

namespace finforecast::budgeting {

namespace calendar = core::calendar;

ForecastWindows calculatePeriods(core::PeriodType period_type, const core::TimePoint &now) {
	ForecastWindows windows;
	windows.forecast_start = now;
	windows.historical_end = now;

	switch (period_type) {
	case core::PeriodType::Weekly:
		windows.forecast_end = calendar::addDays(now, 7);
		windows.historical_start = calendar::addDays(now, -90);
		break;
	case core::PeriodType::Quarterly:
		windows.forecast_end = calendar::addMonths(now, 3);
		windows.historical_start = calendar::addMonths(now, -24);
		break;
	case core::PeriodType::Yearly:
		windows.forecast_end = calendar::addMonths(now, 12);
		windows.historical_start = calendar::addMonths(now, -36);
		break;
	case core::PeriodType::Monthly:
		windows.forecast_end = calendar::addMonths(now, 1);
		windows.historical_start = calendar::addMonths(now, -12);
		break;
	}
	return windows;
}

std::vector<core::TimePoint> predictionDates(const ForecastWindows &windows) {
	std::vector<core::TimePoint> dates;
	// Offsets are applied to the start each time so end-of-month clamping does not accumulate.
	for (int step = 0;; ++step) {
		const auto date = calendar::addMonths(windows.forecast_start, step);
		if (step > 0 && !(date < windows.forecast_end)) {
			break;
		}
		dates.push_back(date);
	}
	return dates;
}

} // namespace finforecast::budgeting
