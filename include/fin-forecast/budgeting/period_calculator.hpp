#pragma once

#include "fin-forecast/core/calendar.hpp"
#include "fin-forecast/core/enums.hpp"

#include <vector>

namespace finforecast::budgeting {

struct ForecastWindows {
	core::TimePoint forecast_start;
	core::TimePoint forecast_end;
	core::TimePoint historical_start;
	core::TimePoint historical_end;
};

/**
 * @brief Forecast and lookback windows for a period type, anchored at @p now.
 *
 * weekly: +7 days / -90 days, monthly: +1 / -12 months, quarterly: +3 / -24 months,
 * yearly: +12 / -36 months.
 */
ForecastWindows calculatePeriods(core::PeriodType period_type, const core::TimePoint &now);

/**
 * @brief Dates of the monthly prediction steps: forecast_start plus k months while
 *        before forecast_end. Always at least one step.
 */
std::vector<core::TimePoint> predictionDates(const ForecastWindows &windows);

} // namespace finforecast::budgeting
