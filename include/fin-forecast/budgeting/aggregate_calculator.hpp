#pragma once

#include "fin-forecast/budgeting/config.hpp"
#include "fin-forecast/core/budget_forecast.hpp"
#include "fin-forecast/core/monthly_series.hpp"

#include <vector>

namespace finforecast::budgeting {

/**
 * @brief Classifies a forecast-vs-history percentage.
 *
 * Checked in order: >= trend_threshold increasing, <= -trend_threshold decreasing,
 * |p| < stable_threshold stable, anything else volatile.
 */
core::Trend classifyTrend(double trend_percentage, const ForecastingConfig &config = {});

/**
 * @brief Totals the predictions and compares their monthly average with the history mean.
 *
 * A zero history mean gives a 0% trend.
 * @throws std::invalid_argument when there are no predictions.
 */
core::AggregateForecast calculateAggregate(const std::vector<core::Prediction> &predictions,
                                           const core::MonthlySeries &history,
                                           const ForecastingConfig &config = {});

} // namespace finforecast::budgeting
