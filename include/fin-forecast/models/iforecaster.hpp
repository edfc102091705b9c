#pragma once

#include "fin-forecast/core/enums.hpp"
#include "fin-forecast/core/forecast.hpp"
#include "fin-forecast/core/monthly_series.hpp"
#include "fin-forecast/utils/metrics.hpp"
#include <memory>
#include <string>

namespace finforecast::models {

/// Two-sided 95% normal quantile used for every confidence band.
inline constexpr double kDefaultIntervalMultiplier = 1.96;

/**
 * @class IForecaster
 * @brief An interface for the monthly spending forecasters.
 *
 * Implementations fit on a monthly series, then emit one point prediction and one
 * interval per future month. All of them are deterministic closed-form fits.
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the monthly spending totals.
	 * @param series The history to train on.
	 */
	virtual void fit(const core::MonthlySeries &series) = 0;

	/**
	 * @brief Generates forecasts for a number of future months.
	 * @param horizon The number of months to predict.
	 * @return A Forecast with point predictions and lower/upper bounds.
	 */
	virtual core::Forecast predict(int horizon) = 0;

	/**
	 * @brief In-sample fit statistics from the last call to fit().
	 */
	virtual utils::FitQuality fitQuality() const = 0;

	virtual core::Algorithm algorithm() const = 0;

	/**
	 * @brief Gets the name of the forecasting model (e.g. "MovingAverage").
	 */
	virtual std::string getName() const = 0;
};

} // namespace finforecast::models
