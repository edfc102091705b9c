#pragma once

#include "fin-forecast/budgeting/accuracy_tracker.hpp"
#include "fin-forecast/budgeting/advisor.hpp"
#include "fin-forecast/budgeting/config.hpp"
#include "fin-forecast/budgeting/request.hpp"
#include "fin-forecast/budgeting/summary_aggregator.hpp"
#include "fin-forecast/core/budget_forecast.hpp"
#include "fin-forecast/seasonality/monthly_factors.hpp"
#include "fin-forecast/sources/collaborators.hpp"
#include "fin-forecast/storage/forecast_repository.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace finforecast::budgeting {

struct AlertView {
	std::string forecast_id;
	std::optional<std::string> category;
	std::size_t alert_index = 0;
	core::Alert alert;
};

struct TrendView {
	std::string category;
	core::Trend trend = core::Trend::Stable;
	double trend_percentage = 0.0;
	core::PeriodType period_type = core::PeriodType::Monthly;
};

struct SeasonalPatternReport {
	core::ForecastPeriod forecast_period;
	std::size_t months_observed = 0;
	std::vector<core::SeasonalFactor> seasonal_factors;
};

/**
 * @class ForecastingService
 * @brief Entry point of the budgeting engine used by the API layer.
 *
 * The service keeps no per-user state: every collaborator is passed in at construction
 * and every call works from what they return. Generation is all-or-nothing; the store
 * is written only after every stage has succeeded.
 */
class ForecastingService {
public:
	ForecastingService(sources::TransactionSource &transactions, sources::BudgetSource &budgets,
	                   sources::ActualSpendSource &actuals, storage::ForecastRepository &repository,
	                   ForecastingConfig config = {}, core::Clock clock = core::systemClock());

	/**
	 * @brief Fits the requested model on the user's monthly history and stores the result.
	 * @throws core::InvalidRequestError for a confidence level outside the configured range.
	 * @throws core::InsufficientHistoryError when fewer than the minimum months exist.
	 */
	core::BudgetForecast generateForecast(const std::string &user_id, const ForecastRequest &request);

	/// @throws core::NotFoundError when absent or owned by another user.
	core::BudgetForecast getForecastById(const std::string &forecast_id, const std::string &user_id);

	std::vector<core::BudgetForecast> getUserForecasts(const std::string &user_id, const ForecastFilter &filter = {});

	AccuracyUpdateSummary updateForecastAccuracy(const std::string &user_id);

	/// Summary over active forecasts whose window contains the current time.
	DashboardSummary getForecastSummary(const std::string &user_id);

	/**
	 * @throws core::NotFoundError when the forecast is not the user's.
	 * @throws std::out_of_range when @p alert_index is not an alert of the forecast.
	 */
	core::BudgetForecast acknowledgeAlert(const std::string &forecast_id, const std::string &user_id,
	                                      std::size_t alert_index);

	/// Unacknowledged alerts of active forecasts, most severe first, then newest first.
	std::vector<AlertView> getUnacknowledgedAlerts(const std::string &user_id,
	                                               std::optional<core::Severity> severity = std::nullopt);

	std::vector<TrendView> getSpendingTrends(const std::string &user_id);

	/// Seasonal factors over the yearly lookback window; nothing is stored.
	SeasonalPatternReport analyzeSeasonalPatterns(const std::string &user_id,
	                                              const std::optional<std::string> &category = std::nullopt);

	const ForecastingConfig &config() const {
		return config_;
	}

private:
	void validateRequest(const ForecastRequest &request) const;

	sources::TransactionSource &transactions_;
	sources::BudgetSource &budgets_;
	sources::ActualSpendSource &actuals_;
	storage::ForecastRepository &repository_;
	ForecastingConfig config_;
	core::Clock clock_;
	Advisor advisor_;
	seasonality::MonthlyFactorDetector seasonal_detector_;
};

} // namespace finforecast::budgeting
