#include "fin-forecast/budgeting/forecasting_service.hpp"

#include "fin-forecast/budgeting/aggregate_calculator.hpp"
#include "fin-forecast/budgeting/budget_comparator.hpp"
#include "fin-forecast/budgeting/history_aggregator.hpp"
#include "fin-forecast/budgeting/period_calculator.hpp"
#include "fin-forecast/core/errors.hpp"
#include "fin-forecast/models/model_factory.hpp"
#include "fin-forecast/utils/logging.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace finforecast::budgeting {

namespace {

std::vector<core::Prediction> buildPredictions(const std::vector<core::TimePoint> &dates, const core::Forecast &raw,
                                               double confidence_level) {
	if (raw.horizon() != dates.size() || !raw.hasIntervals()) {
		throw core::ForecastError("Model output does not cover the forecast window.");
	}
	const auto &lower = raw.lowerSeries();
	const auto &upper = raw.upperSeries();

	std::vector<core::Prediction> predictions;
	predictions.reserve(dates.size());
	for (std::size_t i = 0; i < dates.size(); ++i) {
		if (!std::isfinite(raw.point[i]) || !std::isfinite(lower[i]) || !std::isfinite(upper[i])) {
			throw core::ForecastError("Model produced a non-finite prediction.");
		}
		core::Prediction prediction;
		prediction.date = dates[i];
		prediction.predicted_amount = raw.point[i];
		prediction.confidence_lower = std::min(lower[i], raw.point[i]);
		prediction.confidence_upper = std::max(upper[i], raw.point[i]);
		prediction.confidence_level = confidence_level;
		predictions.push_back(prediction);
	}
	return predictions;
}

} // namespace

ForecastingService::ForecastingService(sources::TransactionSource &transactions, sources::BudgetSource &budgets,
                                       sources::ActualSpendSource &actuals, storage::ForecastRepository &repository,
                                       ForecastingConfig config, core::Clock clock)
    : transactions_(transactions), budgets_(budgets), actuals_(actuals), repository_(repository),
      config_(config), clock_(std::move(clock)), advisor_(config),
      seasonal_detector_(seasonality::MonthlyFactorDetector::builder()
                             .highThreshold(config.seasonal_high_threshold)
                             .lowThreshold(config.seasonal_low_threshold)
                             .build()) {
	config_.validate();
	if (!clock_) {
		throw std::invalid_argument("ForecastingService requires a clock.");
	}
}

void ForecastingService::validateRequest(const ForecastRequest &request) const {
	if (!std::isfinite(request.confidence_level) || request.confidence_level < config_.min_confidence_level ||
	    request.confidence_level > config_.max_confidence_level) {
		throw core::InvalidRequestError(fmt::format("Confidence level must be between {} and {}, got {}.",
		                                            config_.min_confidence_level, config_.max_confidence_level,
		                                            request.confidence_level));
	}
}

core::BudgetForecast ForecastingService::generateForecast(const std::string &user_id, const ForecastRequest &request) {
	validateRequest(request);
	const auto algorithm = request.algorithm.value_or(core::Algorithm::MovingAverage);
	const auto now = clock_();

	FINFORECAST_INFO("Generating {} {} forecast for user {} (category: {}).", core::toString(request.period_type),
	                 core::toString(algorithm), user_id, request.category.value_or(kAllCategoriesLabel));

	const auto windows = calculatePeriods(request.period_type, now);

	const HistoryAggregator aggregator(transactions_, config_.min_history_months);
	core::MonthlySeries history;
	try {
		history = aggregator.aggregate(user_id, request.category, windows.historical_start, windows.historical_end);
	} catch (const core::InsufficientHistoryError &e) {
		FINFORECAST_WARN("Forecast rejected for user {}: {}", user_id, e.what());
		throw;
	}

	auto model = models::ModelFactory::create(algorithm, config_.modelSettings());
	model->fit(history);

	const auto dates = predictionDates(windows);
	const auto raw = model->predict(static_cast<int>(dates.size()));
	auto predictions = buildPredictions(dates, raw, request.confidence_level);

	const auto aggregate = calculateAggregate(predictions, history, config_);
	auto seasonal_factors = seasonal_detector_.detect(history);
	const BudgetComparator comparator(budgets_);
	const auto comparison = comparator.compare(user_id, request.category, aggregate, history);

	const auto quality = model->fitQuality();

	core::BudgetForecast forecast;
	forecast.user_id = user_id;
	forecast.forecast_period = core::ForecastPeriod{windows.forecast_start, windows.forecast_end, request.period_type};
	forecast.category = request.category;
	forecast.predictions = std::move(predictions);
	forecast.aggregate_forecast = aggregate;
	forecast.seasonal_factors = std::move(seasonal_factors);
	forecast.model_metadata.algorithm = algorithm;
	forecast.model_metadata.accuracy_score = quality.accuracy_score;
	forecast.model_metadata.rmse = quality.rmse;
	forecast.model_metadata.mae = quality.mae;
	forecast.model_metadata.training_data_points = history.size();
	forecast.model_metadata.last_trained = now;
	forecast.comparison = comparison;
	forecast.recommendations = advisor_.recommend(aggregate, comparison);
	forecast.alerts = advisor_.alerts(aggregate, comparison, now);
	forecast.status = core::ForecastStatus::Active;
	forecast.created_at = now;

	forecast.id = repository_.insert(forecast);

	FINFORECAST_INFO("Stored forecast {}: total {:.2f}, trend {} ({:.1f}%), {} alerts.", forecast.id,
	                 aggregate.total_predicted, core::toString(aggregate.trend), aggregate.trend_percentage,
	                 forecast.alerts.size());
	return forecast;
}

core::BudgetForecast ForecastingService::getForecastById(const std::string &forecast_id, const std::string &user_id) {
	auto forecast = repository_.find(forecast_id, user_id);
	if (!forecast) {
		throw core::NotFoundError("Forecast not found: " + forecast_id);
	}
	return std::move(*forecast);
}

std::vector<core::BudgetForecast> ForecastingService::getUserForecasts(const std::string &user_id,
                                                                       const ForecastFilter &filter) {
	storage::ForecastQuery query;
	query.user_id = user_id;
	query.status = filter.status;
	query.category = filter.category;
	query.period_type = filter.period_type;
	return repository_.list(query);
}

AccuracyUpdateSummary ForecastingService::updateForecastAccuracy(const std::string &user_id) {
	const AccuracyTracker tracker(repository_, actuals_, clock_, config_.accuracy_window);
	return tracker.update(user_id);
}

DashboardSummary ForecastingService::getForecastSummary(const std::string &user_id) {
	const auto now = clock_();
	auto forecasts = getUserForecasts(user_id);
	forecasts.erase(std::remove_if(forecasts.begin(), forecasts.end(),
	                               [&](const core::BudgetForecast &forecast) { return !forecast.coversDate(now); }),
	                forecasts.end());
	return summarizeForecasts(forecasts);
}

core::BudgetForecast ForecastingService::acknowledgeAlert(const std::string &forecast_id, const std::string &user_id,
                                                          std::size_t alert_index) {
	auto updated = repository_.modify(forecast_id, user_id, [&](core::BudgetForecast &forecast) {
		forecast.acknowledgeAlert(alert_index);
		return true;
	});
	if (!updated) {
		throw core::NotFoundError("Forecast not found: " + forecast_id);
	}
	FINFORECAST_DEBUG("Alert {} of forecast {} acknowledged.", alert_index, forecast_id);
	return std::move(*updated);
}

std::vector<AlertView> ForecastingService::getUnacknowledgedAlerts(const std::string &user_id,
                                                                  std::optional<core::Severity> severity) {
	std::vector<AlertView> views;
	for (const auto &forecast : getUserForecasts(user_id)) {
		for (std::size_t i = 0; i < forecast.alerts.size(); ++i) {
			const auto &alert = forecast.alerts[i];
			if (alert.acknowledged || (severity && alert.severity != *severity)) {
				continue;
			}
			views.push_back(AlertView{forecast.id, forecast.category, i, alert});
		}
	}
	std::stable_sort(views.begin(), views.end(), [](const AlertView &a, const AlertView &b) {
		const int rank_a = core::severityRank(a.alert.severity);
		const int rank_b = core::severityRank(b.alert.severity);
		if (rank_a != rank_b) {
			return rank_a < rank_b;
		}
		return a.alert.triggered_at > b.alert.triggered_at;
	});
	return views;
}

std::vector<TrendView> ForecastingService::getSpendingTrends(const std::string &user_id) {
	std::vector<TrendView> trends;
	for (const auto &forecast : getUserForecasts(user_id)) {
		TrendView view;
		view.category = forecast.category.value_or(kAllCategoriesLabel);
		view.trend = forecast.aggregate_forecast.trend;
		view.trend_percentage = forecast.aggregate_forecast.trend_percentage;
		view.period_type = forecast.forecast_period.period_type;
		trends.push_back(std::move(view));
	}
	return trends;
}

SeasonalPatternReport ForecastingService::analyzeSeasonalPatterns(const std::string &user_id,
                                                                  const std::optional<std::string> &category) {
	const auto windows = calculatePeriods(core::PeriodType::Yearly, clock_());
	const HistoryAggregator aggregator(transactions_, config_.min_history_months);
	const auto history = aggregator.aggregate(user_id, category, windows.historical_start, windows.historical_end);

	SeasonalPatternReport report;
	report.forecast_period = core::ForecastPeriod{windows.forecast_start, windows.forecast_end, core::PeriodType::Yearly};
	report.months_observed = history.size();
	report.seasonal_factors = seasonal_detector_.detect(history);
	return report;
}

} // namespace finforecast::budgeting
