#pragma once

#include "fin-forecast/core/calendar.hpp"
#include "fin-forecast/core/enums.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace finforecast::core {

struct Prediction {
	TimePoint date;
	double predicted_amount = 0.0;
	double confidence_lower = 0.0;
	double confidence_upper = 0.0;
	/// Nominal level from the request, in percent. The band itself is always 1.96 sigma.
	double confidence_level = 95.0;
};

struct SeasonalFactor {
	int month = 1;
	double factor = 1.0;
	std::optional<std::string> event;
};

struct AggregateForecast {
	double total_predicted = 0.0;
	double average_monthly = 0.0;
	Trend trend = Trend::Stable;
	double trend_percentage = 0.0;
};

struct ModelMetadata {
	Algorithm algorithm = Algorithm::MovingAverage;
	double accuracy_score = 0.0;
	double rmse = 0.0;
	double mae = 0.0;
	std::size_t training_data_points = 0;
	TimePoint last_trained;
};

struct BudgetComparison {
	std::optional<double> budget_amount;
	std::optional<double> forecast_vs_budget;
	bool will_exceed = false;
};

struct PeriodComparison {
	double amount_change = 0.0;
	double percentage_change = 0.0;
};

struct Comparison {
	BudgetComparison vs_budget;
	std::optional<PeriodComparison> vs_last_period;
};

struct Alert {
	AlertType alert_type = AlertType::ForecastExceedsBudget;
	Severity severity = Severity::Low;
	std::string message;
	TimePoint triggered_at;
	bool acknowledged = false;
};

struct Recommendation {
	RecommendationType recommendation_type = RecommendationType::ReviewCategory;
	std::string title;
	std::string description;
	std::optional<double> impact_amount;
	Priority priority = Priority::Low;
};

struct AccuracyTrackingEntry {
	TimePoint prediction_date;
	double predicted_amount = 0.0;
	double actual_amount = 0.0;
	double error_percentage = 0.0;
	TimePoint recorded_at;
};

struct ForecastPeriod {
	TimePoint start_date;
	TimePoint end_date;
	PeriodType period_type = PeriodType::Monthly;
};

/**
 * @struct BudgetForecast
 * @brief The stored forecast document for one user and optional category.
 *
 * Everything except the accuracy tracking, alert acknowledgement and status is fixed
 * at generation time.
 */
struct BudgetForecast {
	std::string id;
	std::string user_id;
	ForecastPeriod forecast_period;
	std::optional<std::string> category;
	std::vector<Prediction> predictions;
	AggregateForecast aggregate_forecast;
	std::vector<SeasonalFactor> seasonal_factors;
	ModelMetadata model_metadata;
	Comparison comparison;
	std::vector<Alert> alerts;
	std::vector<Recommendation> recommendations;
	std::vector<AccuracyTrackingEntry> accuracy_tracking;
	ForecastStatus status = ForecastStatus::Active;
	TimePoint created_at;

	bool isExpired(const TimePoint &now) const;

	/// Whole days until the end of the forecast window, rounded up; negative once past.
	long daysRemaining(const TimePoint &now) const;

	/**
	 * @brief Moves an active forecast whose window has ended to expired.
	 * @return true when the status changed.
	 */
	bool refreshStatus(const TimePoint &now);

	/// Whether the window [start_date, end_date] contains @p now.
	bool coversDate(const TimePoint &now) const;

	bool hasTrackedMonth(const TimePoint &date) const;

	/**
	 * @brief Appends the realised spend for a predicted month and recomputes accuracy_score.
	 *
	 * The score becomes 100 minus the mean absolute error percentage of the most recent
	 * @p window entries, clamped to [0, 100]. Calling again for an already tracked month
	 * is a no-op.
	 * @return true when an entry was appended.
	 */
	bool trackAccuracy(const TimePoint &prediction_date, double predicted_amount, double actual_amount,
	                   const TimePoint &recorded_at, std::size_t window = 10);

	/// 100 minus the mean absolute error percentage over every tracked entry.
	std::optional<double> trackedAccuracy() const;

	/// @throws std::out_of_range when @p index does not name an alert.
	void acknowledgeAlert(std::size_t index);

	std::size_t unacknowledgedAlertCount() const;
};

} // namespace finforecast::core
