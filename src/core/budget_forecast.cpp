#include "fin-forecast/core/budget_forecast.hpp"

#include "fin-forecast/utils/metrics.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace finforecast::core {

bool BudgetForecast::isExpired(const TimePoint &now) const {
	return now > forecast_period.end_date;
}

long BudgetForecast::daysRemaining(const TimePoint &now) const {
	using Days = std::chrono::duration<double, std::ratio<86400>>;
	const auto remaining = std::chrono::duration_cast<Days>(forecast_period.end_date - now);
	return static_cast<long>(std::ceil(remaining.count()));
}

bool BudgetForecast::refreshStatus(const TimePoint &now) {
	if (status == ForecastStatus::Active && isExpired(now)) {
		status = ForecastStatus::Expired;
		return true;
	}
	return false;
}

bool BudgetForecast::coversDate(const TimePoint &now) const {
	return forecast_period.start_date <= now && now <= forecast_period.end_date;
}

bool BudgetForecast::hasTrackedMonth(const TimePoint &date) const {
	return std::any_of(accuracy_tracking.begin(), accuracy_tracking.end(), [&](const AccuracyTrackingEntry &entry) {
		return calendar::sameMonth(entry.prediction_date, date);
	});
}

bool BudgetForecast::trackAccuracy(const TimePoint &prediction_date, double predicted_amount, double actual_amount,
                                   const TimePoint &recorded_at, std::size_t window) {
	if (hasTrackedMonth(prediction_date)) {
		return false;
	}

	AccuracyTrackingEntry entry;
	entry.prediction_date = prediction_date;
	entry.predicted_amount = predicted_amount;
	entry.actual_amount = actual_amount;
	entry.error_percentage = utils::Metrics::errorPercentage(predicted_amount, actual_amount);
	entry.recorded_at = recorded_at;
	accuracy_tracking.push_back(entry);

	const std::size_t take = std::min(std::max<std::size_t>(window, 1), accuracy_tracking.size());
	double total_error = 0.0;
	for (auto it = accuracy_tracking.end() - static_cast<std::ptrdiff_t>(take); it != accuracy_tracking.end(); ++it) {
		total_error += std::abs(it->error_percentage);
	}
	model_metadata.accuracy_score = std::clamp(100.0 - total_error / static_cast<double>(take), 0.0, 100.0);
	return true;
}

std::optional<double> BudgetForecast::trackedAccuracy() const {
	if (accuracy_tracking.empty()) {
		return std::nullopt;
	}
	double total_error = 0.0;
	for (const auto &entry : accuracy_tracking) {
		total_error += std::abs(entry.error_percentage);
	}
	return 100.0 - total_error / static_cast<double>(accuracy_tracking.size());
}

void BudgetForecast::acknowledgeAlert(std::size_t index) {
	if (index >= alerts.size()) {
		throw std::out_of_range("Alert index exceeds the number of alerts on this forecast.");
	}
	alerts[index].acknowledged = true;
}

std::size_t BudgetForecast::unacknowledgedAlertCount() const {
	return static_cast<std::size_t>(
	    std::count_if(alerts.begin(), alerts.end(), [](const Alert &alert) { return !alert.acknowledged; }));
}

} // namespace finforecast::core
