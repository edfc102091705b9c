#include "fin-forecast/core/enums.hpp"

#include "fin-forecast/core/errors.hpp"

namespace finforecast::core {

std::string toString(PeriodType value) {
	switch (value) {
	case PeriodType::Weekly:
		return "weekly";
	case PeriodType::Monthly:
		return "monthly";
	case PeriodType::Quarterly:
		return "quarterly";
	case PeriodType::Yearly:
		return "yearly";
	}
	return "monthly";
}

std::string toString(Algorithm value) {
	switch (value) {
	case Algorithm::MovingAverage:
		return "moving_average";
	case Algorithm::LinearRegression:
		return "linear_regression";
	case Algorithm::ExponentialSmoothing:
		return "exponential_smoothing";
	}
	return "moving_average";
}

std::string toString(Trend value) {
	switch (value) {
	case Trend::Increasing:
		return "increasing";
	case Trend::Decreasing:
		return "decreasing";
	case Trend::Stable:
		return "stable";
	case Trend::Volatile:
		return "volatile";
	}
	return "stable";
}

std::string toString(ForecastStatus value) {
	switch (value) {
	case ForecastStatus::Active:
		return "active";
	case ForecastStatus::Archived:
		return "archived";
	case ForecastStatus::Expired:
		return "expired";
	}
	return "active";
}

std::string toString(Severity value) {
	switch (value) {
	case Severity::Low:
		return "low";
	case Severity::Medium:
		return "medium";
	case Severity::High:
		return "high";
	case Severity::Critical:
		return "critical";
	}
	return "low";
}

std::string toString(AlertType value) {
	switch (value) {
	case AlertType::ForecastExceedsBudget:
		return "forecast_exceeds_budget";
	case AlertType::UnusualSpike:
		return "unusual_spike";
	case AlertType::TrendReversal:
		return "trend_reversal";
	case AlertType::SeasonalPeak:
		return "seasonal_peak";
	}
	return "forecast_exceeds_budget";
}

std::string toString(RecommendationType value) {
	switch (value) {
	case RecommendationType::IncreaseBudget:
		return "increase_budget";
	case RecommendationType::DecreaseBudget:
		return "decrease_budget";
	case RecommendationType::AdjustSpending:
		return "adjust_spending";
	case RecommendationType::SaveMore:
		return "save_more";
	case RecommendationType::ReviewCategory:
		return "review_category";
	}
	return "review_category";
}

std::string toString(Priority value) {
	switch (value) {
	case Priority::Low:
		return "low";
	case Priority::Medium:
		return "medium";
	case Priority::High:
		return "high";
	}
	return "low";
}

PeriodType parsePeriodType(std::string_view name) {
	if (name == "weekly") {
		return PeriodType::Weekly;
	}
	if (name == "monthly") {
		return PeriodType::Monthly;
	}
	if (name == "quarterly") {
		return PeriodType::Quarterly;
	}
	if (name == "yearly") {
		return PeriodType::Yearly;
	}
	throw InvalidRequestError("Unknown period type: '" + std::string(name) + "'");
}

Algorithm parseAlgorithm(std::string_view name) {
	if (name == "moving_average") {
		return Algorithm::MovingAverage;
	}
	if (name == "linear_regression") {
		return Algorithm::LinearRegression;
	}
	if (name == "exponential_smoothing") {
		return Algorithm::ExponentialSmoothing;
	}
	throw UnsupportedAlgorithmError(std::string(name));
}

Severity parseSeverity(std::string_view name) {
	if (name == "low") {
		return Severity::Low;
	}
	if (name == "medium") {
		return Severity::Medium;
	}
	if (name == "high") {
		return Severity::High;
	}
	if (name == "critical") {
		return Severity::Critical;
	}
	throw InvalidRequestError("Unknown alert severity: '" + std::string(name) + "'");
}

int severityRank(Severity severity) {
	switch (severity) {
	case Severity::Critical:
		return 0;
	case Severity::High:
		return 1;
	case Severity::Medium:
		return 2;
	case Severity::Low:
		return 3;
	}
	return 3;
}

} // namespace finforecast::core
