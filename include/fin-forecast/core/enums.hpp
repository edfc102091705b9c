#pragma once

#include <string>
#include <string_view>

namespace finforecast::core {

enum class PeriodType { Weekly, Monthly, Quarterly, Yearly };

enum class Algorithm { MovingAverage, LinearRegression, ExponentialSmoothing };

enum class Trend { Increasing, Decreasing, Stable, Volatile };

enum class ForecastStatus { Active, Archived, Expired };

enum class Severity { Low, Medium, High, Critical };

enum class AlertType { ForecastExceedsBudget, UnusualSpike, TrendReversal, SeasonalPeak };

enum class RecommendationType { IncreaseBudget, DecreaseBudget, AdjustSpending, SaveMore, ReviewCategory };

enum class Priority { Low, Medium, High };

// Names match the snake_case vocabulary used by the API layer ("moving_average", "high", ...).
std::string toString(PeriodType value);
std::string toString(Algorithm value);
std::string toString(Trend value);
std::string toString(ForecastStatus value);
std::string toString(Severity value);
std::string toString(AlertType value);
std::string toString(RecommendationType value);
std::string toString(Priority value);

/// @throws InvalidRequestError for names outside weekly/monthly/quarterly/yearly.
PeriodType parsePeriodType(std::string_view name);
/// @throws UnsupportedAlgorithmError for any name without an implementation.
Algorithm parseAlgorithm(std::string_view name);
/// @throws InvalidRequestError for unknown severities.
Severity parseSeverity(std::string_view name);

/// Sort rank with critical first.
int severityRank(Severity severity);

} // namespace finforecast::core
