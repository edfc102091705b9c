#include <catch2/catch_test_macros.hpp>

#include "fin-forecast/core/enums.hpp"
#include "fin-forecast/core/errors.hpp"

using namespace finforecast::core;

TEST_CASE("Enum names use the snake_case vocabulary", "[core][enums]") {
	REQUIRE(toString(PeriodType::Quarterly) == "quarterly");
	REQUIRE(toString(Algorithm::ExponentialSmoothing) == "exponential_smoothing");
	REQUIRE(toString(Trend::Volatile) == "volatile");
	REQUIRE(toString(ForecastStatus::Expired) == "expired");
	REQUIRE(toString(Severity::Critical) == "critical");
	REQUIRE(toString(AlertType::ForecastExceedsBudget) == "forecast_exceeds_budget");
	REQUIRE(toString(RecommendationType::SaveMore) == "save_more");
	REQUIRE(toString(Priority::Medium) == "medium");
}

TEST_CASE("Period types parse from their names", "[core][enums]") {
	REQUIRE(parsePeriodType("weekly") == PeriodType::Weekly);
	REQUIRE(parsePeriodType("yearly") == PeriodType::Yearly);
	REQUIRE_THROWS_AS(parsePeriodType("daily"), InvalidRequestError);
}

TEST_CASE("Only implemented algorithms parse", "[core][enums]") {
	REQUIRE(parseAlgorithm("moving_average") == Algorithm::MovingAverage);
	REQUIRE(parseAlgorithm("linear_regression") == Algorithm::LinearRegression);
	REQUIRE(parseAlgorithm("exponential_smoothing") == Algorithm::ExponentialSmoothing);
	REQUIRE_THROWS_AS(parseAlgorithm("arima"), UnsupportedAlgorithmError);
	REQUIRE_THROWS_AS(parseAlgorithm("prophet"), UnsupportedAlgorithmError);

	try {
		parseAlgorithm("neural_net");
		FAIL("expected UnsupportedAlgorithmError");
	} catch (const UnsupportedAlgorithmError &e) {
		REQUIRE(e.name() == "neural_net");
	}
}

TEST_CASE("Severity rank puts critical first", "[core][enums]") {
	REQUIRE(parseSeverity("high") == Severity::High);
	REQUIRE_THROWS_AS(parseSeverity("urgent"), InvalidRequestError);
	REQUIRE(severityRank(Severity::Critical) < severityRank(Severity::High));
	REQUIRE(severityRank(Severity::High) < severityRank(Severity::Medium));
	REQUIRE(severityRank(Severity::Medium) < severityRank(Severity::Low));
}
