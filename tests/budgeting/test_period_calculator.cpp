#include <catch2/catch_test_macros.hpp>

#include "fin-forecast/budgeting/period_calculator.hpp"
#include "common/monthly_helpers.hpp"

using namespace finforecast;
using budgeting::calculatePeriods;
using budgeting::predictionDates;
using tests::helpers::utcDate;
using tests::helpers::utcDateTime;

TEST_CASE("Period windows per period type", "[budgeting][periods]") {
	const auto now = utcDateTime(2024, 6, 15, 10, 30);

	SECTION("weekly") {
		const auto windows = calculatePeriods(core::PeriodType::Weekly, now);
		REQUIRE(windows.forecast_start == now);
		REQUIRE(windows.forecast_end == utcDateTime(2024, 6, 22, 10, 30));
		REQUIRE(windows.historical_start == utcDateTime(2024, 3, 17, 10, 30));
		REQUIRE(windows.historical_end == now);
	}
	SECTION("monthly") {
		const auto windows = calculatePeriods(core::PeriodType::Monthly, now);
		REQUIRE(windows.forecast_end == utcDateTime(2024, 7, 15, 10, 30));
		REQUIRE(windows.historical_start == utcDateTime(2023, 6, 15, 10, 30));
	}
	SECTION("quarterly") {
		const auto windows = calculatePeriods(core::PeriodType::Quarterly, now);
		REQUIRE(windows.forecast_end == utcDateTime(2024, 9, 15, 10, 30));
		REQUIRE(windows.historical_start == utcDateTime(2022, 6, 15, 10, 30));
	}
	SECTION("yearly") {
		const auto windows = calculatePeriods(core::PeriodType::Yearly, now);
		REQUIRE(windows.forecast_end == utcDateTime(2025, 6, 15, 10, 30));
		REQUIRE(windows.historical_start == utcDateTime(2021, 6, 15, 10, 30));
	}
}

TEST_CASE("Prediction dates step monthly through the window", "[budgeting][periods]") {
	const auto now = utcDate(2024, 6, 15);

	REQUIRE(predictionDates(calculatePeriods(core::PeriodType::Weekly, now)).size() == 1);
	REQUIRE(predictionDates(calculatePeriods(core::PeriodType::Monthly, now)).size() == 1);
	REQUIRE(predictionDates(calculatePeriods(core::PeriodType::Yearly, now)).size() == 12);

	const auto quarterly = predictionDates(calculatePeriods(core::PeriodType::Quarterly, now));
	REQUIRE(quarterly.size() == 3);
	REQUIRE(quarterly[0] == now);
	REQUIRE(quarterly[1] == utcDate(2024, 7, 15));
	REQUIRE(quarterly[2] == utcDate(2024, 8, 15));
}

TEST_CASE("Prediction dates clamp month ends without drifting", "[budgeting][periods]") {
	const auto now = utcDate(2024, 1, 31);
	const auto dates = predictionDates(calculatePeriods(core::PeriodType::Quarterly, now));
	REQUIRE(dates.size() == 3);
	REQUIRE(dates[1] == utcDate(2024, 2, 29));
	REQUIRE(dates[2] == utcDate(2024, 3, 31));
}
