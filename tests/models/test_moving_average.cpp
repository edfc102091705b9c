#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "fin-forecast/models/moving_average.hpp"
#include "common/monthly_helpers.hpp"

#include <stdexcept>

using finforecast::models::MovingAverageBuilder;

TEST_CASE("Moving average builder validates window", "[models][moving_average][builder]") {
	REQUIRE_THROWS_AS(MovingAverageBuilder().withWindow(0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(MovingAverageBuilder().withIntervalMultiplier(-1.0).build(), std::invalid_argument);

	auto model = MovingAverageBuilder().withWindow(3).build();
	REQUIRE(model->getName() == "MovingAverage");
	REQUIRE(model->algorithm() == finforecast::core::Algorithm::MovingAverage);
}

TEST_CASE("Moving average is flat at the recent mean", "[models][moving_average][forecast]") {
	const auto series = tests::helpers::makeMonthlySeries({100.0, 200.0, 300.0});
	auto model = MovingAverageBuilder().withWindow(3).build();
	model->fit(series);

	REQUIRE(model->average() == Catch::Approx(200.0));
	REQUIRE(model->stdDev() == Catch::Approx(81.65).margin(0.01));

	const auto forecast = model->predict(2);
	REQUIRE(forecast.horizon() == 2);
	REQUIRE(forecast.hasIntervals());
	for (std::size_t i = 0; i < 2; ++i) {
		REQUIRE(forecast.point[i] == Catch::Approx(200.0));
		REQUIRE(forecast.lowerSeries()[i] == Catch::Approx(40.0).margin(0.1));
		REQUIRE(forecast.upperSeries()[i] == Catch::Approx(359.9).margin(0.1));
	}
}

TEST_CASE("Moving average only looks at the trailing window", "[models][moving_average]") {
	const auto series = tests::helpers::makeMonthlySeries({1000.0, 10.0, 20.0, 30.0});
	auto model = MovingAverageBuilder().withWindow(3).build();
	model->fit(series);
	REQUIRE(model->effectiveWindow() == 3);
	REQUIRE(model->average() == Catch::Approx(20.0));
}

TEST_CASE("Moving average shrinks the window to the history", "[models][moving_average]") {
	const auto series = tests::helpers::makeMonthlySeries({50.0, 150.0});
	auto model = MovingAverageBuilder().withWindow(6).build();
	model->fit(series);
	REQUIRE(model->effectiveWindow() == 2);
	REQUIRE(model->average() == Catch::Approx(100.0));
}

TEST_CASE("Moving average band is not floored at zero", "[models][moving_average]") {
	const auto series = tests::helpers::makeMonthlySeries({0.0, 0.0, 300.0});
	auto model = MovingAverageBuilder().build();
	model->fit(series);
	const auto forecast = model->predict(1);
	REQUIRE(forecast.lowerSeries()[0] < 0.0);
	REQUIRE(forecast.lowerSeries()[0] <= forecast.point[0]);
}

TEST_CASE("Moving average fit quality against a constant history", "[models][moving_average][quality]") {
	const auto series = tests::helpers::makeMonthlySeries({250.0, 250.0, 250.0});
	auto model = MovingAverageBuilder().build();
	REQUIRE_THROWS_AS(model->fitQuality(), std::runtime_error);
	model->fit(series);

	const auto quality = model->fitQuality();
	REQUIRE(quality.n == 3);
	REQUIRE(quality.rmse == Catch::Approx(0.0));
	REQUIRE(quality.accuracy_score == Catch::Approx(100.0));
}

TEST_CASE("Moving average predict guards", "[models][moving_average]") {
	auto model = MovingAverageBuilder().build();
	REQUIRE_THROWS_AS(model->predict(1), std::runtime_error);
	REQUIRE_THROWS_AS(model->fit(finforecast::core::MonthlySeries{}), std::invalid_argument);

	model->fit(tests::helpers::makeMonthlySeries({1.0, 2.0, 3.0}));
	REQUIRE(model->predict(0).empty());
	REQUIRE_THROWS_AS(model->predict(-1), std::invalid_argument);
}
