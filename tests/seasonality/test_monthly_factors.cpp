#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "fin-forecast/seasonality/monthly_factors.hpp"
#include "common/monthly_helpers.hpp"

#include <stdexcept>

using finforecast::seasonality::MonthlyFactorDetector;

TEST_CASE("Monthly factors compare each month with the overall mean", "[seasonality][monthly_factors]") {
    // Nov 100, Dec 300, Jan 200: overall mean 200.
    const auto history = tests::helpers::makeMonthlySeries({100.0, 300.0, 200.0}, 2023, 11);
    const auto detector = MonthlyFactorDetector::builder().build();
    const auto factors = detector.detect(history);

    REQUIRE(factors.size() == 3);
    REQUIRE(factors[0].month == 1);
    REQUIRE(factors[0].factor == Catch::Approx(1.0));
    REQUIRE_FALSE(factors[0].event.has_value());

    REQUIRE(factors[1].month == 11);
    REQUIRE(factors[1].factor == Catch::Approx(0.5));
    REQUIRE(factors[1].event == std::string(finforecast::seasonality::kLowSpendingLabel));

    REQUIRE(factors[2].month == 12);
    REQUIRE(factors[2].factor == Catch::Approx(1.5));
    REQUIRE(factors[2].event == std::string(finforecast::seasonality::kHighSpendingLabel));
}

TEST_CASE("Monthly factors average repeated calendar months", "[seasonality][monthly_factors]") {
    // Jan..Dec of 2023 then Jan 2024; both Januaries are 400, the rest 100.
    std::vector<double> values(13, 100.0);
    values[0] = 400.0;
    values[12] = 400.0;
    const auto history = tests::helpers::makeMonthlySeries(values, 2023, 1);

    const auto factors = MonthlyFactorDetector::builder().build().detect(history);
    REQUIRE(factors.size() == 12);

    const double overall = (400.0 * 2 + 100.0 * 11) / 13.0;
    REQUIRE(factors[0].factor == Catch::Approx(400.0 / overall));
    REQUIRE(factors[5].factor == Catch::Approx(100.0 / overall));
}

TEST_CASE("Monthly factor thresholds are strict", "[seasonality][monthly_factors]") {
    // Factors exactly 1.2 and 0.8 carry no label.
    const auto history = tests::helpers::makeMonthlySeries({120.0, 80.0}, 2024, 3);
    const auto factors = MonthlyFactorDetector::builder().build().detect(history);
    REQUIRE(factors.size() == 2);
    REQUIRE(factors[0].factor == Catch::Approx(1.2));
    REQUIRE(factors[1].factor == Catch::Approx(0.8));

    const auto custom = MonthlyFactorDetector::builder().highThreshold(1.1).lowThreshold(0.9).build();
    const auto labelled = custom.detect(history);
    REQUIRE(labelled[0].event.has_value());
    REQUIRE(labelled[1].event.has_value());
}

TEST_CASE("Monthly factors default to one without spending", "[seasonality][monthly_factors]") {
    const auto history = tests::helpers::makeMonthlySeries({0.0, 0.0, 0.0}, 2024, 1);
    const auto factors = MonthlyFactorDetector::builder().build().detect(history);
    REQUIRE(factors.size() == 3);
    for (const auto& factor : factors) {
        REQUIRE(factor.factor == Catch::Approx(1.0));
        REQUIRE_FALSE(factor.event.has_value());
    }
    REQUIRE(MonthlyFactorDetector::builder().build().detect(finforecast::core::MonthlySeries{}).empty());
}

TEST_CASE("Monthly factor builder validates thresholds", "[seasonality][monthly_factors][builder]") {
    REQUIRE_THROWS_AS(MonthlyFactorDetector::builder().highThreshold(0.5).lowThreshold(0.9).build(),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(MonthlyFactorDetector::builder().lowThreshold(-0.1).build(), std::invalid_argument);
}
