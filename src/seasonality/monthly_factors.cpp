#include "fin-forecast/seasonality/monthly_factors.hpp"

#include "fin-forecast/utils/logging.hpp"

#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace finforecast::seasonality {

MonthlyFactorDetector::Builder& MonthlyFactorDetector::Builder::highThreshold(double value) {
    high_threshold_ = value;
    return *this;
}

MonthlyFactorDetector::Builder& MonthlyFactorDetector::Builder::lowThreshold(double value) {
    low_threshold_ = value;
    return *this;
}

MonthlyFactorDetector MonthlyFactorDetector::Builder::build() const {
    return MonthlyFactorDetector(high_threshold_, low_threshold_);
}

MonthlyFactorDetector::Builder MonthlyFactorDetector::builder() {
    return Builder{};
}

MonthlyFactorDetector::MonthlyFactorDetector(double high_threshold, double low_threshold)
    : high_threshold_(high_threshold), low_threshold_(low_threshold) {
    if (low_threshold_ < 0.0 || high_threshold_ < low_threshold_) {
        throw std::invalid_argument("Seasonal thresholds must satisfy 0 <= low <= high.");
    }
}

std::vector<core::SeasonalFactor> MonthlyFactorDetector::detect(const core::MonthlySeries& history) const {
    std::vector<core::SeasonalFactor> factors;
    if (history.empty()) {
        return factors;
    }

    std::array<double, 12> sums{};
    std::array<std::size_t, 12> counts{};
    const auto& dates = history.getDates();
    const auto& values = history.getValues();
    for (std::size_t i = 0; i < values.size(); ++i) {
        const auto month_index = static_cast<std::size_t>(core::calendar::yearMonthOf(dates[i]).month - 1);
        sums[month_index] += values[i];
        ++counts[month_index];
    }

    const double overall_average = history.average();
    const bool has_level = std::abs(overall_average) > std::numeric_limits<double>::epsilon();
    if (!has_level) {
        FINFORECAST_DEBUG("Overall average spend is zero; seasonal factors default to 1.");
    }

    for (std::size_t m = 0; m < 12; ++m) {
        if (counts[m] == 0) {
            continue;
        }
        const double month_average = sums[m] / static_cast<double>(counts[m]);

        core::SeasonalFactor factor;
        factor.month = static_cast<int>(m) + 1;
        factor.factor = has_level ? month_average / overall_average : 1.0;
        if (factor.factor > high_threshold_) {
            factor.event = kHighSpendingLabel;
        } else if (factor.factor < low_threshold_) {
            factor.event = kLowSpendingLabel;
        }
        factors.push_back(std::move(factor));
    }
    return factors;
}

} // namespace finforecast::seasonality
