#pragma once

#include "fin-forecast/core/budget_forecast.hpp"
#include "fin-forecast/core/monthly_series.hpp"

#include <vector>

namespace finforecast::seasonality {

inline constexpr const char *kHighSpendingLabel = "High spending period";
inline constexpr const char *kLowSpendingLabel = "Low spending period";

/**
 * Calendar-month spending factors: the mean of each calendar month across all years
 * divided by the mean of the whole history. Months never observed are omitted.
 */
class MonthlyFactorDetector {
public:
    class Builder {
    public:
        Builder& highThreshold(double value);
        Builder& lowThreshold(double value);
        MonthlyFactorDetector build() const;

    private:
        double high_threshold_ = 1.2;
        double low_threshold_ = 0.8;
    };

    static Builder builder();

    /// One factor per observed calendar month, ordered January to December.
    std::vector<core::SeasonalFactor> detect(const core::MonthlySeries& history) const;

    double highThreshold() const { return high_threshold_; }
    double lowThreshold() const { return low_threshold_; }

private:
    MonthlyFactorDetector(double high_threshold, double low_threshold);

    double high_threshold_;
    double low_threshold_;
};

} // namespace finforecast::seasonality
