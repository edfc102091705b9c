#pragma once

#include "fin-forecast/models/iforecaster.hpp"
#include "fin-forecast/utils/logging.hpp"

namespace finforecast::models {

class LinearRegressionBuilder; // Forward declaration

/**
 * @class LinearRegression
 * @brief Ordinary least squares trend on the month index, extrapolated forward.
 *
 * Months are indexed 0..n-1 and the h-th future month sits at index n + h. Predictions
 * and lower bounds are floored at zero. The band uses the residual standard error with
 * n - 2 degrees of freedom.
 */
class LinearRegression final : public IForecaster {
public:
	friend class LinearRegressionBuilder;

	void fit(const core::MonthlySeries &series) override;
	core::Forecast predict(int horizon) override;
	utils::FitQuality fitQuality() const override;
	core::Algorithm algorithm() const override {
		return core::Algorithm::LinearRegression;
	}
	std::string getName() const override {
		return "LinearRegression";
	}

	double slope() const {
		return slope_;
	}
	double intercept() const {
		return intercept_;
	}
	double residualStdDev() const {
		return residual_std_dev_;
	}

private:
	explicit LinearRegression(double interval_multiplier);

	double interval_multiplier_;
	double slope_ = 0.0;
	double intercept_ = 0.0;
	double residual_std_dev_ = 0.0;
	std::size_t n_ = 0;
	utils::FitQuality quality_;
	bool is_fitted_ = false;
};

class LinearRegressionBuilder {
public:
	LinearRegressionBuilder &withIntervalMultiplier(double multiplier);

	std::unique_ptr<LinearRegression> build();

private:
	double interval_multiplier_ = kDefaultIntervalMultiplier;
};

} // namespace finforecast::models
