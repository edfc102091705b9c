#pragma once

#include "fin-forecast/models/iforecaster.hpp"
#include "fin-forecast/utils/logging.hpp"
#include <vector>

namespace finforecast::models {

class ExponentialSmoothingBuilder; // Forward declaration

/**
 * @class ExponentialSmoothing
 * @brief Simple exponential smoothing with a fixed alpha and a flat forecast.
 *
 * The level starts at the first month. Every future month is predicted at the final
 * level; there is no trend term. The band comes from the root mean square of the
 * one-step residuals y[i] - level[i], with the lower bound floored at zero.
 */
class ExponentialSmoothing final : public IForecaster {
public:
	friend class ExponentialSmoothingBuilder;

	void fit(const core::MonthlySeries &series) override;
	core::Forecast predict(int horizon) override;
	utils::FitQuality fitQuality() const override;
	core::Algorithm algorithm() const override {
		return core::Algorithm::ExponentialSmoothing;
	}
	std::string getName() const override {
		return "ExponentialSmoothing";
	}

	double alpha() const {
		return alpha_;
	}
	double lastLevel() const {
		return last_level_;
	}
	const std::vector<double> &smoothedValues() const {
		return smoothed_;
	}

private:
	ExponentialSmoothing(double alpha, double interval_multiplier);

	double alpha_;
	double interval_multiplier_;
	double last_level_ = 0.0;
	double residual_std_dev_ = 0.0;
	std::vector<double> smoothed_;
	utils::FitQuality quality_;
	bool is_fitted_ = false;
};

/**
 * @class ExponentialSmoothingBuilder
 * @brief A builder for fluently configuring and creating ExponentialSmoothing models.
 */
class ExponentialSmoothingBuilder {
public:
	/**
	 * @brief Sets the smoothing factor for the level, in (0, 1].
	 */
	ExponentialSmoothingBuilder &withAlpha(double alpha);

	ExponentialSmoothingBuilder &withIntervalMultiplier(double multiplier);

	std::unique_ptr<ExponentialSmoothing> build();

private:
	double alpha_ = 0.3;
	double interval_multiplier_ = kDefaultIntervalMultiplier;
};

} // namespace finforecast::models
