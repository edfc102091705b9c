#pragma once

#include "fin-forecast/models/iforecaster.hpp"
#include "fin-forecast/utils/logging.hpp"
#include <vector>

namespace finforecast::models {

class MovingAverageBuilder; // Forward declaration

/**
 * @class MovingAverage
 * @brief Flat forecast at the mean of the most recent months.
 *
 * The window shrinks to the history length when fewer months are available. The band is
 * the window mean plus or minus the interval multiplier times the window's population
 * standard deviation; it is not floored at zero.
 */
class MovingAverage final : public IForecaster {
public:
	friend class MovingAverageBuilder;

	void fit(const core::MonthlySeries &series) override;
	core::Forecast predict(int horizon) override;
	utils::FitQuality fitQuality() const override;
	core::Algorithm algorithm() const override {
		return core::Algorithm::MovingAverage;
	}
	std::string getName() const override {
		return "MovingAverage";
	}

	double average() const {
		return average_;
	}
	double stdDev() const {
		return std_dev_;
	}
	int effectiveWindow() const {
		return effective_window_;
	}

private:
	MovingAverage(int window, double interval_multiplier);

	int window_;
	double interval_multiplier_;
	int effective_window_ = 0;
	double average_ = 0.0;
	double std_dev_ = 0.0;
	utils::FitQuality quality_;
	bool is_fitted_ = false;
};

/**
 * @class MovingAverageBuilder
 * @brief A builder for fluently configuring and creating MovingAverage models.
 */
class MovingAverageBuilder {
public:
	/**
	 * @brief Sets the maximum number of recent months averaged.
	 */
	MovingAverageBuilder &withWindow(int window);

	MovingAverageBuilder &withIntervalMultiplier(double multiplier);

	std::unique_ptr<MovingAverage> build();

private:
	int window_ = 3;
	double interval_multiplier_ = kDefaultIntervalMultiplier;
};

} // namespace finforecast::models
