#include "fin-forecast/models/moving_average.hpp"
#include <algorithm>
#include <stdexcept>

namespace finforecast::models {

// --- Model Implementation ---

MovingAverage::MovingAverage(int window, double interval_multiplier)
    : window_(window), interval_multiplier_(interval_multiplier) {
	if (window_ <= 0) {
		throw std::invalid_argument("Window size must be positive.");
	}
	if (interval_multiplier_ < 0.0) {
		throw std::invalid_argument("Interval multiplier must be non-negative.");
	}
}

void MovingAverage::fit(const core::MonthlySeries &series) {
	if (series.empty()) {
		throw std::invalid_argument("Cannot fit on empty monthly series.");
	}
	const auto &values = series.getValues();
	effective_window_ = std::min(window_, static_cast<int>(values.size()));

	const std::vector<double> recent(values.end() - effective_window_, values.end());
	average_ = utils::Metrics::mean(recent);
	std_dev_ = utils::Metrics::populationStdDev(recent);

	std::vector<double> residuals;
	residuals.reserve(recent.size());
	for (const double value : recent) {
		residuals.push_back(value - average_);
	}
	quality_.n = recent.size();
	quality_.rmse = utils::Metrics::residualRmse(residuals);
	quality_.mae = utils::Metrics::residualMae(residuals);
	quality_.accuracy_score = utils::Metrics::accuracyScore(quality_.mae, average_);

	is_fitted_ = true;
	FINFORECAST_INFO("Moving average fitted on {} months (window={}): mean={:.2f}, sd={:.2f}.", values.size(),
	                 effective_window_, average_, std_dev_);
}

core::Forecast MovingAverage::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}
	if (horizon == 0) {
		return {};
	}

	FINFORECAST_DEBUG("Predicting {} months ahead.", horizon);

	const double spread = interval_multiplier_ * std_dev_;
	core::Forecast forecast;
	forecast.point.assign(static_cast<std::size_t>(horizon), average_);
	forecast.lowerSeries().assign(static_cast<std::size_t>(horizon), average_ - spread);
	forecast.upperSeries().assign(static_cast<std::size_t>(horizon), average_ + spread);
	return forecast;
}

utils::FitQuality MovingAverage::fitQuality() const {
	if (!is_fitted_) {
		throw std::runtime_error("Fit quality requested before fit.");
	}
	return quality_;
}

// --- Builder Implementation ---

MovingAverageBuilder &MovingAverageBuilder::withWindow(int window) {
	window_ = window;
	return *this;
}

MovingAverageBuilder &MovingAverageBuilder::withIntervalMultiplier(double multiplier) {
	interval_multiplier_ = multiplier;
	return *this;
}

std::unique_ptr<MovingAverage> MovingAverageBuilder::build() {
	FINFORECAST_DEBUG("Building moving average model with window size {}.", window_);
	return std::unique_ptr<MovingAverage>(new MovingAverage(window_, interval_multiplier_));
}

} // namespace finforecast::models
