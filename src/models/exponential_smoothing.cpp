#include "fin-forecast/models/exponential_smoothing.hpp"
#include <algorithm>
#include <stdexcept>

namespace finforecast::models {

// --- Model Implementation ---

ExponentialSmoothing::ExponentialSmoothing(double alpha, double interval_multiplier)
    : alpha_(alpha), interval_multiplier_(interval_multiplier) {
	if (alpha_ <= 0.0 || alpha_ > 1.0) {
		throw std::invalid_argument("Alpha must be in the range (0, 1].");
	}
	if (interval_multiplier_ < 0.0) {
		throw std::invalid_argument("Interval multiplier must be non-negative.");
	}
}

void ExponentialSmoothing::fit(const core::MonthlySeries &series) {
	const auto &values = series.getValues();
	if (values.empty()) {
		throw std::invalid_argument("Monthly series cannot be empty for fitting.");
	}

	smoothed_.clear();
	smoothed_.reserve(values.size());
	smoothed_.push_back(values[0]);
	for (size_t i = 1; i < values.size(); ++i) {
		smoothed_.push_back(alpha_ * values[i] + (1.0 - alpha_) * smoothed_.back());
	}
	last_level_ = smoothed_.back();

	std::vector<double> residuals;
	residuals.reserve(values.size());
	for (size_t i = 0; i < values.size(); ++i) {
		residuals.push_back(values[i] - smoothed_[i]);
	}
	residual_std_dev_ = utils::Metrics::residualRmse(residuals);

	quality_.n = values.size();
	quality_.rmse = residual_std_dev_;
	quality_.mae = utils::Metrics::residualMae(residuals);
	quality_.accuracy_score = utils::Metrics::accuracyScore(quality_.mae, series.average());

	is_fitted_ = true;
	FINFORECAST_INFO("Exponential smoothing fitted on {} months (alpha={}). Final level = {:.2f}.", values.size(),
	                 alpha_, last_level_);
}

core::Forecast ExponentialSmoothing::predict(int horizon) {
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

	// Every future month is the last smoothed level.
	const double spread = interval_multiplier_ * residual_std_dev_;
	core::Forecast forecast;
	forecast.point.assign(static_cast<std::size_t>(horizon), last_level_);
	// The floor at zero never lifts the bound above a negative level (net refunds).
	const double lower = std::min(last_level_, std::max(0.0, last_level_ - spread));
	forecast.lowerSeries().assign(static_cast<std::size_t>(horizon), lower);
	forecast.upperSeries().assign(static_cast<std::size_t>(horizon), last_level_ + spread);
	return forecast;
}

utils::FitQuality ExponentialSmoothing::fitQuality() const {
	if (!is_fitted_) {
		throw std::runtime_error("Fit quality requested before fit.");
	}
	return quality_;
}

// --- Builder Implementation ---

ExponentialSmoothingBuilder &ExponentialSmoothingBuilder::withAlpha(double alpha) {
	alpha_ = alpha;
	return *this;
}

ExponentialSmoothingBuilder &ExponentialSmoothingBuilder::withIntervalMultiplier(double multiplier) {
	interval_multiplier_ = multiplier;
	return *this;
}

std::unique_ptr<ExponentialSmoothing> ExponentialSmoothingBuilder::build() {
	FINFORECAST_DEBUG("Building exponential smoothing model with alpha = {}.", alpha_);
	return std::unique_ptr<ExponentialSmoothing>(new ExponentialSmoothing(alpha_, interval_multiplier_));
}

} // namespace finforecast::models
