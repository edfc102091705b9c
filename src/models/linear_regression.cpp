#include "fin-forecast/models/linear_regression.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace finforecast::models {

LinearRegression::LinearRegression(double interval_multiplier) : interval_multiplier_(interval_multiplier) {
	if (interval_multiplier_ < 0.0) {
		throw std::invalid_argument("Interval multiplier must be non-negative.");
	}
}

void LinearRegression::fit(const core::MonthlySeries &series) {
	if (series.size() < 2) {
		throw std::invalid_argument("Linear regression needs at least two months of history.");
	}
	const auto &values = series.getValues();
	const Eigen::Index n = static_cast<Eigen::Index>(values.size());
	const double n_d = static_cast<double>(n);

	const Eigen::VectorXd y = Eigen::Map<const Eigen::VectorXd>(values.data(), n);
	const Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(n, 0.0, n_d - 1.0);

	const double sum_x = x.sum();
	const double sum_y = y.sum();
	const double sum_xy = x.dot(y);
	const double sum_x2 = x.squaredNorm();

	// Indices are distinct, so the denominator is positive whenever n >= 2.
	const double denom = n_d * sum_x2 - sum_x * sum_x;
	slope_ = (n_d * sum_xy - sum_x * sum_y) / denom;
	intercept_ = (sum_y - slope_ * sum_x) / n_d;

	const Eigen::VectorXd fitted = slope_ * x + Eigen::VectorXd::Constant(n, intercept_);
	const Eigen::VectorXd residuals = y - fitted;
	const double ss_res = residuals.squaredNorm();

	residual_std_dev_ = n > 2 ? std::sqrt(ss_res / (n_d - 2.0)) : 0.0;
	n_ = values.size();

	quality_.n = n_;
	quality_.rmse = std::sqrt(ss_res / n_d);
	quality_.mae = residuals.cwiseAbs().sum() / n_d;
	quality_.accuracy_score = utils::Metrics::accuracyScore(quality_.mae, sum_y / n_d);

	is_fitted_ = true;
	FINFORECAST_INFO("Linear regression fitted on {} months: slope={:.4f}, intercept={:.2f}, residual sd={:.2f}.",
	                 n_, slope_, intercept_, residual_std_dev_);
}

core::Forecast LinearRegression::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}
	if (horizon == 0) {
		return {};
	}

	FINFORECAST_DEBUG("Extrapolating trend {} months ahead.", horizon);

	const double spread = interval_multiplier_ * residual_std_dev_;
	core::Forecast forecast;
	auto &lower = forecast.lowerSeries();
	auto &upper = forecast.upperSeries();
	forecast.point.reserve(static_cast<std::size_t>(horizon));
	lower.reserve(static_cast<std::size_t>(horizon));
	upper.reserve(static_cast<std::size_t>(horizon));

	for (int h = 0; h < horizon; ++h) {
		const double x = static_cast<double>(n_) + static_cast<double>(h);
		const double predicted = std::max(0.0, slope_ * x + intercept_);
		forecast.point.push_back(predicted);
		lower.push_back(std::max(0.0, predicted - spread));
		upper.push_back(predicted + spread);
	}
	return forecast;
}

utils::FitQuality LinearRegression::fitQuality() const {
	if (!is_fitted_) {
		throw std::runtime_error("Fit quality requested before fit.");
	}
	return quality_;
}

LinearRegressionBuilder &LinearRegressionBuilder::withIntervalMultiplier(double multiplier) {
	interval_multiplier_ = multiplier;
	return *this;
}

std::unique_ptr<LinearRegression> LinearRegressionBuilder::build() {
	FINFORECAST_DEBUG("Building linear regression model (interval multiplier {}).", interval_multiplier_);
	return std::unique_ptr<LinearRegression>(new LinearRegression(interval_multiplier_));
}

} // namespace finforecast::models
