#include "fin-forecast/utils/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace finforecast::utils {

namespace {

constexpr double kZeroTolerance = std::numeric_limits<double>::epsilon();

void validate_non_empty(const std::vector<double> &values) {
	if (values.empty()) {
		throw std::invalid_argument("Metric input must be non-empty.");
	}
}

} // namespace

double Metrics::mean(const std::vector<double> &values) {
	validate_non_empty(values);
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double Metrics::populationStdDev(const std::vector<double> &values) {
	const double avg = mean(values);
	double sum_sq = 0.0;
	for (const double value : values) {
		const double diff = value - avg;
		sum_sq += diff * diff;
	}
	return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

double Metrics::residualMae(const std::vector<double> &residuals) {
	validate_non_empty(residuals);
	double sum = 0.0;
	for (const double r : residuals) {
		sum += std::abs(r);
	}
	return sum / static_cast<double>(residuals.size());
}

double Metrics::residualRmse(const std::vector<double> &residuals) {
	validate_non_empty(residuals);
	double sum = 0.0;
	for (const double r : residuals) {
		sum += r * r;
	}
	return std::sqrt(sum / static_cast<double>(residuals.size()));
}

double Metrics::accuracyScore(double mae, double reference_level) {
	if (!std::isfinite(mae) || !std::isfinite(reference_level)) {
		return 0.0;
	}
	if (std::abs(reference_level) < kZeroTolerance) {
		return mae < kZeroTolerance ? 100.0 : 0.0;
	}
	const double score = 100.0 - (mae / reference_level * 100.0);
	return std::clamp(score, 0.0, 100.0);
}

double Metrics::errorPercentage(double predicted, double actual) {
	if (std::abs(predicted) < kZeroTolerance) {
		return std::abs(actual) < kZeroTolerance ? 0.0 : 100.0;
	}
	return (actual - predicted) / predicted * 100.0;
}

} // namespace finforecast::utils
