#pragma once

#include <cstddef>
#include <vector>

namespace finforecast::utils {

/**
 * @struct FitQuality
 * @brief In-sample fit statistics reported by every forecaster.
 *
 * accuracy_score is the percentage form of the mean absolute error relative to
 * the level of the series, clamped to [0, 100].
 */
struct FitQuality {
	double rmse = 0.0;
	double mae = 0.0;
	double accuracy_score = 0.0;
	std::size_t n = 0;
};

class Metrics final {
public:
	static double mean(const std::vector<double> &values);
	/// Standard deviation normalised by the number of values (not n - 1).
	static double populationStdDev(const std::vector<double> &values);

	/// MAE / RMSE of residuals that are already differenced against the fit.
	static double residualMae(const std::vector<double> &residuals);
	static double residualRmse(const std::vector<double> &residuals);

	/**
	 * @brief Converts an absolute error into a 0-100 score against a reference level.
	 *
	 * A zero reference level yields 100 when the error is also zero and 0 otherwise.
	 */
	static double accuracyScore(double mae, double reference_level);

	/// Signed relative error of an actual outcome against a prediction, in percent.
	static double errorPercentage(double predicted, double actual);
};

} // namespace finforecast::utils
