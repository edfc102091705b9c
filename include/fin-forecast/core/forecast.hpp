#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

namespace finforecast::core {

/**
 * @struct Forecast
 * @brief Raw output of a forecaster: point predictions and an optional interval per step.
 *
 * Steps are monthly and start at the first month of the forecast window. Dates are
 * attached later by the budgeting pipeline.
 */
struct Forecast {
	using Series = std::vector<double>;

	Series point;
	std::optional<Series> lower;
	std::optional<Series> upper;

	bool empty() const {
		return point.empty();
	}

	/// Number of forecast steps.
	std::size_t horizon() const {
		return point.size();
	}

	bool hasIntervals() const {
		return lower.has_value() && upper.has_value();
	}

	/// Mutable access to the lower bounds, created on first use.
	Series &lowerSeries() {
		if (!lower.has_value()) {
			lower.emplace();
		}
		return *lower;
	}

	/// Mutable access to the upper bounds, created on first use.
	Series &upperSeries() {
		if (!upper.has_value()) {
			upper.emplace();
		}
		return *upper;
	}

	const Series &lowerSeries() const {
		if (!lower.has_value()) {
			throw std::out_of_range("Lower interval not available for this forecast.");
		}
		return *lower;
	}

	const Series &upperSeries() const {
		if (!upper.has_value()) {
			throw std::out_of_range("Upper interval not available for this forecast.");
		}
		return *upper;
	}
};

} // namespace finforecast::core
