#pragma once

#include "fin-forecast/models/iforecaster.hpp"
#include <memory>
#include <string>
#include <vector>

namespace finforecast::models {

struct ModelSettings {
	int moving_average_window = 3;
	double smoothing_alpha = 0.3;
	double interval_multiplier = kDefaultIntervalMultiplier;
};

class ModelFactory {
public:
	/// Creates a configured, unfitted forecaster for the algorithm.
	static std::unique_ptr<IForecaster> create(core::Algorithm algorithm, const ModelSettings &settings = {});

	/// @throws core::UnsupportedAlgorithmError for unknown names.
	static std::unique_ptr<IForecaster> create(const std::string &algorithm_name,
	                                           const ModelSettings &settings = {});

	static std::vector<std::string> getSupportedAlgorithms();
};

} // namespace finforecast::models
