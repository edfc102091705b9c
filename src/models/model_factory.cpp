#include "fin-forecast/models/model_factory.hpp"

#include "fin-forecast/models/exponential_smoothing.hpp"
#include "fin-forecast/models/linear_regression.hpp"
#include "fin-forecast/models/moving_average.hpp"

namespace finforecast::models {

std::unique_ptr<IForecaster> ModelFactory::create(core::Algorithm algorithm, const ModelSettings &settings) {
	switch (algorithm) {
	case core::Algorithm::LinearRegression:
		return LinearRegressionBuilder().withIntervalMultiplier(settings.interval_multiplier).build();
	case core::Algorithm::ExponentialSmoothing:
		return ExponentialSmoothingBuilder()
		    .withAlpha(settings.smoothing_alpha)
		    .withIntervalMultiplier(settings.interval_multiplier)
		    .build();
	case core::Algorithm::MovingAverage:
		break;
	}
	return MovingAverageBuilder()
	    .withWindow(settings.moving_average_window)
	    .withIntervalMultiplier(settings.interval_multiplier)
	    .build();
}

std::unique_ptr<IForecaster> ModelFactory::create(const std::string &algorithm_name, const ModelSettings &settings) {
	return create(core::parseAlgorithm(algorithm_name), settings);
}

std::vector<std::string> ModelFactory::getSupportedAlgorithms() {
	return {core::toString(core::Algorithm::MovingAverage), core::toString(core::Algorithm::LinearRegression),
	        core::toString(core::Algorithm::ExponentialSmoothing)};
}

} // namespace finforecast::models
