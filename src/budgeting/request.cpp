#include "fin-forecast/budgeting/request.hpp"

namespace finforecast::budgeting {

ForecastRequest ForecastRequest::fromStrings(const std::string &period_type, const std::string &category,
                                             const std::string &algorithm, double confidence_level) {
	ForecastRequest request;
	if (!period_type.empty()) {
		request.period_type = core::parsePeriodType(period_type);
	}
	if (!category.empty()) {
		request.category = category;
	}
	if (!algorithm.empty()) {
		request.algorithm = core::parseAlgorithm(algorithm);
	}
	request.confidence_level = confidence_level;
	return request;
}

} // namespace finforecast::budgeting
