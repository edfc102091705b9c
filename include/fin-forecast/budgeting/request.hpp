#pragma once

#include "fin-forecast/core/enums.hpp"

#include <optional>
#include <string>

namespace finforecast::budgeting {

struct ForecastRequest {
	core::PeriodType period_type = core::PeriodType::Monthly;
	std::optional<std::string> category;
	/// Moving average when omitted.
	std::optional<core::Algorithm> algorithm;
	/// Nominal percentage recorded on every prediction; must lie in [80, 99] by default.
	double confidence_level = 95.0;

	/**
	 * @brief Builds a request from API-layer strings.
	 *
	 * Empty category means "all categories"; an empty algorithm selects the default.
	 * @throws core::InvalidRequestError, core::UnsupportedAlgorithmError
	 */
	static ForecastRequest fromStrings(const std::string &period_type, const std::string &category,
	                                   const std::string &algorithm, double confidence_level = 95.0);
};

struct ForecastFilter {
	std::optional<std::string> category;
	std::optional<core::PeriodType> period_type;
	/// Active forecasts only unless overridden; nullopt returns every status.
	std::optional<core::ForecastStatus> status = core::ForecastStatus::Active;
};

} // namespace finforecast::budgeting
