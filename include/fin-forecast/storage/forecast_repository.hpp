#pragma once

#include "fin-forecast/core/budget_forecast.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace finforecast::storage {

struct ForecastQuery {
	std::string user_id;
	/// Defaults to active forecasts; nullopt matches every status.
	std::optional<core::ForecastStatus> status = core::ForecastStatus::Active;
	std::optional<std::string> category;
	std::optional<core::PeriodType> period_type;
};

/**
 * @class ForecastRepository
 * @brief Document store for BudgetForecast records.
 *
 * Implementations must apply BudgetForecast::refreshStatus on every read and before
 * every write, and must run each modify() call atomically with respect to other
 * writers of the same forecast.
 */
class ForecastRepository {
public:
	/// Applies an in-place change; returns whether the document changed and must be stored.
	using Mutator = std::function<bool(core::BudgetForecast &)>;

	virtual ~ForecastRepository() = default;

	/// Stores a new forecast and returns its assigned id.
	virtual std::string insert(core::BudgetForecast forecast) = 0;

	/// The forecast with @p id when it exists and belongs to @p user_id.
	virtual std::optional<core::BudgetForecast> find(const std::string &id, const std::string &user_id) = 0;

	/// Matching forecasts, newest forecast window first.
	virtual std::vector<core::BudgetForecast> list(const ForecastQuery &query) = 0;

	/**
	 * @brief Read-modify-write of one forecast under the store's write discipline.
	 * @return The stored document after the mutation, or nullopt when not found.
	 */
	virtual std::optional<core::BudgetForecast> modify(const std::string &id, const std::string &user_id,
	                                                   const Mutator &mutator) = 0;
};

} // namespace finforecast::storage
