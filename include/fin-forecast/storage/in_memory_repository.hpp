#pragma once

#include "fin-forecast/storage/forecast_repository.hpp"

#include <cstdint>
#include <map>
#include <mutex>

namespace finforecast::storage {

/**
 * @class InMemoryForecastRepository
 * @brief Thread-safe ForecastRepository backed by a map; a single mutex serialises writers.
 */
class InMemoryForecastRepository final : public ForecastRepository {
public:
	explicit InMemoryForecastRepository(core::Clock clock = core::systemClock());

	std::string insert(core::BudgetForecast forecast) override;
	std::optional<core::BudgetForecast> find(const std::string &id, const std::string &user_id) override;
	std::vector<core::BudgetForecast> list(const ForecastQuery &query) override;
	std::optional<core::BudgetForecast> modify(const std::string &id, const std::string &user_id,
	                                           const Mutator &mutator) override;

	std::size_t size() const;

private:
	std::string nextId();

	core::Clock clock_;
	mutable std::mutex mutex_;
	std::map<std::string, core::BudgetForecast> forecasts_;
	std::uint64_t sequence_ = 0;
};

} // namespace finforecast::storage
