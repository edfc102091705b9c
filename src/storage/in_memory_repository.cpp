#include "fin-forecast/storage/in_memory_repository.hpp"

#include "fin-forecast/utils/logging.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace finforecast::storage {

InMemoryForecastRepository::InMemoryForecastRepository(core::Clock clock) : clock_(std::move(clock)) {
	if (!clock_) {
		throw std::invalid_argument("InMemoryForecastRepository requires a clock.");
	}
}

std::string InMemoryForecastRepository::nextId() {
	char buffer[32];
	std::snprintf(buffer, sizeof(buffer), "fc-%06llu", static_cast<unsigned long long>(++sequence_));
	return buffer;
}

std::string InMemoryForecastRepository::insert(core::BudgetForecast forecast) {
	std::lock_guard<std::mutex> lock(mutex_);
	forecast.refreshStatus(clock_());
	forecast.id = nextId();
	const auto id = forecast.id;
	forecasts_.emplace(id, std::move(forecast));
	FINFORECAST_DEBUG("Stored forecast {}.", id);
	return id;
}

std::optional<core::BudgetForecast> InMemoryForecastRepository::find(const std::string &id,
                                                                     const std::string &user_id) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = forecasts_.find(id);
	if (it == forecasts_.end() || it->second.user_id != user_id) {
		return std::nullopt;
	}
	it->second.refreshStatus(clock_());
	return it->second;
}

std::vector<core::BudgetForecast> InMemoryForecastRepository::list(const ForecastQuery &query) {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto now = clock_();
	std::vector<core::BudgetForecast> result;
	for (auto &entry : forecasts_) {
		auto &forecast = entry.second;
		if (forecast.user_id != query.user_id) {
			continue;
		}
		forecast.refreshStatus(now);
		if (query.status && forecast.status != *query.status) {
			continue;
		}
		if (query.category && forecast.category != query.category) {
			continue;
		}
		if (query.period_type && forecast.forecast_period.period_type != *query.period_type) {
			continue;
		}
		result.push_back(forecast);
	}
	std::stable_sort(result.begin(), result.end(), [](const core::BudgetForecast &a, const core::BudgetForecast &b) {
		return a.forecast_period.start_date > b.forecast_period.start_date;
	});
	return result;
}

std::optional<core::BudgetForecast> InMemoryForecastRepository::modify(const std::string &id,
                                                                       const std::string &user_id,
                                                                       const Mutator &mutator) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = forecasts_.find(id);
	if (it == forecasts_.end() || it->second.user_id != user_id) {
		return std::nullopt;
	}
	// Work on a copy so a throwing mutator leaves the stored document untouched.
	core::BudgetForecast working = it->second;
	const bool changed = mutator(working);
	const bool expired = working.refreshStatus(clock_());
	if (changed || expired) {
		it->second = std::move(working);
	}
	return it->second;
}

std::size_t InMemoryForecastRepository::size() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return forecasts_.size();
}

} // namespace finforecast::storage
