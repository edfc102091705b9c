#pragma once

#include "fin-forecast/sources/collaborators.hpp"
#include "fin-forecast/storage/forecast_repository.hpp"

#include <cstddef>
#include <string>

namespace finforecast::budgeting {

struct AccuracyUpdateSummary {
	std::size_t forecasts_examined = 0;
	std::size_t entries_recorded = 0;
	/// Past prediction months for which no actual spend exists yet.
	std::size_t months_pending = 0;
};

/**
 * @class AccuracyTracker
 * @brief Compares past predictions of a user's active forecasts with realised spend.
 *
 * Each prediction month is recorded at most once per forecast. Actual spend is fetched
 * outside the store's lock; the append re-checks the month inside modify(), so two
 * concurrent runs for the same user cannot both record it.
 *
 * A prediction counts as past as soon as its date is before "now", and the first
 * prediction of a forecast is dated at generation time. A run inside that month
 * records the month-to-date spend as the actual, and the entry is never revised.
 * Schedule runs after month-end to record complete months.
 */
class AccuracyTracker {
public:
	AccuracyTracker(storage::ForecastRepository &repository, sources::ActualSpendSource &actuals, core::Clock clock,
	                std::size_t accuracy_window = 10);

	AccuracyUpdateSummary update(const std::string &user_id) const;

private:
	storage::ForecastRepository &repository_;
	sources::ActualSpendSource &actuals_;
	core::Clock clock_;
	std::size_t accuracy_window_;
};

} // namespace finforecast::budgeting
