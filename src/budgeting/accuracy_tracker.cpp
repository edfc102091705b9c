#include "fin-forecast/budgeting/accuracy_tracker.hpp"

#include "fin-forecast/core/errors.hpp"
#include "fin-forecast/utils/logging.hpp"

#include <cmath>

namespace finforecast::budgeting {

AccuracyTracker::AccuracyTracker(storage::ForecastRepository &repository, sources::ActualSpendSource &actuals,
                                 core::Clock clock, std::size_t accuracy_window)
    : repository_(repository), actuals_(actuals), clock_(std::move(clock)), accuracy_window_(accuracy_window) {
}

AccuracyUpdateSummary AccuracyTracker::update(const std::string &user_id) const {
	AccuracyUpdateSummary summary;
	const auto now = clock_();

	storage::ForecastQuery query;
	query.user_id = user_id;
	const auto forecasts = repository_.list(query);

	for (const auto &forecast : forecasts) {
		++summary.forecasts_examined;
		for (const auto &prediction : forecast.predictions) {
			if (!(prediction.date < now) || forecast.hasTrackedMonth(prediction.date)) {
				continue;
			}

			const auto month = core::calendar::yearMonthOf(prediction.date);
			const auto actual = actuals_.fetchActualSpending(user_id, forecast.category,
			                                                 core::calendar::startOfMonth(month),
			                                                 core::calendar::endOfMonth(month));
			if (!actual) {
				++summary.months_pending;
				continue;
			}
			if (!std::isfinite(*actual)) {
				throw core::UpstreamDataError("Actual-spend source returned a non-finite amount.");
			}

			bool appended = false;
			repository_.modify(forecast.id, user_id, [&](core::BudgetForecast &stored) {
				appended = stored.trackAccuracy(prediction.date, prediction.predicted_amount, *actual, now,
				                                accuracy_window_);
				return appended;
			});
			if (appended) {
				++summary.entries_recorded;
				FINFORECAST_DEBUG("Tracked {} for forecast {}: predicted {:.2f}, actual {:.2f}.", month.toString(),
				                  forecast.id, prediction.predicted_amount, *actual);
			}
		}
	}

	FINFORECAST_INFO("Accuracy update for user {}: {} forecasts, {} entries recorded, {} months pending.", user_id,
	                 summary.forecasts_examined, summary.entries_recorded, summary.months_pending);
	return summary;
}

} // namespace finforecast::budgeting
