#include "fin-forecast/core/monthly_series.hpp"

#include <cmath>
#include <numeric>
#include <stdexcept>

namespace finforecast::core {

MonthlySeries::MonthlySeries(std::vector<TimePoint> dates, std::vector<double> amounts)
    : dates_(std::move(dates)), amounts_(std::move(amounts)) {
	validate();
}

MonthlySeries::MonthlySeries(const std::vector<HistoricalPoint> &points) {
	dates_.reserve(points.size());
	amounts_.reserve(points.size());
	for (const auto &point : points) {
		dates_.push_back(point.date);
		amounts_.push_back(point.amount);
	}
	validate();
}

HistoricalPoint MonthlySeries::at(std::size_t index) const {
	if (index >= size()) {
		throw std::out_of_range("Requested month exceeds the series length.");
	}
	return HistoricalPoint{dates_[index], amounts_[index]};
}

std::vector<HistoricalPoint> MonthlySeries::points() const {
	std::vector<HistoricalPoint> result;
	result.reserve(size());
	for (std::size_t i = 0; i < size(); ++i) {
		result.push_back(HistoricalPoint{dates_[i], amounts_[i]});
	}
	return result;
}

double MonthlySeries::average() const {
	if (amounts_.empty()) {
		return 0.0;
	}
	return std::accumulate(amounts_.begin(), amounts_.end(), 0.0) / static_cast<double>(amounts_.size());
}

void MonthlySeries::validate() const {
	if (dates_.size() != amounts_.size()) {
		throw std::invalid_argument("Dates and amounts vectors must have the same size.");
	}
	for (std::size_t i = 0; i < amounts_.size(); ++i) {
		if (!std::isfinite(amounts_[i])) {
			throw std::invalid_argument("Monthly amounts must be finite.");
		}
		if (i > 0 && !(calendar::yearMonthOf(dates_[i - 1]) < calendar::yearMonthOf(dates_[i]))) {
			throw std::invalid_argument("MonthlySeries months must be strictly increasing and unique.");
		}
	}
}

} // namespace finforecast::core
