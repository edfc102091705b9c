#include "fin-forecast/budgeting/forecasting_service.hpp"
#include "fin-forecast/core/errors.hpp"
#include "fin-forecast/storage/in_memory_repository.hpp"
#include "fin-forecast/utils/logging.hpp"

#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace finforecast;

namespace {

// A year of household spending per category.
std::map<std::string, std::vector<double>> householdSpending() {
	return {
	    {"groceries", {410., 395., 420., 405., 430., 415., 440., 425., 450., 435., 460., 445.}},
	    {"utilities", {180., 175., 140., 110., 95., 90., 92., 96., 120., 150., 185., 210.}},
	    {"dining", {120., 80., 95., 150., 60., 130., 170., 90., 210., 75., 140., 260.}},
	};
}

class LedgerSource final : public sources::TransactionSource {
public:
	LedgerSource(const core::TimePoint &first_month, std::map<std::string, std::vector<double>> spending) {
		for (const auto &entry : spending) {
			for (std::size_t i = 0; i < entry.second.size(); ++i) {
				const auto date = core::calendar::addDays(
				    core::calendar::addMonths(first_month, static_cast<int>(i)), 14);
				ledger_.push_back({entry.first, {date, entry.second[i]}});
			}
		}
	}

	std::vector<sources::Transaction> fetchTransactions(const std::string &, const std::optional<std::string> &category,
	                                                    const core::TimePoint &start,
	                                                    const core::TimePoint &end) override {
		std::vector<sources::Transaction> result;
		for (const auto &row : ledger_) {
			if ((!category || row.first == *category) && !(row.second.date < start) && !(end < row.second.date)) {
				result.push_back(row.second);
			}
		}
		return result;
	}

private:
	std::vector<std::pair<std::string, sources::Transaction>> ledger_;
};

class FixedBudgets final : public sources::BudgetSource {
public:
	std::optional<sources::Budget> fetchActiveBudget(const std::string &,
	                                                const std::optional<std::string> &category) override {
		if (category && *category == "groceries") {
			return sources::Budget{1250.0};
		}
		return std::nullopt;
	}
};

class NoActuals final : public sources::ActualSpendSource {
public:
	std::optional<double> fetchActualSpending(const std::string &, const std::optional<std::string> &,
	                                          const core::TimePoint &, const core::TimePoint &) override {
		return std::nullopt;
	}
};

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

void printForecast(const core::BudgetForecast &forecast) {
	std::cout << "  " << std::setw(12) << std::left << forecast.category.value_or("all") << " "
	          << std::setw(22) << core::toString(forecast.model_metadata.algorithm) << " total "
	          << std::fixed << std::setprecision(2) << std::setw(9) << std::right
	          << forecast.aggregate_forecast.total_predicted << "  trend "
	          << core::toString(forecast.aggregate_forecast.trend) << " ("
	          << forecast.aggregate_forecast.trend_percentage << "%)\n";
	for (const auto &prediction : forecast.predictions) {
		const auto civil = core::calendar::toCivil(prediction.date);
		std::cout << "      " << civil.year << "-" << std::setw(2) << std::setfill('0') << civil.month
		          << std::setfill(' ') << "  " << std::setw(8) << prediction.predicted_amount << "  ["
		          << prediction.confidence_lower << ", " << prediction.confidence_upper << "]\n";
	}
	for (const auto &recommendation : forecast.recommendations) {
		std::cout << "    * " << recommendation.title << ": " << recommendation.description << "\n";
	}
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::warn);

	const auto now = core::calendar::fromCivil(2024, 6, 1);
	LedgerSource ledger(core::calendar::fromCivil(2023, 6, 1), householdSpending());
	FixedBudgets budgets;
	NoActuals actuals;
	storage::InMemoryForecastRepository repository([now] { return now; });

	budgeting::ForecastingService service(ledger, budgets, actuals, repository, {}, [now] { return now; });

	printHeader("Quarterly forecasts");
	const std::vector<std::pair<std::string, std::string>> requests{
	    {"groceries", "exponential_smoothing"}, {"utilities", "moving_average"}, {"dining", "linear_regression"}};
	for (const auto &request : requests) {
		try {
			const auto forecast = service.generateForecast(
			    "demo-user", budgeting::ForecastRequest::fromStrings("quarterly", request.first, request.second));
			printForecast(forecast);
		} catch (const core::ForecastError &e) {
			std::cerr << "  " << request.first << ": " << e.what() << "\n";
		}
	}

	printHeader("Seasonal pattern of utilities");
	const auto pattern = service.analyzeSeasonalPatterns("demo-user", std::string("utilities"));
	for (const auto &factor : pattern.seasonal_factors) {
		std::cout << "  month " << std::setw(2) << factor.month << "  factor " << std::fixed << std::setprecision(2)
		          << factor.factor << (factor.event ? "  " + *factor.event : std::string()) << "\n";
	}
	std::cout.unsetf(std::ios::floatfield);

	printHeader("Dashboard");
	const auto summary = service.getForecastSummary("demo-user");
	std::cout << "  forecasts: " << summary.total_forecasts << "\n";
	std::cout << "  predicted spending: " << std::fixed << std::setprecision(2) << summary.total_predicted_spending
	          << "\n";
	std::cout << "  unacknowledged alerts: " << summary.alerts.total_unacknowledged << "\n";
	for (const auto &view : service.getUnacknowledgedAlerts("demo-user")) {
		std::cout << "    [" << core::toString(view.alert.severity) << "] " << view.alert.message << "\n";
	}

	try {
		service.generateForecast("demo-user", budgeting::ForecastRequest::fromStrings("monthly", "", "prophet"));
	} catch (const core::UnsupportedAlgorithmError &e) {
		std::cout << "\n  " << e.what() << "\n";
	}
	return 0;
}
