#include "salescast/aggregation/aggregator.hpp"
#include "salescast/calendar/builtin_holidays.hpp"
#include "salescast/calendar/holiday_provider.hpp"
#include "salescast/core/transaction.hpp"
#include "salescast/io/json.hpp"
#include "salescast/params/parameter_source.hpp"
#include "salescast/service/engine_config.hpp"
#include "salescast/service/forecast_orchestrator.hpp"
#include "salescast/service/forecast_service.hpp"
#include "salescast/tuning/parameter_tuner.hpp"
#include "salescast/utils/logging.hpp"

#include <cmath>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace salescast;

namespace {

// Three years of daily sales with a yearly cycle and a bump every December.
std::vector<core::Transaction> syntheticSales(const std::string &product, const std::string &category,
                                              double base) {
	std::vector<core::Transaction> out;
	const auto start = core::Date::fromCivil(2021, 1, 1);
	for (int day = 0; day < 3 * 365; day += 2) {
		const auto date = start.plusDays(day);
		const double season = 1.0 + 0.3 * std::sin(2.0 * M_PI * date.month() / 12.0);
		const double december = date.month() == 12 ? 1.4 : 1.0;
		const double growth = 1.0 + 0.0005 * day;
		out.push_back(core::Transaction{date, product, std::round(base * season * december * growth), category});
	}
	return out;
}

void printHeader(const std::string &title) {
	std::cout << "\n" << std::string(80, '=') << "\n";
	std::cout << title << "\n";
	std::cout << std::string(80, '=') << "\n";
}

} // namespace

int main(int argc, char *argv[]) {
	service::EngineConfig config;
	try {
		if (argc > 1) {
			config = service::EngineConfig::fromFile(argv[1]);
		}
		utils::Logging::init(config.log_level);
	} catch (const std::exception &e) {
		std::cerr << "Failed to load engine config: " << e.what() << "\n";
		return 1;
	}

	auto history = syntheticSales("SKU-001", "Beverages", 40.0);
	const auto second = syntheticSales("SKU-002", "Beverages", 15.0);
	history.insert(history.end(), second.begin(), second.end());

	auto transactions = std::make_shared<core::InMemoryTransactionSource>();
	transactions->record(history);

	auto tuned = std::make_shared<params::InMemoryParameterSource>();
	std::shared_ptr<const params::ParameterSource> parameters = tuned;
	auto holiday_source = std::make_shared<calendar::BuiltinHolidaySource>();

	if (config.parameters_file) {
		try {
			parameters = std::make_shared<const params::JsonParameterSource>(params::JsonParameterSource::fromFile(
			    *config.parameters_file, config.default_params.value_or(params::HyperparameterSet{})));
		} catch (const std::exception &e) {
			std::cerr << "Failed to load category parameters: " << e.what() << "\n";
			return 1;
		}
	}

	printHeader("Tuning category 'Beverages'");
	if (config.parameters_file) {
		std::cout << "Using category parameters from " << *config.parameters_file << "\n";
	} else {
		try {
			aggregation::TimeSeriesAggregator aggregator(config.orchestrator.aggregator);
			const auto category_series =
			    aggregator.aggregateCategory(history, "Beverages", core::Granularity::Monthly);
			calendar::HolidayCalendarProvider provider(holiday_source);
			const auto holidays = provider.holidaysOrEmpty(
			    config.orchestrator.region, category_series.firstDate().year(), category_series.lastDate().year());

			tuning::ParameterGrid grid;
			grid.trend_flexibility = {0.01, 0.05, 0.5};
			grid.seasonality_strength = {1.0, 10.0};
			grid.seasonality_mode = {params::SeasonalityMode::Additive, params::SeasonalityMode::Multiplicative};

			const validation::ErrorEvaluator evaluator{models::ForecastModelFitter(config.orchestrator.fitter)};
			tuning::ParameterTuner tuner(evaluator, config.default_params.value_or(params::HyperparameterSet{}),
			                             config.tuning);
			const auto report =
			    tuner.tune(category_series, "Beverages", grid, holidays, [](std::size_t done, std::size_t total) {
				    std::cout << "  evaluated " << done << "/" << total << "\r" << std::flush;
			    });
			std::cout << "\n" << io::writeJson(io::toJson(report), "  ") << "\n";
			tuned->upsert(report.best);
		} catch (const std::exception &e) {
			std::cerr << "Tuning failed: " << e.what() << "\n";
		}
	}

	auto builder = service::ForecastOrchestratorBuilder()
	                   .withTransactions(transactions)
	                   .withHolidays(holiday_source)
	                   .withParameters(parameters)
	                   .withDefaultParameters(config.default_params)
	                   .withConfig(config.orchestrator);
	if (config.cache_enabled) {
		builder.withCache(std::make_shared<service::ModelCache>(config.cache_capacity));
	}
	std::shared_ptr<const service::ForecastOrchestrator> orchestrator = builder.build();

	service::ForecastService forecasts(orchestrator, config.service);

	printHeader("Forecasts");
	std::vector<service::ForecastRequest> requests = {
	    {"SKU-001", "Beverages", 3, core::Granularity::Monthly},
	    {"SKU-002", "Beverages", 6, core::Granularity::Monthly},
	    {"SKU-002", "Snacks", 6, core::Granularity::Weekly},
	    {"SKU-001", "Beverages", 12, core::Granularity::Monthly},
	};
	std::vector<std::future<Json::Value>> pending;
	for (const auto &request : requests) {
		pending.push_back(forecasts.submitJson(request));
	}
	for (std::size_t i = 0; i < pending.size(); ++i) {
		const auto payload = pending[i].get();
		std::cout << requests[i].product_id << " / " << requests[i].category << " / " << requests[i].periods << ": ";
		if (payload.isMember("error")) {
			std::cout << io::writeJson(payload["error"]) << "\n";
			continue;
		}
		const auto &points = payload["forecast"];
		std::cout << points.size() << " points, MAPE " << io::writeJson(payload["mape"]) << "\n";
		for (const auto &point : points) {
			if (!point["is_historical"].asBool()) {
				std::cout << "    " << point["ds"].asString() << "  " << point["yhat"].asDouble() << "  ["
				          << point["yhat_lower"].asDouble() << ", " << point["yhat_upper"].asDouble() << "]\n";
			}
		}
	}
	return 0;
}
