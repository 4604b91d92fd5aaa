#pragma once

#include "salescast/aggregation/aggregator.hpp"
#include "salescast/calendar/holiday_provider.hpp"
#include "salescast/core/forecast.hpp"
#include "salescast/core/transaction.hpp"
#include "salescast/models/model_fitter.hpp"
#include "salescast/params/parameter_resolver.hpp"
#include "salescast/service/model_cache.hpp"
#include "salescast/validation/error_evaluator.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace salescast::service {

struct ForecastRequest {
	std::string product_id;
	std::string category;
	int periods = 3;
	core::Granularity granularity = core::Granularity::Monthly;
};

struct OrchestratorConfig {
	std::set<int> allowed_periods{3, 6};
	std::size_t holdout_size = validation::ErrorEvaluator::kDefaultHoldout;
	/// Holiday calendar region; an unknown region disables holiday effects.
	std::string region = "ID";
	aggregation::AggregatorOptions aggregator;
	models::FitterOptions fitter;
};

/**
 * @class ForecastOrchestrator
 * @brief Runs one forecast request end to end.
 *
 * aggregate -> holidays -> hyperparameters -> fit -> backtest -> project.
 * Every error except an unsupported holiday region reaches the caller
 * unchanged, and no partial result is ever returned.
 */
class ForecastOrchestrator {
public:
	/**
	 * @param cache Optional; when null every request refits.
	 * @throws std::invalid_argument If a collaborator is null or the config is invalid.
	 */
	ForecastOrchestrator(std::shared_ptr<const core::TransactionSource> transactions,
	                     std::shared_ptr<const calendar::HolidaySource> holidays, params::ParameterResolver resolver,
	                     OrchestratorConfig config = {}, std::shared_ptr<ModelCache> cache = nullptr);

	/**
	 * @throws core::InvalidPeriodsError If @p periods is not allowed; checked before any work.
	 * @throws core::InsufficientHistoryError, core::MissingDefaultParametersError, core::ModelFitError
	 */
	core::ForecastResult forecast(const std::string &product_id, const std::string &category, int periods,
	                              core::Granularity granularity) const;

	core::ForecastResult forecast(const ForecastRequest &request) const {
		return forecast(request.product_id, request.category, request.periods, request.granularity);
	}

	/// Call after new transactions for @p product_id were recorded.
	void onTransactionsRecorded(const std::string &product_id);

	const OrchestratorConfig &config() const {
		return config_;
	}

	const std::shared_ptr<ModelCache> &cache() const {
		return cache_;
	}

private:
	std::shared_ptr<const core::TransactionSource> transactions_;
	calendar::HolidayCalendarProvider holidays_;
	params::ParameterResolver resolver_;
	OrchestratorConfig config_;
	std::shared_ptr<ModelCache> cache_;
	aggregation::TimeSeriesAggregator aggregator_;
	models::ForecastModelFitter fitter_;
	validation::ErrorEvaluator evaluator_;
};

/**
 * @brief Builder for ForecastOrchestrator
 */
class ForecastOrchestratorBuilder {
public:
	ForecastOrchestratorBuilder() = default;

	ForecastOrchestratorBuilder &withTransactions(std::shared_ptr<const core::TransactionSource> source) {
		transactions_ = std::move(source);
		return *this;
	}

	ForecastOrchestratorBuilder &withHolidays(std::shared_ptr<const calendar::HolidaySource> source) {
		holidays_ = std::move(source);
		return *this;
	}

	ForecastOrchestratorBuilder &withParameters(std::shared_ptr<const params::ParameterSource> source) {
		parameters_ = std::move(source);
		return *this;
	}

	ForecastOrchestratorBuilder &withDefaultParameters(std::optional<params::HyperparameterSet> defaults) {
		defaults_ = std::move(defaults);
		return *this;
	}

	ForecastOrchestratorBuilder &withAllowedPeriods(std::set<int> periods) {
		config_.allowed_periods = std::move(periods);
		return *this;
	}

	ForecastOrchestratorBuilder &withHoldout(std::size_t holdout) {
		config_.holdout_size = holdout;
		return *this;
	}

	ForecastOrchestratorBuilder &withRegion(std::string region) {
		config_.region = std::move(region);
		return *this;
	}

	ForecastOrchestratorBuilder &withAggregatorOptions(aggregation::AggregatorOptions options) {
		config_.aggregator = options;
		return *this;
	}

	ForecastOrchestratorBuilder &withFitterOptions(models::FitterOptions options) {
		config_.fitter = std::move(options);
		return *this;
	}

	ForecastOrchestratorBuilder &withConfig(OrchestratorConfig config) {
		config_ = std::move(config);
		return *this;
	}

	ForecastOrchestratorBuilder &withCache(std::shared_ptr<ModelCache> cache) {
		cache_ = std::move(cache);
		return *this;
	}

	/// Missing sources default to the built-in holiday calendars and an empty parameter store.
	std::unique_ptr<ForecastOrchestrator> build();

private:
	std::shared_ptr<const core::TransactionSource> transactions_;
	std::shared_ptr<const calendar::HolidaySource> holidays_;
	std::shared_ptr<const params::ParameterSource> parameters_;
	std::optional<params::HyperparameterSet> defaults_ = params::HyperparameterSet{};
	OrchestratorConfig config_;
	std::shared_ptr<ModelCache> cache_;
};

} // namespace salescast::service
