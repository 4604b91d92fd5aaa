#pragma once

#include "salescast/params/hyperparameters.hpp"
#include "salescast/service/forecast_orchestrator.hpp"
#include "salescast/service/forecast_service.hpp"
#include "salescast/service/model_cache.hpp"
#include "salescast/tuning/parameter_tuner.hpp"

#include <json/forwards.h>

#include <cstddef>
#include <optional>
#include <string>

namespace salescast::service {

/**
 * @struct EngineConfig
 * @brief Process-level settings of the forecasting engine.
 *
 * Loaded from a JSON document; any key left out keeps its default.
 * @code
 * {
 *   "log_level": "info",
 *   "default_parameters": { "changepoint_prior_scale": 0.05, "seasonality_prior_scale": 10.0 },
 *   "parameters_file": "category_parameters.json",
 *   "forecast": { "allowed_periods": [3, 6], "holdout_size": 3, "region": "ID",
 *                 "min_nonzero_buckets": 12, "clip_negative_quantities": true },
 *   "fitter": { "n_changepoints": 25, "changepoint_range": 0.8, "holiday_window": 1,
 *               "interval_width": 0.95, "max_iterations": 1000, "log_transform": false,
 *               "clip_negative": true, "monthly_indicators": false, "yearly_order": 6, "weekly_order": 3 },
 *   "service": { "worker_threads": 2, "queue_capacity": 64, "cache_enabled": true, "cache_capacity": 256 },
 *   "tuning": { "max_parallel": 4, "initial_window": 12, "horizon": 1, "step": 1 }
 * }
 * @endcode
 * "default_parameters": null leaves the engine without a default set, so
 * categories without tuned parameters fail with MissingDefaultParametersError.
 */
struct EngineConfig {
	std::string log_level = "info";
	std::optional<params::HyperparameterSet> default_params = params::HyperparameterSet{};
	std::optional<std::string> parameters_file;
	OrchestratorConfig orchestrator;
	ServiceOptions service;
	bool cache_enabled = true;
	std::size_t cache_capacity = ModelCache::kDefaultCapacity;
	tuning::TuningOptions tuning;

	/// @throws std::invalid_argument If the file cannot be read or holds malformed values.
	static EngineConfig fromFile(const std::string &path);
	/// @throws std::invalid_argument On malformed values.
	static EngineConfig fromJson(const Json::Value &j);
};

} // namespace salescast::service
