#include <catch2/catch_test_macros.hpp>

#include "salescast/io/json.hpp"
#include "salescast/service/engine_config.hpp"

#include <stdexcept>

using salescast::service::EngineConfig;

TEST_CASE("Empty config keeps every default", "[service][config]") {
	const auto config = EngineConfig::fromJson(Json::Value(Json::objectValue));

	REQUIRE(config.log_level == "info");
	REQUIRE(config.default_params.has_value());
	REQUIRE(config.default_params->trend_flexibility == 0.05);
	REQUIRE_FALSE(config.parameters_file.has_value());
	REQUIRE(config.orchestrator.allowed_periods == std::set<int>{3, 6});
	REQUIRE(config.orchestrator.holdout_size == 3);
	REQUIRE(config.orchestrator.region == "ID");
	REQUIRE(config.orchestrator.fitter.n_changepoints == 25);
	REQUIRE(config.service.worker_threads == 2);
	REQUIRE(config.cache_enabled);
	REQUIRE(config.cache_capacity == 256);
	REQUIRE(config.tuning.cv.initial_window == 12);
}

TEST_CASE("Config sections override their defaults", "[service][config]") {
	const auto config = EngineConfig::fromJson(salescast::io::parseJson(R"({
		"log_level": "debug",
		"default_parameters": {"changepoint_prior_scale": 0.1, "seasonality_mode": "multiplicative"},
		"parameters_file": "params.json",
		"forecast": {"allowed_periods": [3, 6, 12], "holdout_size": 4, "region": "US", "min_nonzero_buckets": 6},
		"fitter": {"n_changepoints": 10, "yearly_order": 4, "log_transform": true},
		"service": {"worker_threads": 8, "queue_capacity": 128, "cache_enabled": false},
		"tuning": {"max_parallel": 2, "initial_window": 18, "horizon": 3}
	})"));

	REQUIRE(config.log_level == "debug");
	REQUIRE(config.default_params->trend_flexibility == 0.1);
	REQUIRE(config.default_params->seasonality_mode == salescast::params::SeasonalityMode::Multiplicative);
	REQUIRE(config.default_params->category == "default");
	REQUIRE(*config.parameters_file == "params.json");
	REQUIRE(config.orchestrator.allowed_periods == std::set<int>{3, 6, 12});
	REQUIRE(config.orchestrator.holdout_size == 4);
	REQUIRE(config.orchestrator.region == "US");
	REQUIRE(*config.orchestrator.aggregator.min_nonzero_buckets == 6);
	REQUIRE(config.orchestrator.fitter.n_changepoints == 10);
	REQUIRE(*config.orchestrator.fitter.yearly_order == 4);
	REQUIRE(config.orchestrator.fitter.log_transform);
	REQUIRE(config.service.worker_threads == 8);
	REQUIRE(config.service.queue_capacity == 128);
	REQUIRE_FALSE(config.cache_enabled);
	REQUIRE(config.tuning.max_parallel == 2);
	REQUIRE(config.tuning.cv.initial_window == 18);
	REQUIRE(config.tuning.cv.horizon == 3);
	REQUIRE(config.tuning.cv.step == 1);
}

TEST_CASE("A null default removes the fallback parameters", "[service][config]") {
	const auto config = EngineConfig::fromJson(salescast::io::parseJson(R"({"default_parameters": null})"));
	REQUIRE_FALSE(config.default_params.has_value());
}

TEST_CASE("Malformed config values are rejected", "[service][config][error]") {
	using salescast::io::parseJson;
	REQUIRE_THROWS_AS(EngineConfig::fromJson(Json::Value(Json::arrayValue)), std::invalid_argument);
	REQUIRE_THROWS_AS(EngineConfig::fromJson(parseJson(R"({"log_level": 3})")), std::invalid_argument);
	REQUIRE_THROWS_AS(EngineConfig::fromJson(parseJson(R"({"forecast": []})")), std::invalid_argument);
	REQUIRE_THROWS_AS(EngineConfig::fromJson(parseJson(R"({"fitter": {"n_changepoints": "many"}})")),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(EngineConfig::fromJson(parseJson(R"({"fitter": {"interval_width": 1.5}})")),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(EngineConfig::fromJson(parseJson(R"({"service": {"worker_threads": 0}})")),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(EngineConfig::fromJson(parseJson(R"({"default_parameters": {"holiday_strength": -2}})")),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(EngineConfig::fromFile("/nonexistent/salescast.json"), std::invalid_argument);
}
