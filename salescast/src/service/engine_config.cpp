#include "salescast/service/engine_config.hpp"

#include "salescast/io/json.hpp"

#include <json/json.h>

#include <set>
#include <stdexcept>
#include <utility>

namespace salescast::service {

namespace {

[[noreturn]] void wrongType(const char *key, const char *expected) {
	throw std::invalid_argument(std::string("Config key '") + key + "' must be " + expected + ".");
}

void readIfPresent(const Json::Value &section, const char *key, std::string &target) {
	if (!section.isMember(key)) {
		return;
	}
	const auto &value = section[key];
	if (!value.isString()) {
		wrongType(key, "a string");
	}
	target = value.asString();
}

void readIfPresent(const Json::Value &section, const char *key, int &target) {
	if (!section.isMember(key)) {
		return;
	}
	const auto &value = section[key];
	if (!value.isInt()) {
		wrongType(key, "an integer");
	}
	target = value.asInt();
}

void readIfPresent(const Json::Value &section, const char *key, std::size_t &target) {
	if (!section.isMember(key)) {
		return;
	}
	const auto &value = section[key];
	if (!value.isUInt64()) {
		wrongType(key, "a non-negative integer");
	}
	target = static_cast<std::size_t>(value.asUInt64());
}

void readIfPresent(const Json::Value &section, const char *key, double &target) {
	if (!section.isMember(key)) {
		return;
	}
	const auto &value = section[key];
	if (!value.isNumeric()) {
		wrongType(key, "a number");
	}
	target = value.asDouble();
}

void readIfPresent(const Json::Value &section, const char *key, bool &target) {
	if (!section.isMember(key)) {
		return;
	}
	const auto &value = section[key];
	if (!value.isBool()) {
		wrongType(key, "a boolean");
	}
	target = value.asBool();
}

void readIfPresent(const Json::Value &section, const char *key, std::set<int> &target) {
	if (!section.isMember(key)) {
		return;
	}
	const auto &value = section[key];
	if (!value.isArray()) {
		wrongType(key, "an array of integers");
	}
	std::set<int> result;
	for (const auto &element : value) {
		if (!element.isInt()) {
			wrongType(key, "an array of integers");
		}
		result.insert(element.asInt());
	}
	target = std::move(result);
}

const Json::Value *sectionOf(const Json::Value &j, const char *name) {
	if (!j.isMember(name)) {
		return nullptr;
	}
	const auto &section = j[name];
	if (!section.isObject()) {
		throw std::invalid_argument(std::string("Config section '") + name + "' must be an object.");
	}
	return &section;
}

} // namespace

EngineConfig EngineConfig::fromFile(const std::string &path) {
	return fromJson(io::readJsonFile(path));
}

EngineConfig EngineConfig::fromJson(const Json::Value &j) {
	if (!j.isObject()) {
		throw std::invalid_argument("Engine config must be a JSON object.");
	}
	EngineConfig config;
	readIfPresent(j, "log_level", config.log_level);

	if (j.isMember("default_parameters")) {
		const auto &defaults = j["default_parameters"];
		if (defaults.isNull()) {
			config.default_params.reset();
		} else {
			config.default_params = io::hyperparametersFromJson(defaults, params::HyperparameterSet{},
			                                                    params::HyperparameterSet::kDefaultCategory);
		}
	}
	if (j.isMember("parameters_file")) {
		std::string path;
		readIfPresent(j, "parameters_file", path);
		config.parameters_file = path;
	}

	if (const auto *forecast = sectionOf(j, "forecast")) {
		auto &oc = config.orchestrator;
		if (forecast->isMember("allowed_periods")) {
			std::set<int> periods;
			readIfPresent(*forecast, "allowed_periods", periods);
			oc.allowed_periods = periods;
		}
		readIfPresent(*forecast, "holdout_size", oc.holdout_size);
		readIfPresent(*forecast, "region", oc.region);
		if (forecast->isMember("min_nonzero_buckets")) {
			std::size_t minimum = 0;
			readIfPresent(*forecast, "min_nonzero_buckets", minimum);
			oc.aggregator.min_nonzero_buckets = minimum;
		}
		readIfPresent(*forecast, "clip_negative_quantities", oc.aggregator.clip_negative_quantities);
	}

	if (const auto *fitter = sectionOf(j, "fitter")) {
		auto &fo = config.orchestrator.fitter;
		readIfPresent(*fitter, "n_changepoints", fo.n_changepoints);
		readIfPresent(*fitter, "changepoint_range", fo.changepoint_range);
		readIfPresent(*fitter, "holiday_window", fo.holiday_window);
		readIfPresent(*fitter, "interval_width", fo.interval_width);
		readIfPresent(*fitter, "max_iterations", fo.max_iterations);
		readIfPresent(*fitter, "log_transform", fo.log_transform);
		readIfPresent(*fitter, "clip_negative", fo.clip_negative);
		readIfPresent(*fitter, "monthly_indicators", fo.monthly_indicators);
		if (fitter->isMember("yearly_order")) {
			int order = 0;
			readIfPresent(*fitter, "yearly_order", order);
			fo.yearly_order = order;
		}
		readIfPresent(*fitter, "weekly_order", fo.weekly_order);
		fo.validate();
	}

	if (const auto *service = sectionOf(j, "service")) {
		readIfPresent(*service, "worker_threads", config.service.worker_threads);
		readIfPresent(*service, "queue_capacity", config.service.queue_capacity);
		readIfPresent(*service, "cache_enabled", config.cache_enabled);
		readIfPresent(*service, "cache_capacity", config.cache_capacity);
	}

	if (const auto *tuning = sectionOf(j, "tuning")) {
		readIfPresent(*tuning, "max_parallel", config.tuning.max_parallel);
		readIfPresent(*tuning, "initial_window", config.tuning.cv.initial_window);
		readIfPresent(*tuning, "horizon", config.tuning.cv.horizon);
		readIfPresent(*tuning, "step", config.tuning.cv.step);
	}

	if (config.service.worker_threads == 0 || config.service.queue_capacity == 0 || config.cache_capacity == 0 ||
	    config.tuning.max_parallel == 0) {
		throw std::invalid_argument("Thread, queue, cache and parallelism sizes must be positive.");
	}
	return config;
}

} // namespace salescast::service
