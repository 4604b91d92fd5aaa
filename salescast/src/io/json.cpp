#include "salescast/io/json.hpp"

#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace salescast::io {

namespace {

double readScale(const Json::Value &j, const char *key, const char *alias, double fallback) {
	const char *present = j.isMember(key) ? key : (j.isMember(alias) ? alias : nullptr);
	if (!present) {
		return fallback;
	}
	const auto &value = j[present];
	if (!value.isNumeric()) {
		throw std::invalid_argument(std::string("Hyperparameter '") + present + "' must be a number.");
	}
	return value.asDouble();
}

std::vector<double> readScaleList(const Json::Value &values, const std::string &key) {
	if (!values.isArray()) {
		throw std::invalid_argument("Grid entry '" + key + "' must be an array.");
	}
	std::vector<double> out;
	for (const auto &value : values) {
		if (!value.isNumeric()) {
			throw std::invalid_argument("Grid entry '" + key + "' must contain only numbers.");
		}
		out.push_back(value.asDouble());
	}
	return out;
}

} // namespace

Json::Value parseJson(const std::string &text) {
	Json::CharReaderBuilder builder;
	std::istringstream stream(text);
	Json::Value root;
	std::string errors;
	if (!Json::parseFromStream(builder, stream, &root, &errors)) {
		throw std::invalid_argument("Invalid JSON: " + errors);
	}
	return root;
}

Json::Value readJsonFile(const std::string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw std::invalid_argument("Cannot open JSON file '" + path + "'.");
	}
	Json::CharReaderBuilder builder;
	Json::Value root;
	std::string errors;
	if (!Json::parseFromStream(builder, file, &root, &errors)) {
		throw std::invalid_argument("Invalid JSON in '" + path + "': " + errors);
	}
	return root;
}

std::string writeJson(const Json::Value &value, const std::string &indent) {
	Json::StreamWriterBuilder builder;
	builder["indentation"] = indent;
	return Json::writeString(builder, value);
}

Json::Value toJson(const core::ForecastResult &result) {
	Json::Value points(Json::arrayValue);
	for (const auto &point : result.points()) {
		Json::Value entry(Json::objectValue);
		entry["ds"] = point.date.toString();
		entry["yhat"] = point.yhat;
		entry["yhat_lower"] = point.yhat_lower;
		entry["yhat_upper"] = point.yhat_upper;
		entry["is_historical"] = point.is_historical;
		points.append(std::move(entry));
	}

	Json::Value payload(Json::objectValue);
	payload["forecast"] = std::move(points);
	payload["mape"] = result.mape() ? Json::Value(*result.mape()) : Json::Value(Json::nullValue);
	payload["mape_excluded"] = Json::Value(static_cast<Json::UInt64>(result.mapeExcluded()));
	payload["periods"] = result.periods();
	return payload;
}

Json::Value failureToJson(core::FailureReason reason, const std::string &message) {
	Json::Value error(Json::objectValue);
	error["type"] = core::toString(reason);
	error["message"] = message;
	Json::Value payload(Json::objectValue);
	payload["error"] = std::move(error);
	return payload;
}

Json::Value failureToJson(const core::ForecastError &error) {
	return failureToJson(error.reason(), error.what());
}

Json::Value toJson(const params::HyperparameterSet &params) {
	Json::Value j(Json::objectValue);
	j["category"] = params.category;
	j["trend_flexibility"] = params.trend_flexibility;
	j["seasonality_strength"] = params.seasonality_strength;
	j["holiday_strength"] = params.holiday_strength;
	j["seasonality_mode"] = params::toString(params.seasonality_mode);
	return j;
}

params::HyperparameterSet hyperparametersFromJson(const Json::Value &j, const params::HyperparameterSet &base,
                                                  const std::string &category) {
	if (!j.isObject()) {
		throw std::invalid_argument("Hyperparameters for '" + category + "' must be a JSON object.");
	}
	params::HyperparameterSet params = base;
	params.category = category;
	params.trend_flexibility =
	    readScale(j, "trend_flexibility", "changepoint_prior_scale", base.trend_flexibility);
	params.seasonality_strength =
	    readScale(j, "seasonality_strength", "seasonality_prior_scale", base.seasonality_strength);
	params.holiday_strength = readScale(j, "holiday_strength", "holidays_prior_scale", base.holiday_strength);
	if (j.isMember("seasonality_mode")) {
		const auto &mode = j["seasonality_mode"];
		if (!mode.isString()) {
			throw std::invalid_argument("Hyperparameter 'seasonality_mode' must be a string.");
		}
		params.seasonality_mode = params::parseSeasonalityMode(mode.asString());
	}
	params.validate();
	return params;
}

tuning::ParameterGrid parameterGridFromJson(const Json::Value &j) {
	if (!j.isObject()) {
		throw std::invalid_argument("Parameter grid must be a JSON object.");
	}
	tuning::ParameterGrid grid;
	for (const auto &key : j.getMemberNames()) {
		const auto &values = j[key];
		if (key == "trend_flexibility" || key == "changepoint_prior_scale") {
			grid.trend_flexibility = readScaleList(values, key);
		} else if (key == "seasonality_strength" || key == "seasonality_prior_scale") {
			grid.seasonality_strength = readScaleList(values, key);
		} else if (key == "holiday_strength" || key == "holidays_prior_scale") {
			grid.holiday_strength = readScaleList(values, key);
		} else if (key == "seasonality_mode") {
			if (!values.isArray()) {
				throw std::invalid_argument("Grid entry 'seasonality_mode' must be an array.");
			}
			for (const auto &mode : values) {
				if (!mode.isString()) {
					throw std::invalid_argument("Grid entry 'seasonality_mode' must contain only strings.");
				}
				grid.seasonality_mode.push_back(params::parseSeasonalityMode(mode.asString()));
			}
		} else {
			throw std::invalid_argument("Unknown grid parameter '" + key + "'.");
		}
	}
	return grid;
}

Json::Value toJson(const tuning::TuningReport &report) {
	Json::Value results(Json::arrayValue);
	for (const auto &result : report.results) {
		Json::Value entry(Json::objectValue);
		entry["parameters"] = toJson(result.params);
		entry["success"] = result.success;
		if (result.success) {
			entry["mape"] = result.mape ? Json::Value(*result.mape) : Json::Value(Json::nullValue);
			entry["rmse"] = result.rmse;
		} else {
			entry["error"] = result.error;
		}
		results.append(std::move(entry));
	}

	Json::Value j(Json::objectValue);
	j["category"] = report.category;
	j["best_parameters"] = toJson(report.best);
	j["best_mape"] = report.best_mape;
	j["best_rmse"] = report.best_rmse;
	j["total"] = Json::Value(static_cast<Json::UInt64>(report.total));
	j["succeeded"] = Json::Value(static_cast<Json::UInt64>(report.succeeded));
	j["failed"] = Json::Value(static_cast<Json::UInt64>(report.failed));
	j["results"] = std::move(results);
	return j;
}

} // namespace salescast::io
