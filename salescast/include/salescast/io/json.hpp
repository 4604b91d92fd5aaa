#pragma once

#include "salescast/core/errors.hpp"
#include "salescast/core/forecast.hpp"
#include "salescast/params/hyperparameters.hpp"
#include "salescast/tuning/parameter_tuner.hpp"

#include <json/json.h>

#include <string>

namespace salescast::io {

/// @throws std::invalid_argument If @p text is not valid JSON.
Json::Value parseJson(const std::string &text);

/// @throws std::invalid_argument If the file cannot be opened or is not valid JSON.
Json::Value readJsonFile(const std::string &path);

/// Compact single-line text, or indented when @p indent is non-empty.
std::string writeJson(const Json::Value &value, const std::string &indent = "");

/**
 * @brief Serializes a forecast into the API payload.
 *
 * Shape: {"forecast": [{"ds", "yhat", "yhat_lower", "yhat_upper",
 * "is_historical"}...], "mape": number|null, "mape_excluded": int, "periods": int}.
 * An undefined MAPE is written as null, never as 0.
 */
Json::Value toJson(const core::ForecastResult &result);

/// {"error": {"type": "<ErrorName>", "message": "..."}}
Json::Value failureToJson(core::FailureReason reason, const std::string &message);
Json::Value failureToJson(const core::ForecastError &error);

Json::Value toJson(const params::HyperparameterSet &params);

/**
 * @brief Reads a hyperparameter set, filling unspecified keys from @p base.
 * @throws std::invalid_argument If @p j is not an object or a value has the wrong type.
 */
params::HyperparameterSet hyperparametersFromJson(const Json::Value &j, const params::HyperparameterSet &base,
                                                  const std::string &category);

/**
 * @brief Reads a tuning grid: an object mapping parameter names to arrays of candidates.
 *
 * Accepts the same key aliases as hyperparametersFromJson().
 * @throws std::invalid_argument On unknown keys, non-array values or wrong element types.
 */
tuning::ParameterGrid parameterGridFromJson(const Json::Value &j);

Json::Value toJson(const tuning::TuningReport &report);

} // namespace salescast::io
