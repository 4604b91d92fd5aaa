#pragma once

#include "salescast/params/hyperparameters.hpp"

#include <json/forwards.h>

#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace salescast::params {

/**
 * @class ParameterSource
 * @brief Key-based lookup of tuned hyperparameters by category.
 */
class ParameterSource {
public:
	virtual ~ParameterSource() = default;

	virtual std::optional<HyperparameterSet> lookup(const std::string &category) const = 0;
};

/// Thread-safe map of category to parameters; the tuner publishes into it.
class InMemoryParameterSource : public ParameterSource {
public:
	/// @throws std::invalid_argument If @p params does not validate.
	void upsert(HyperparameterSet params);
	bool erase(const std::string &category);
	std::vector<std::string> categories() const;

	std::optional<HyperparameterSet> lookup(const std::string &category) const override;

private:
	mutable std::shared_mutex mutex_;
	std::map<std::string, HyperparameterSet> by_category_;
};

/**
 * @class JsonParameterSource
 * @brief Category parameters loaded once from a JSON document.
 *
 * The document is an object keyed by category:
 * @code
 * { "Beverages": { "trend_flexibility": 0.1, "seasonality_mode": "multiplicative" } }
 * @endcode
 * Keys left out take the values of @p base. The back-office names
 * changepoint_prior_scale, seasonality_prior_scale and holidays_prior_scale
 * are accepted as aliases.
 */
class JsonParameterSource : public ParameterSource {
public:
	/// @throws std::invalid_argument If the file cannot be read or an entry is malformed.
	static JsonParameterSource fromFile(const std::string &path, const HyperparameterSet &base = {});
	/// @throws std::invalid_argument If the text is not valid JSON or an entry is malformed.
	static JsonParameterSource fromString(const std::string &text, const HyperparameterSet &base = {});
	/// @throws std::invalid_argument If @p document is not an object or an entry is malformed.
	static JsonParameterSource fromDocument(const Json::Value &document, const HyperparameterSet &base = {});

	std::optional<HyperparameterSet> lookup(const std::string &category) const override;

	std::size_t size() const {
		return by_category_.size();
	}

private:
	std::map<std::string, HyperparameterSet> by_category_;
};

} // namespace salescast::params
