#pragma once

#include "salescast/params/hyperparameters.hpp"
#include "salescast/params/parameter_source.hpp"

#include <memory>
#include <optional>
#include <string>

namespace salescast::params {

/**
 * @class ParameterResolver
 * @brief Picks the hyperparameters for a category, falling back to the default.
 *
 * The default is passed in explicitly rather than read from process state, so
 * a resolver built in a test behaves exactly like one built from config.
 */
class ParameterResolver {
public:
	/// @throws std::invalid_argument If @p source is null or @p default_params does not validate.
	ParameterResolver(std::shared_ptr<const ParameterSource> source, std::optional<HyperparameterSet> default_params);

	/**
	 * @brief Exact-match lookup; on a miss, the default set tagged "default".
	 * @throws core::MissingDefaultParametersError On a miss with no default configured.
	 */
	HyperparameterSet resolve(const std::string &category) const;

	const std::optional<HyperparameterSet> &defaults() const {
		return default_params_;
	}

private:
	std::shared_ptr<const ParameterSource> source_;
	std::optional<HyperparameterSet> default_params_;
};

} // namespace salescast::params
