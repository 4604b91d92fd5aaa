#include "salescast/params/parameter_resolver.hpp"

#include "salescast/core/errors.hpp"
#include "salescast/utils/logging.hpp"

#include <stdexcept>

namespace salescast::params {

ParameterResolver::ParameterResolver(std::shared_ptr<const ParameterSource> source,
                                     std::optional<HyperparameterSet> default_params)
    : source_(std::move(source)), default_params_(std::move(default_params)) {
	if (!source_) {
		throw std::invalid_argument("ParameterResolver requires a parameter source.");
	}
	if (default_params_) {
		default_params_->category = HyperparameterSet::kDefaultCategory;
		default_params_->validate();
	}
}

HyperparameterSet ParameterResolver::resolve(const std::string &category) const {
	if (auto tuned = source_->lookup(category)) {
		SALESCAST_DEBUG("Using tuned parameters for category '{}'.", category);
		return *tuned;
	}
	if (!default_params_) {
		throw core::MissingDefaultParametersError("No parameters for category '" + category +
		                                          "' and no default parameter set is configured.");
	}
	SALESCAST_DEBUG("No tuned parameters for category '{}'; using defaults.", category);
	return *default_params_;
}

} // namespace salescast::params
