#include "salescast/params/parameter_source.hpp"

#include "salescast/io/json.hpp"

#include <stdexcept>

namespace salescast::params {

void InMemoryParameterSource::upsert(HyperparameterSet params) {
	params.validate();
	std::unique_lock<std::shared_mutex> lock(mutex_);
	by_category_[params.category] = std::move(params);
}

bool InMemoryParameterSource::erase(const std::string &category) {
	std::unique_lock<std::shared_mutex> lock(mutex_);
	return by_category_.erase(category) > 0;
}

std::vector<std::string> InMemoryParameterSource::categories() const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	std::vector<std::string> names;
	names.reserve(by_category_.size());
	for (const auto &entry : by_category_) {
		names.push_back(entry.first);
	}
	return names;
}

std::optional<HyperparameterSet> InMemoryParameterSource::lookup(const std::string &category) const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	const auto it = by_category_.find(category);
	if (it == by_category_.end()) {
		return std::nullopt;
	}
	return it->second;
}

JsonParameterSource JsonParameterSource::fromFile(const std::string &path, const HyperparameterSet &base) {
	return fromDocument(io::readJsonFile(path), base);
}

JsonParameterSource JsonParameterSource::fromString(const std::string &text, const HyperparameterSet &base) {
	return fromDocument(io::parseJson(text), base);
}

JsonParameterSource JsonParameterSource::fromDocument(const Json::Value &document, const HyperparameterSet &base) {
	if (!document.isObject()) {
		throw std::invalid_argument("Parameter JSON must be an object keyed by category.");
	}
	JsonParameterSource source;
	for (const auto &category : document.getMemberNames()) {
		source.by_category_[category] = io::hyperparametersFromJson(document[category], base, category);
	}
	return source;
}

std::optional<HyperparameterSet> JsonParameterSource::lookup(const std::string &category) const {
	const auto it = by_category_.find(category);
	if (it == by_category_.end()) {
		return std::nullopt;
	}
	return it->second;
}

} // namespace salescast::params
