#include "salescast/service/model_cache.hpp"

#include "salescast/utils/logging.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace salescast::service {

namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

void mix(std::uint64_t &hash, const void *data, std::size_t size) {
	const auto *bytes = static_cast<const unsigned char *>(data);
	for (std::size_t i = 0; i < size; ++i) {
		hash ^= bytes[i];
		hash *= kFnvPrime;
	}
}

} // namespace

ModelCache::ModelCache(std::size_t capacity) : capacity_(capacity) {
	if (capacity_ == 0) {
		throw std::invalid_argument("ModelCache capacity must be positive.");
	}
}

std::uint64_t ModelCache::seriesFingerprint(const core::TimeSeries &series) {
	std::uint64_t hash = kFnvOffset;
	const auto granularity = static_cast<std::int32_t>(series.granularity());
	mix(hash, &granularity, sizeof(granularity));
	for (const auto &date : series.dates()) {
		const auto day = date.dayNumber();
		mix(hash, &day, sizeof(day));
	}
	for (double value : series.values()) {
		std::uint64_t bits = 0;
		std::memcpy(&bits, &value, sizeof(bits));
		mix(hash, &bits, sizeof(bits));
	}
	return hash;
}

ModelKey ModelCache::makeKey(const std::string &product_id, const std::string &category,
                             const params::HyperparameterSet &params, const core::TimeSeries &series) {
	return ModelKey{product_id, category, params.fingerprint(), seriesFingerprint(series)};
}

std::shared_ptr<const models::FittedModel> ModelCache::find(const ModelKey &key) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = entries_.find(key);
	return it == entries_.end() ? nullptr : it->second;
}

std::shared_ptr<const models::FittedModel> ModelCache::getOrFit(const ModelKey &key,
                                                                const std::function<models::FittedModel()> &fit) {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		const auto it = entries_.find(key);
		if (it != entries_.end()) {
			++hits_;
			return it->second;
		}
		++misses_;
	}

	auto model = std::make_shared<const models::FittedModel>(fit());

	std::lock_guard<std::mutex> lock(mutex_);
	const auto inserted = entries_.emplace(key, model);
	if (!inserted.second) {
		return inserted.first->second;
	}
	insertion_order_.push_back(key);
	while (entries_.size() > capacity_) {
		entries_.erase(insertion_order_.front());
		insertion_order_.pop_front();
	}
	return model;
}

std::size_t ModelCache::invalidate(const std::string &product_id) {
	std::lock_guard<std::mutex> lock(mutex_);
	std::size_t removed = 0;
	for (auto it = entries_.begin(); it != entries_.end();) {
		if (it->first.product_id == product_id) {
			it = entries_.erase(it);
			++removed;
		} else {
			++it;
		}
	}
	insertion_order_.erase(std::remove_if(insertion_order_.begin(), insertion_order_.end(),
	                                      [&product_id](const ModelKey &key) { return key.product_id == product_id; }),
	                       insertion_order_.end());
	if (removed > 0) {
		SALESCAST_DEBUG("Invalidated {} cached model(s) for product '{}'", removed, product_id);
	}
	return removed;
}

void ModelCache::clear() {
	std::lock_guard<std::mutex> lock(mutex_);
	entries_.clear();
	insertion_order_.clear();
}

std::size_t ModelCache::size() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return entries_.size();
}

std::size_t ModelCache::hits() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return hits_;
}

std::size_t ModelCache::misses() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return misses_;
}

} // namespace salescast::service
