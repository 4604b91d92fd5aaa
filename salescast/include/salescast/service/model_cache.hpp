#pragma once

#include "salescast/core/time_series.hpp"
#include "salescast/models/fitted_model.hpp"
#include "salescast/params/hyperparameters.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>

namespace salescast::service {

/// Identity of a fitted model: who it is for, how it was tuned, what it was trained on.
struct ModelKey {
	std::string product_id;
	std::string category;
	std::string params_fingerprint;
	std::uint64_t series_fingerprint = 0;

	friend bool operator<(const ModelKey &lhs, const ModelKey &rhs) {
		return std::tie(lhs.product_id, lhs.category, lhs.params_fingerprint, lhs.series_fingerprint) <
		       std::tie(rhs.product_id, rhs.category, rhs.params_fingerprint, rhs.series_fingerprint);
	}
	friend bool operator==(const ModelKey &lhs, const ModelKey &rhs) {
		return !(lhs < rhs) && !(rhs < lhs);
	}
};

/**
 * @class ModelCache
 * @brief Bounded, thread-safe store of fitted models.
 *
 * Fitting runs outside the lock. If two threads miss on the same key at once
 * both fit, and the first insertion wins so every caller ends up holding the
 * same model object. When full, the oldest insertion is evicted.
 */
class ModelCache {
public:
	static constexpr std::size_t kDefaultCapacity = 256;

	explicit ModelCache(std::size_t capacity = kDefaultCapacity);

	static ModelKey makeKey(const std::string &product_id, const std::string &category,
	                        const params::HyperparameterSet &params, const core::TimeSeries &series);

	/// FNV-1a over the granularity, bucket day numbers and value bit patterns.
	static std::uint64_t seriesFingerprint(const core::TimeSeries &series);

	std::shared_ptr<const models::FittedModel> find(const ModelKey &key) const;

	std::shared_ptr<const models::FittedModel> getOrFit(const ModelKey &key,
	                                                    const std::function<models::FittedModel()> &fit);

	/// Drops every entry of @p product_id; returns the number removed.
	std::size_t invalidate(const std::string &product_id);

	void clear();

	std::size_t size() const;
	std::size_t capacity() const {
		return capacity_;
	}
	std::size_t hits() const;
	std::size_t misses() const;

private:
	std::size_t capacity_;
	mutable std::mutex mutex_;
	std::map<ModelKey, std::shared_ptr<const models::FittedModel>> entries_;
	std::deque<ModelKey> insertion_order_;
	std::size_t hits_ = 0;
	std::size_t misses_ = 0;
};

} // namespace salescast::service
