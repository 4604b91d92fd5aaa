#pragma once

#include "salescast/core/time_series.hpp"
#include "salescast/core/transaction.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace salescast::aggregation {

struct AggregatorOptions {
	/// Minimum number of non-zero buckets; unset means two seasonal cycles.
	std::optional<std::size_t> min_nonzero_buckets;
	/// Treat returns (negative line quantities) as zero demand.
	bool clip_negative_quantities = true;
};

/**
 * @class TimeSeriesAggregator
 * @brief Buckets raw line items into a regular, zero-filled demand series.
 *
 * The resulting series runs from the first to the last observed bucket. Gaps
 * inside that range become explicit zero buckets so seasonal phase is kept.
 */
class TimeSeriesAggregator {
public:
	explicit TimeSeriesAggregator(AggregatorOptions options = {});

	/**
	 * @brief Aggregates one product's transactions.
	 * @throws core::InsufficientHistoryError If fewer than the required number
	 *         of non-zero buckets exist.
	 */
	core::TimeSeries aggregate(const std::vector<core::Transaction> &transactions, const std::string &product_id,
	                           core::Granularity granularity) const;

	/**
	 * @brief Aggregates every product of one category into a single series.
	 * @throws core::InsufficientHistoryError As for aggregate().
	 */
	core::TimeSeries aggregateCategory(const std::vector<core::Transaction> &transactions,
	                                   const std::string &category, core::Granularity granularity) const;

	/// Required non-zero buckets for @p granularity under the current options.
	std::size_t minimumBuckets(core::Granularity granularity) const;

	/// Two full yearly cycles (weekly, monthly) or two weekly cycles (daily).
	static std::size_t defaultMinimumBuckets(core::Granularity granularity);

private:
	core::TimeSeries aggregateWhere(const std::vector<core::Transaction> &transactions,
	                                const std::function<bool(const core::Transaction &)> &keep,
	                                core::Granularity granularity, const std::string &label) const;

	AggregatorOptions options_;
};

} // namespace salescast::aggregation
