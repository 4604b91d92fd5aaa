#include "salescast/aggregation/aggregator.hpp"

#include "salescast/core/errors.hpp"
#include "salescast/utils/logging.hpp"

#include <algorithm>
#include <map>

namespace salescast::aggregation {

TimeSeriesAggregator::TimeSeriesAggregator(AggregatorOptions options) : options_(options) {
}

std::size_t TimeSeriesAggregator::defaultMinimumBuckets(core::Granularity granularity) {
	switch (granularity) {
	case core::Granularity::Daily:
		return 14;
	case core::Granularity::Weekly:
		return 24;
	case core::Granularity::Monthly:
		return 12;
	}
	return 12;
}

std::size_t TimeSeriesAggregator::minimumBuckets(core::Granularity granularity) const {
	return options_.min_nonzero_buckets ? *options_.min_nonzero_buckets : defaultMinimumBuckets(granularity);
}

core::TimeSeries TimeSeriesAggregator::aggregate(const std::vector<core::Transaction> &transactions,
                                                 const std::string &product_id,
                                                 core::Granularity granularity) const {
	return aggregateWhere(
	    transactions, [&](const core::Transaction &t) { return t.product_id == product_id; }, granularity,
	    "product '" + product_id + "'");
}

core::TimeSeries TimeSeriesAggregator::aggregateCategory(const std::vector<core::Transaction> &transactions,
                                                         const std::string &category,
                                                         core::Granularity granularity) const {
	return aggregateWhere(
	    transactions, [&](const core::Transaction &t) { return t.category == category; }, granularity,
	    "category '" + category + "'");
}

core::TimeSeries TimeSeriesAggregator::aggregateWhere(const std::vector<core::Transaction> &transactions,
                                                      const std::function<bool(const core::Transaction &)> &keep,
                                                      core::Granularity granularity,
                                                      const std::string &label) const {
	// std::map keeps buckets sorted regardless of input order.
	std::map<core::Date, double> totals;
	for (const auto &transaction : transactions) {
		if (!keep(transaction)) {
			continue;
		}
		double quantity = transaction.quantity;
		if (options_.clip_negative_quantities && quantity < 0.0) {
			quantity = 0.0;
		}
		totals[core::bucketStart(transaction.date, granularity)] += quantity;
	}

	if (totals.empty()) {
		throw core::InsufficientHistoryError("No transactions found for " + label + ".");
	}

	const core::Date first = totals.begin()->first;
	const core::Date last = totals.rbegin()->first;
	const auto count = static_cast<std::size_t>(core::bucketsBetween(first, last, granularity)) + 1;

	std::vector<core::Date> dates;
	std::vector<double> values;
	dates.reserve(count);
	values.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		const core::Date bucket = core::advanceBuckets(first, granularity, static_cast<int>(i));
		const auto it = totals.find(bucket);
		dates.push_back(bucket);
		values.push_back(it == totals.end() ? 0.0 : it->second);
	}

	core::TimeSeries series(granularity, std::move(dates), std::move(values));
	const std::size_t nonzero = series.nonZeroCount();
	const std::size_t required = minimumBuckets(granularity);
	if (nonzero < required) {
		throw core::InsufficientHistoryError("Only " + std::to_string(nonzero) + " non-zero " +
		                                     core::toString(granularity) + " buckets for " + label +
		                                     "; at least " + std::to_string(required) + " are required.");
	}

	SALESCAST_DEBUG("Aggregated {} into {} {} buckets ({} zero-filled).", label, series.size(),
	                core::toString(granularity), series.size() - nonzero);
	return series;
}

} // namespace salescast::aggregation
