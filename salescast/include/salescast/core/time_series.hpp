#pragma once

#include "salescast/core/date.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace salescast::core {

/// Width of one aggregation bucket.
enum class Granularity {
	Daily,
	Weekly,
	Monthly
};

inline std::string toString(Granularity granularity) {
	switch (granularity) {
	case Granularity::Daily:
		return "daily";
	case Granularity::Weekly:
		return "weekly";
	case Granularity::Monthly:
		return "monthly";
	}
	throw std::logic_error("Unsupported granularity.");
}

/**
 * @brief Parses a granularity name.
 *
 * Accepts the long names as well as the single-letter aliases used by the
 * back-office API ("D", "W", "M").
 */
inline Granularity parseGranularity(const std::string &text) {
	if (text == "daily" || text == "D") {
		return Granularity::Daily;
	}
	if (text == "weekly" || text == "W") {
		return Granularity::Weekly;
	}
	if (text == "monthly" || text == "M") {
		return Granularity::Monthly;
	}
	throw std::invalid_argument("Unknown granularity '" + text + "'.");
}

/// First day of the bucket containing @p date (ISO-week Monday, first of month).
inline Date bucketStart(const Date &date, Granularity granularity) {
	switch (granularity) {
	case Granularity::Daily:
		return date;
	case Granularity::Weekly:
		return date.plusDays(-static_cast<int>(date.isoWeekday() - 1));
	case Granularity::Monthly:
		return Date::fromCivil(date.year(), date.month(), 1);
	}
	throw std::logic_error("Unsupported granularity.");
}

/// Moves a bucket start @p steps buckets forward (or backward when negative).
inline Date advanceBuckets(const Date &bucket, Granularity granularity, int steps) {
	switch (granularity) {
	case Granularity::Daily:
		return bucket.plusDays(steps);
	case Granularity::Weekly:
		return bucket.plusDays(7 * steps);
	case Granularity::Monthly:
		return bucket.plusMonths(steps);
	}
	throw std::logic_error("Unsupported granularity.");
}

/// Signed number of buckets from the bucket of @p from to the bucket of @p to.
inline std::int64_t bucketsBetween(const Date &from, const Date &to, Granularity granularity) {
	const Date a = bucketStart(from, granularity);
	const Date b = bucketStart(to, granularity);
	switch (granularity) {
	case Granularity::Daily:
		return static_cast<std::int64_t>(b.dayNumber()) - a.dayNumber();
	case Granularity::Weekly:
		return (static_cast<std::int64_t>(b.dayNumber()) - a.dayNumber()) / 7;
	case Granularity::Monthly:
		return (static_cast<std::int64_t>(b.year()) * 12 + b.month()) -
		       (static_cast<std::int64_t>(a.year()) * 12 + a.month());
	}
	throw std::logic_error("Unsupported granularity.");
}

/// Average number of buckets per calendar year.
inline double bucketsPerYear(Granularity granularity) {
	switch (granularity) {
	case Granularity::Daily:
		return 365.25;
	case Granularity::Weekly:
		return 365.25 / 7.0;
	case Granularity::Monthly:
		return 12.0;
	}
	throw std::logic_error("Unsupported granularity.");
}

struct TimeSeriesPoint {
	Date bucket_date;
	double value = 0.0;
};

/**
 * @class TimeSeries
 * @brief A regular, gap-free sequence of bucket totals.
 *
 * Bucket dates and values are stored in separate vectors. Every bucket date is
 * aligned to the series granularity and directly follows its predecessor, so a
 * missing period is always present as an explicit zero rather than omitted.
 */
class TimeSeries {
public:
	using Value = double;

	/**
	 * @brief Constructs a TimeSeries.
	 * @throws std::invalid_argument If the vectors differ in size, a date is not
	 *         a bucket start, buckets are not contiguous, or a value is not finite.
	 */
	TimeSeries(Granularity granularity, std::vector<Date> dates, std::vector<Value> values)
	    : granularity_(granularity), dates_(std::move(dates)), values_(std::move(values)) {
		if (dates_.size() != values_.size()) {
			throw std::invalid_argument("Bucket dates and values vectors must have the same size.");
		}
		validateBuckets();
		for (double v : values_) {
			if (!std::isfinite(v)) {
				throw std::invalid_argument("TimeSeries contains non-finite values.");
			}
		}
	}

	Granularity granularity() const {
		return granularity_;
	}

	const std::vector<Date> &dates() const {
		return dates_;
	}

	const std::vector<Value> &values() const {
		return values_;
	}

	std::size_t size() const {
		return dates_.size();
	}

	bool isEmpty() const {
		return dates_.empty();
	}

	TimeSeriesPoint point(std::size_t index) const {
		if (index >= size()) {
			throw std::out_of_range("Requested bucket exceeds the time series length.");
		}
		return TimeSeriesPoint{dates_[index], values_[index]};
	}

	const Date &firstDate() const {
		if (isEmpty()) {
			throw std::logic_error("TimeSeries is empty.");
		}
		return dates_.front();
	}

	const Date &lastDate() const {
		if (isEmpty()) {
			throw std::logic_error("TimeSeries is empty.");
		}
		return dates_.back();
	}

	std::size_t nonZeroCount() const {
		return static_cast<std::size_t>(
		    std::count_if(values_.begin(), values_.end(), [](double v) { return v != 0.0; }));
	}

	/// The @p count bucket dates directly following the last bucket.
	std::vector<Date> futureDates(std::size_t count) const {
		std::vector<Date> future;
		future.reserve(count);
		const Date last = lastDate();
		for (std::size_t i = 1; i <= count; ++i) {
			future.push_back(advanceBuckets(last, granularity_, static_cast<int>(i)));
		}
		return future;
	}

	TimeSeries slice(std::size_t start, std::size_t end) const {
		if (start > end) {
			throw std::invalid_argument("Slice start index must not exceed end index.");
		}
		if (end > size()) {
			throw std::out_of_range("Slice end index exceeds the length of the time series.");
		}
		std::vector<Date> dates(dates_.begin() + static_cast<std::ptrdiff_t>(start),
		                        dates_.begin() + static_cast<std::ptrdiff_t>(end));
		std::vector<Value> values(values_.begin() + static_cast<std::ptrdiff_t>(start),
		                          values_.begin() + static_cast<std::ptrdiff_t>(end));
		return TimeSeries(granularity_, std::move(dates), std::move(values));
	}

private:
	void validateBuckets() const {
		for (std::size_t i = 0; i < dates_.size(); ++i) {
			if (bucketStart(dates_[i], granularity_) != dates_[i]) {
				throw std::invalid_argument("Bucket date " + dates_[i].toString() + " is not aligned to " +
				                            toString(granularity_) + " buckets.");
			}
			if (i > 0 && advanceBuckets(dates_[i - 1], granularity_, 1) != dates_[i]) {
				throw std::invalid_argument("TimeSeries buckets must be contiguous and strictly increasing.");
			}
		}
	}

	Granularity granularity_;
	std::vector<Date> dates_;
	std::vector<Value> values_;
};

} // namespace salescast::core
