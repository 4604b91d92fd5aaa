#pragma once

#include "salescast/calendar/holiday.hpp"
#include "salescast/core/date.hpp"
#include "salescast/core/time_series.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <string>
#include <vector>

namespace salescast::models {

/// A Fourier seasonality: @c order sine/cosine pairs with the given period in days.
struct SeasonalityTerm {
	std::string name;
	double period_days = 365.25;
	int order = 0;
};

/**
 * @class ModelDesign
 * @brief Column layout of the decomposition model.
 *
 * Maps calendar dates to the three regressor blocks the model is built from:
 * - trend:    [t, 1, (t - s_1)+, ..., (t - s_C)+]
 * - seasonal: Fourier pairs per SeasonalityTerm, then optional month indicators
 * - holiday:  one indicator per holiday name
 *
 * Time @c t is the bucket offset from the first training bucket divided by the
 * training span, so the training range maps to [0, 1]. Fourier terms use the
 * absolute day number, which keeps seasonal phase tied to the calendar rather
 * than to the start of the history.
 */
class ModelDesign {
public:
	ModelDesign(core::Granularity granularity, core::Date first_bucket, std::size_t bucket_count,
	            std::vector<double> changepoints, std::vector<SeasonalityTerm> seasonalities,
	            bool monthly_indicators, const std::vector<calendar::HolidayEvent> &holidays, int holiday_window);

	core::Granularity granularity() const {
		return granularity_;
	}
	const core::Date &firstBucket() const {
		return first_bucket_;
	}
	std::size_t bucketCount() const {
		return bucket_count_;
	}
	const std::vector<double> &changepoints() const {
		return changepoints_;
	}
	const std::vector<SeasonalityTerm> &seasonalities() const {
		return seasonalities_;
	}
	const std::vector<std::string> &holidayNames() const {
		return holiday_names_;
	}
	bool monthlyIndicators() const {
		return monthly_indicators_;
	}

	std::size_t trendColumns() const {
		return 2 + changepoints_.size();
	}
	std::size_t seasonalColumns() const;
	std::size_t holidayColumns() const {
		return holiday_names_.size();
	}
	std::size_t totalColumns() const {
		return trendColumns() + seasonalColumns() + holidayColumns();
	}

	/// Scaled time of @p date; 0 at the first and 1 at the last training bucket.
	double timeOf(const core::Date &date) const;

	/// Bucket dates of the training range.
	std::vector<core::Date> trainingDates() const;

	Eigen::MatrixXd trendMatrix(const std::vector<core::Date> &dates) const;
	Eigen::MatrixXd seasonalMatrix(const std::vector<core::Date> &dates) const;
	Eigen::MatrixXd holidayMatrix(const std::vector<core::Date> &dates) const;

	/// All three blocks side by side, in trend, seasonal, holiday order.
	Eigen::MatrixXd designMatrix(const std::vector<core::Date> &dates) const;

	/**
	 * @brief Candidate changepoints in scaled time.
	 *
	 * Spread uniformly over the first @p changepoint_range of the history. When
	 * the history is too short to hold @p requested candidates, fewer are
	 * placed (possibly none).
	 */
	static std::vector<double> placeChangepoints(std::size_t bucket_count, int requested, double changepoint_range);

private:
	core::Granularity granularity_;
	core::Date first_bucket_;
	std::size_t bucket_count_;
	double span_;
	std::vector<double> changepoints_;
	std::vector<SeasonalityTerm> seasonalities_;
	bool monthly_indicators_;
	int holiday_window_;
	std::vector<std::string> holiday_names_;
	// Bucket starts of every occurrence, parallel to holiday_names_.
	std::vector<std::vector<core::Date>> holiday_buckets_;
};

} // namespace salescast::models
