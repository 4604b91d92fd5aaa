#include "salescast/models/model_design.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <stdexcept>

namespace salescast::models {

namespace {

constexpr double kTwoPi = 6.283185307179586476925286766559;

} // namespace

ModelDesign::ModelDesign(core::Granularity granularity, core::Date first_bucket, std::size_t bucket_count,
                         std::vector<double> changepoints, std::vector<SeasonalityTerm> seasonalities,
                         bool monthly_indicators, const std::vector<calendar::HolidayEvent> &holidays,
                         int holiday_window)
    : granularity_(granularity), first_bucket_(first_bucket), bucket_count_(bucket_count),
      span_(bucket_count > 1 ? static_cast<double>(bucket_count - 1) : 1.0), changepoints_(std::move(changepoints)),
      seasonalities_(std::move(seasonalities)), monthly_indicators_(monthly_indicators),
      holiday_window_(holiday_window) {
	if (bucket_count_ == 0) {
		throw std::invalid_argument("ModelDesign requires at least one training bucket.");
	}
	if (holiday_window_ < 0) {
		throw std::invalid_argument("Holiday window must be non-negative.");
	}
	for (const auto &term : seasonalities_) {
		if (term.order < 0 || !(term.period_days > 0.0)) {
			throw std::invalid_argument("Seasonality '" + term.name + "' needs a positive period and order >= 0.");
		}
	}

	// Only holidays that touch the training range can be estimated.
	const auto last_offset = static_cast<std::int64_t>(bucket_count_) - 1;
	std::map<std::string, std::vector<core::Date>> occurrences;
	std::map<std::string, bool> observed;
	for (const auto &event : holidays) {
		const core::Date bucket = core::bucketStart(event.date, granularity_);
		const std::int64_t offset = core::bucketsBetween(first_bucket_, bucket, granularity_);
		auto &dates = occurrences[event.name];
		if (std::find(dates.begin(), dates.end(), bucket) == dates.end()) {
			dates.push_back(bucket);
		}
		if (offset + holiday_window_ >= 0 && offset - holiday_window_ <= last_offset) {
			observed[event.name] = true;
		}
	}
	for (auto &entry : occurrences) {
		if (observed[entry.first]) {
			holiday_names_.push_back(entry.first);
			holiday_buckets_.push_back(std::move(entry.second));
		}
	}
}

std::size_t ModelDesign::seasonalColumns() const {
	std::size_t columns = monthly_indicators_ ? 12 : 0;
	for (const auto &term : seasonalities_) {
		columns += 2 * static_cast<std::size_t>(term.order);
	}
	return columns;
}

double ModelDesign::timeOf(const core::Date &date) const {
	return static_cast<double>(core::bucketsBetween(first_bucket_, date, granularity_)) / span_;
}

std::vector<core::Date> ModelDesign::trainingDates() const {
	std::vector<core::Date> dates;
	dates.reserve(bucket_count_);
	for (std::size_t i = 0; i < bucket_count_; ++i) {
		dates.push_back(core::advanceBuckets(first_bucket_, granularity_, static_cast<int>(i)));
	}
	return dates;
}

Eigen::MatrixXd ModelDesign::trendMatrix(const std::vector<core::Date> &dates) const {
	const auto rows = static_cast<Eigen::Index>(dates.size());
	Eigen::MatrixXd X(rows, static_cast<Eigen::Index>(trendColumns()));
	for (Eigen::Index i = 0; i < rows; ++i) {
		const double t = timeOf(dates[static_cast<std::size_t>(i)]);
		X(i, 0) = t;
		X(i, 1) = 1.0;
		for (std::size_t j = 0; j < changepoints_.size(); ++j) {
			X(i, static_cast<Eigen::Index>(2 + j)) = std::max(0.0, t - changepoints_[j]);
		}
	}
	return X;
}

Eigen::MatrixXd ModelDesign::seasonalMatrix(const std::vector<core::Date> &dates) const {
	const auto rows = static_cast<Eigen::Index>(dates.size());
	Eigen::MatrixXd X = Eigen::MatrixXd::Zero(rows, static_cast<Eigen::Index>(seasonalColumns()));
	for (Eigen::Index i = 0; i < rows; ++i) {
		const auto &date = dates[static_cast<std::size_t>(i)];
		const double day = static_cast<double>(date.dayNumber());
		Eigen::Index col = 0;
		for (const auto &term : seasonalities_) {
			for (int k = 1; k <= term.order; ++k) {
				const double angle = kTwoPi * k * day / term.period_days;
				X(i, col++) = std::sin(angle);
				X(i, col++) = std::cos(angle);
			}
		}
		if (monthly_indicators_) {
			X(i, col + static_cast<Eigen::Index>(date.month()) - 1) = 1.0;
		}
	}
	return X;
}

Eigen::MatrixXd ModelDesign::holidayMatrix(const std::vector<core::Date> &dates) const {
	const auto rows = static_cast<Eigen::Index>(dates.size());
	Eigen::MatrixXd X = Eigen::MatrixXd::Zero(rows, static_cast<Eigen::Index>(holidayColumns()));
	for (Eigen::Index i = 0; i < rows; ++i) {
		const auto &date = dates[static_cast<std::size_t>(i)];
		for (std::size_t h = 0; h < holiday_buckets_.size(); ++h) {
			for (const auto &bucket : holiday_buckets_[h]) {
				if (std::llabs(core::bucketsBetween(bucket, date, granularity_)) <= holiday_window_) {
					X(i, static_cast<Eigen::Index>(h)) = 1.0;
					break;
				}
			}
		}
	}
	return X;
}

Eigen::MatrixXd ModelDesign::designMatrix(const std::vector<core::Date> &dates) const {
	const Eigen::MatrixXd trend = trendMatrix(dates);
	const Eigen::MatrixXd seasonal = seasonalMatrix(dates);
	const Eigen::MatrixXd holiday = holidayMatrix(dates);
	Eigen::MatrixXd X(trend.rows(), trend.cols() + seasonal.cols() + holiday.cols());
	X.leftCols(trend.cols()) = trend;
	if (seasonal.cols() > 0) {
		X.middleCols(trend.cols(), seasonal.cols()) = seasonal;
	}
	if (holiday.cols() > 0) {
		X.rightCols(holiday.cols()) = holiday;
	}
	return X;
}

std::vector<double> ModelDesign::placeChangepoints(std::size_t bucket_count, int requested,
                                                   double changepoint_range) {
	std::vector<double> changepoints;
	if (requested <= 0 || bucket_count < 3) {
		return changepoints;
	}
	const auto hist_size = static_cast<int>(std::floor(static_cast<double>(bucket_count) * changepoint_range));
	const int count = std::min(requested, hist_size - 1);
	if (count <= 0) {
		return changepoints;
	}
	const double span = static_cast<double>(bucket_count - 1);
	double previous = -1.0;
	for (int j = 1; j <= count; ++j) {
		// Index j of count + 1 evenly spaced positions over [0, hist_size - 1]; position 0 is skipped.
		const double index = std::round(static_cast<double>(j) * (hist_size - 1) / count);
		const double t = index / span;
		if (t > previous) {
			changepoints.push_back(t);
			previous = t;
		}
	}
	return changepoints;
}

} // namespace salescast::models
