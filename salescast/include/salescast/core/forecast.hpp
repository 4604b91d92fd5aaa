#pragma once

#include "salescast/core/date.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace salescast::core {

/// Point prediction with its uncertainty interval.
struct Prediction {
	double yhat = 0.0;
	double yhat_lower = 0.0;
	double yhat_upper = 0.0;
};

/// One entry of a forecast payload.
struct ForecastPoint {
	Date date;
	double yhat = 0.0;
	double yhat_lower = 0.0;
	double yhat_upper = 0.0;
	bool is_historical = false;
};

/**
 * @class ForecastResult
 * @brief Immutable outcome of a forecast request.
 *
 * Holds the in-sample fitted values for every historical bucket followed by
 * exactly @c periods projected buckets, together with the backtest MAPE. An
 * empty MAPE means the metric was undefined because every holdout actual was
 * zero.
 */
class ForecastResult {
public:
	/**
	 * @throws std::invalid_argument If dates are not strictly increasing, a
	 *         historical point follows a future one, or the number of future
	 *         points differs from @p periods.
	 */
	ForecastResult(std::vector<ForecastPoint> points, std::optional<double> mape, std::size_t mape_excluded,
	               int periods)
	    : points_(std::move(points)), mape_(mape), mape_excluded_(mape_excluded), periods_(periods) {
		validate();
	}

	const std::vector<ForecastPoint> &points() const {
		return points_;
	}

	/// Backtest MAPE in percent; empty when undefined.
	const std::optional<double> &mape() const {
		return mape_;
	}

	/// Number of holdout points excluded from the MAPE because their actual was zero.
	std::size_t mapeExcluded() const {
		return mape_excluded_;
	}

	int periods() const {
		return periods_;
	}

	std::size_t historicalCount() const {
		return static_cast<std::size_t>(std::count_if(points_.begin(), points_.end(),
		                                              [](const ForecastPoint &p) { return p.is_historical; }));
	}

	std::vector<ForecastPoint> future() const {
		std::vector<ForecastPoint> out;
		std::copy_if(points_.begin(), points_.end(), std::back_inserter(out),
		             [](const ForecastPoint &p) { return !p.is_historical; });
		return out;
	}

private:
	void validate() const {
		if (periods_ < 0) {
			throw std::invalid_argument("Forecast periods must be non-negative.");
		}
		bool seen_future = false;
		std::size_t future_count = 0;
		for (std::size_t i = 0; i < points_.size(); ++i) {
			if (i > 0 && !(points_[i - 1].date < points_[i].date)) {
				throw std::invalid_argument("Forecast points must be strictly increasing by date.");
			}
			if (points_[i].is_historical) {
				if (seen_future) {
					throw std::invalid_argument("Historical forecast points must precede future points.");
				}
			} else {
				seen_future = true;
				++future_count;
			}
		}
		if (future_count != static_cast<std::size_t>(periods_)) {
			throw std::invalid_argument("Number of future forecast points must equal the requested periods.");
		}
	}

	std::vector<ForecastPoint> points_;
	std::optional<double> mape_;
	std::size_t mape_excluded_ = 0;
	int periods_ = 0;
};

} // namespace salescast::core
