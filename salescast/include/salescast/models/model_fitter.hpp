#pragma once

#include "salescast/calendar/holiday.hpp"
#include "salescast/core/time_series.hpp"
#include "salescast/models/fitted_model.hpp"
#include "salescast/params/hyperparameters.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace salescast::models {

struct FitterOptions {
	int n_changepoints = 25;
	double changepoint_range = 0.8;
	/// Buckets on either side of a holiday's bucket that share its effect.
	int holiday_window = 1;
	double interval_width = 0.95;
	int max_iterations = 1000;
	/// Fit on log1p(y) and map predictions back with expm1.
	bool log_transform = false;
	/// Clip predictions and bounds at zero.
	bool clip_negative = true;
	/// Add one indicator regressor per calendar month.
	bool monthly_indicators = false;
	/// Yearly Fourier order; unset means min(10, buckets per year / 2).
	std::optional<int> yearly_order;
	/// Weekly Fourier order, used for daily buckets only.
	int weekly_order = 3;

	/// @throws std::invalid_argument On out-of-range values.
	void validate() const;
};

/**
 * @class ForecastModelFitter
 * @brief Fits the trend + seasonality + holiday decomposition model.
 *
 * Additive:       y(t) = trend(t) + seasonal(t) + holiday(t)
 * Multiplicative: y(t) = trend(t) * (1 + seasonal(t) + holiday(t))
 *
 * Coefficients minimize the penalized squared error
 *   1/2 |y - yhat|^2 + 1/2 sum_g (c / scale_g^2) |beta_g|^2
 * with L-BFGS, where scale_g is the hyperparameter prior scale of block g
 * (trend_flexibility for changepoint deltas, seasonality_strength for the
 * seasonal block, holiday_strength for the holiday block). The start point is
 * the line through the first and last observation, so repeated fits of the
 * same input are bit-identical.
 *
 * The fitter holds only its options; fit() is const and may be called from
 * several threads at once.
 */
class ForecastModelFitter {
public:
	explicit ForecastModelFitter(FitterOptions options = {});

	/**
	 * @throws core::InsufficientHistoryError If the series has fewer than two buckets.
	 * @throws core::ModelFitError If the optimizer fails or does not converge within the iteration budget.
	 * @throws std::invalid_argument If @p params does not validate.
	 */
	FittedModel fit(const core::TimeSeries &series, const params::HyperparameterSet &params,
	                const std::vector<calendar::HolidayEvent> &holidays) const;

	const FitterOptions &options() const {
		return options_;
	}

	/// Fourier seasonalities used for @p granularity under the current options.
	std::vector<SeasonalityTerm> seasonalitiesFor(core::Granularity granularity) const;

	/// Ridge weight numerator c; block weights are c / scale^2.
	static constexpr double kPriorWeight = 0.01;
	/// Prior scale of the base rate and offset.
	static constexpr double kTrendPriorScale = 5.0;

private:
	FitterOptions options_;
};

/**
 * @brief Builder for ForecastModelFitter
 */
class ForecastModelFitterBuilder {
public:
	ForecastModelFitterBuilder() = default;

	ForecastModelFitterBuilder &withChangepoints(int count) {
		options_.n_changepoints = count;
		return *this;
	}

	ForecastModelFitterBuilder &withChangepointRange(double range) {
		options_.changepoint_range = range;
		return *this;
	}

	ForecastModelFitterBuilder &withHolidayWindow(int window) {
		options_.holiday_window = window;
		return *this;
	}

	ForecastModelFitterBuilder &withIntervalWidth(double width) {
		options_.interval_width = width;
		return *this;
	}

	ForecastModelFitterBuilder &withMaxIterations(int iterations) {
		options_.max_iterations = iterations;
		return *this;
	}

	ForecastModelFitterBuilder &withLogTransform(bool enabled) {
		options_.log_transform = enabled;
		return *this;
	}

	ForecastModelFitterBuilder &withClipNegative(bool enabled) {
		options_.clip_negative = enabled;
		return *this;
	}

	ForecastModelFitterBuilder &withMonthlyIndicators(bool enabled) {
		options_.monthly_indicators = enabled;
		return *this;
	}

	ForecastModelFitterBuilder &withYearlyOrder(int order) {
		options_.yearly_order = order;
		return *this;
	}

	ForecastModelFitterBuilder &withWeeklyOrder(int order) {
		options_.weekly_order = order;
		return *this;
	}

	std::unique_ptr<ForecastModelFitter> build() {
		return std::make_unique<ForecastModelFitter>(options_);
	}

private:
	FitterOptions options_;
};

} // namespace salescast::models
