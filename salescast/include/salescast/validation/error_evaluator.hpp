#pragma once

#include "salescast/calendar/holiday.hpp"
#include "salescast/core/time_series.hpp"
#include "salescast/models/model_fitter.hpp"
#include "salescast/params/hyperparameters.hpp"

#include <cstddef>
#include <optional>
#include <tuple>
#include <vector>

namespace salescast::validation {

/**
 * @brief Outcome of a single holdout backtest
 */
struct BacktestReport {
	std::optional<double> mape;           // Percent; empty when every actual was zero
	std::size_t excluded_zero_actuals = 0;
	std::size_t evaluated_points = 0;      // Points that entered the MAPE
	double mae = 0.0;
	double rmse = 0.0;
	double coverage = 0.0;                 // Share of actuals inside the prediction interval

	std::vector<core::Date> dates;
	std::vector<double> actual;
	std::vector<double> predicted;
};

/**
 * @brief Configuration for expanding-window cross-validation, in buckets
 */
struct CVConfig {
	int initial_window = 12;      // Initial training window size
	int horizon = 1;              // Forecast horizon per fold
	int step = 1;                 // Step size between fold origins
};

/**
 * @brief Results from a single CV fold
 */
struct CVFold {
	int fold_id = 0;
	int train_end = 0;            // Training covers [0, train_end)
	int test_start = 0;
	int test_end = 0;             // Exclusive

	std::vector<double> forecasts;
	std::vector<double> actuals;
	std::optional<double> mape;
};

/**
 * @brief Results from cross-validation, pooled over all fold points
 */
struct CVReport {
	std::vector<CVFold> folds;

	std::optional<double> mape;
	std::size_t excluded_zero_actuals = 0;
	std::size_t evaluated_points = 0;
	double mae = 0.0;
	double rmse = 0.0;
	int total_forecasts = 0;
};

/**
 * @class ErrorEvaluator
 * @brief Backtests the decomposition model on the tail of a series.
 *
 * Every evaluation refits on the training part only, so no test point ever
 * influences the model that predicts it. Zero actuals are left out of the
 * MAPE and counted instead.
 */
class ErrorEvaluator {
public:
	static constexpr std::size_t kDefaultHoldout = 3;

	explicit ErrorEvaluator(models::ForecastModelFitter fitter = models::ForecastModelFitter());

	/**
	 * @brief Fits on all but the last @p holdout_size buckets and scores those buckets.
	 * @throws core::InsufficientHistoryError If @p holdout_size is 0 or not smaller than the series length.
	 * @throws core::ModelFitError If the training fit fails.
	 */
	BacktestReport evaluate(const core::TimeSeries &series, const params::HyperparameterSet &params,
	                        const std::vector<calendar::HolidayEvent> &holidays,
	                        std::size_t holdout_size = kDefaultHoldout) const;

	/**
	 * @brief Expanding-window rolling-origin cross-validation.
	 *
	 * Metrics are computed over the pooled points of all folds. A fold that
	 * fails to fit propagates its error.
	 *
	 * @throws core::InsufficientHistoryError If the series is shorter than initial_window + horizon.
	 * @throws std::invalid_argument If the configuration is malformed.
	 */
	CVReport crossValidate(const core::TimeSeries &series, const params::HyperparameterSet &params,
	                       const std::vector<calendar::HolidayEvent> &holidays, const CVConfig &config) const;

	/**
	 * @brief Generate CV fold indices
	 *
	 * @return (train_end, test_start, test_end) per fold; training always starts at 0
	 */
	static std::vector<std::tuple<int, int, int>> generateFolds(int n_samples, const CVConfig &config);

	const models::ForecastModelFitter &fitter() const {
		return fitter_;
	}

private:
	models::ForecastModelFitter fitter_;
};

} // namespace salescast::validation
