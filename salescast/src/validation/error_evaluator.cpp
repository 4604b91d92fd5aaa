#include "salescast/validation/error_evaluator.hpp"

#include "salescast/core/errors.hpp"
#include "salescast/utils/logging.hpp"
#include "salescast/utils/metrics.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace salescast::validation {

ErrorEvaluator::ErrorEvaluator(models::ForecastModelFitter fitter) : fitter_(std::move(fitter)) {
}

BacktestReport ErrorEvaluator::evaluate(const core::TimeSeries &series, const params::HyperparameterSet &params,
                                        const std::vector<calendar::HolidayEvent> &holidays,
                                        std::size_t holdout_size) const {
	if (holdout_size == 0) {
		throw core::InsufficientHistoryError("Backtest holdout must contain at least one bucket.");
	}
	if (holdout_size >= series.size()) {
		throw core::InsufficientHistoryError("Backtest holdout of " + std::to_string(holdout_size) +
		                                     " buckets leaves nothing to train on in a series of " +
		                                     std::to_string(series.size()) + " buckets.");
	}

	const std::size_t train_size = series.size() - holdout_size;
	const auto train = series.slice(0, train_size);
	const auto model = fitter_.fit(train, params, holidays);

	BacktestReport report;
	report.dates.assign(series.dates().begin() + static_cast<std::ptrdiff_t>(train_size), series.dates().end());
	report.actual.assign(series.values().begin() + static_cast<std::ptrdiff_t>(train_size), series.values().end());

	const auto predictions = model.predict(report.dates);
	std::vector<double> lower;
	std::vector<double> upper;
	for (const auto &p : predictions) {
		report.predicted.push_back(p.yhat);
		lower.push_back(p.yhat_lower);
		upper.push_back(p.yhat_upper);
	}

	const auto percentage = utils::Metrics::mapeWithExclusions(report.actual, report.predicted);
	report.mape = percentage.value;
	report.evaluated_points = percentage.evaluated;
	report.excluded_zero_actuals = percentage.excluded;
	report.mae = utils::Metrics::mae(report.actual, report.predicted);
	report.rmse = utils::Metrics::rmse(report.actual, report.predicted);
	report.coverage = utils::Metrics::coverage(report.actual, lower, upper);

	if (report.mape) {
		SALESCAST_DEBUG("Backtest over {} buckets: MAPE {:.3f}% ({} zero actuals excluded)", holdout_size,
		                *report.mape, report.excluded_zero_actuals);
	} else {
		SALESCAST_DEBUG("Backtest over {} buckets: MAPE undefined, all actuals are zero", holdout_size);
	}
	return report;
}

std::vector<std::tuple<int, int, int>> ErrorEvaluator::generateFolds(int n_samples, const CVConfig &config) {
	if (config.initial_window < 2) {
		throw std::invalid_argument("Cross-validation initial_window must be at least 2.");
	}
	if (config.horizon < 1 || config.step < 1) {
		throw std::invalid_argument("Cross-validation horizon and step must be positive.");
	}
	if (n_samples < config.initial_window + config.horizon) {
		throw core::InsufficientHistoryError(
		    "Series of " + std::to_string(n_samples) + " buckets is too short for cross-validation; need at least " +
		    std::to_string(config.initial_window + config.horizon) + ".");
	}

	std::vector<std::tuple<int, int, int>> folds;
	int pos = config.initial_window;
	while (pos + config.horizon <= n_samples) {
		folds.emplace_back(pos, pos, pos + config.horizon);
		pos += config.step;
	}
	return folds;
}

CVReport ErrorEvaluator::crossValidate(const core::TimeSeries &series, const params::HyperparameterSet &params,
                                       const std::vector<calendar::HolidayEvent> &holidays,
                                       const CVConfig &config) const {
	const auto fold_indices = generateFolds(static_cast<int>(series.size()), config);

	CVReport report;
	report.folds.reserve(fold_indices.size());
	std::vector<double> all_actuals;
	std::vector<double> all_forecasts;

	int fold_id = 0;
	for (const auto &indices : fold_indices) {
		CVFold fold;
		fold.fold_id = fold_id++;
		std::tie(fold.train_end, fold.test_start, fold.test_end) = indices;

		const auto train = series.slice(0, static_cast<std::size_t>(fold.train_end));
		const auto model = fitter_.fit(train, params, holidays);

		const std::vector<core::Date> test_dates(series.dates().begin() + fold.test_start,
		                                         series.dates().begin() + fold.test_end);
		for (const auto &p : model.predict(test_dates)) {
			fold.forecasts.push_back(p.yhat);
		}
		fold.actuals.assign(series.values().begin() + fold.test_start, series.values().begin() + fold.test_end);
		fold.mape = utils::Metrics::mape(fold.actuals, fold.forecasts);

		all_actuals.insert(all_actuals.end(), fold.actuals.begin(), fold.actuals.end());
		all_forecasts.insert(all_forecasts.end(), fold.forecasts.begin(), fold.forecasts.end());
		report.folds.push_back(std::move(fold));
	}

	report.total_forecasts = static_cast<int>(all_forecasts.size());
	const auto percentage = utils::Metrics::mapeWithExclusions(all_actuals, all_forecasts);
	report.mape = percentage.value;
	report.evaluated_points = percentage.evaluated;
	report.excluded_zero_actuals = percentage.excluded;
	report.mae = utils::Metrics::mae(all_actuals, all_forecasts);
	report.rmse = utils::Metrics::rmse(all_actuals, all_forecasts);
	return report;
}

} // namespace salescast::validation
