#include "salescast/tuning/parameter_tuner.hpp"

#include "salescast/core/errors.hpp"
#include "salescast/utils/logging.hpp"
#include "salescast/utils/worker_pool.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>

namespace salescast::tuning {

std::vector<params::HyperparameterSet> ParameterGrid::combinations(const params::HyperparameterSet &base) const {
	const std::vector<double> tf = trend_flexibility.empty() ? std::vector<double>{base.trend_flexibility}
	                                                         : trend_flexibility;
	const std::vector<double> ss =
	    seasonality_strength.empty() ? std::vector<double>{base.seasonality_strength} : seasonality_strength;
	const std::vector<double> hs =
	    holiday_strength.empty() ? std::vector<double>{base.holiday_strength} : holiday_strength;
	const std::vector<params::SeasonalityMode> modes =
	    seasonality_mode.empty() ? std::vector<params::SeasonalityMode>{base.seasonality_mode} : seasonality_mode;

	std::vector<params::HyperparameterSet> out;
	out.reserve(tf.size() * ss.size() * hs.size() * modes.size());
	for (double t : tf) {
		for (double s : ss) {
			for (double h : hs) {
				for (auto mode : modes) {
					params::HyperparameterSet candidate = base;
					candidate.trend_flexibility = t;
					candidate.seasonality_strength = s;
					candidate.holiday_strength = h;
					candidate.seasonality_mode = mode;
					out.push_back(candidate);
				}
			}
		}
	}
	return out;
}

ParameterTuner::ParameterTuner(validation::ErrorEvaluator evaluator, params::HyperparameterSet base,
                               TuningOptions options)
    : evaluator_(std::move(evaluator)), base_(std::move(base)), options_(options) {
	base_.validate();
	if (options_.max_parallel == 0) {
		throw std::invalid_argument("ParameterTuner requires max_parallel >= 1.");
	}
}

TuningResult ParameterTuner::evaluateCandidate(std::size_t index, const params::HyperparameterSet &candidate,
                                               const core::TimeSeries &series,
                                               const std::vector<calendar::HolidayEvent> &holidays) const {
	TuningResult result;
	result.grid_index = index;
	result.params = candidate;
	try {
		const auto cv = evaluator_.crossValidate(series, candidate, holidays, options_.cv);
		result.success = true;
		result.mape = cv.mape;
		result.rmse = cv.rmse;
	} catch (const std::exception &e) {
		// Recorded on the result; the remaining candidates still run.
		result.success = false;
		result.error = e.what();
		SALESCAST_WARN("Tuning candidate {} ({}) failed: {}", index, candidate.fingerprint(), e.what());
	}
	return result;
}

TuningReport ParameterTuner::tune(const core::TimeSeries &series, const std::string &category,
                                  const ParameterGrid &grid, const std::vector<calendar::HolidayEvent> &holidays,
                                  const ProgressCallback &progress) const {
	if (grid.empty()) {
		throw std::invalid_argument("Parameter grid must list at least one candidate value.");
	}
	auto candidates = grid.combinations(base_);
	for (auto &candidate : candidates) {
		candidate.category = category;
		candidate.validate();
	}

	const std::size_t total = candidates.size();
	SALESCAST_INFO("Tuning category '{}': {} parameter combinations on up to {} workers", category, total,
	               options_.max_parallel);

	std::vector<TuningResult> results;
	results.reserve(total);
	{
		utils::WorkerPool pool(std::min(options_.max_parallel, total), total);
		std::vector<std::future<TuningResult>> futures;
		futures.reserve(total);
		for (std::size_t i = 0; i < total; ++i) {
			const auto &candidate = candidates[i];
			futures.push_back(pool.submit(
			    [this, i, &candidate, &series, &holidays]() { return evaluateCandidate(i, candidate, series, holidays); }));
		}
		for (std::size_t i = 0; i < total; ++i) {
			results.push_back(futures[i].get());
			if (progress) {
				progress(i + 1, total);
			}
		}
	}

	TuningReport report;
	report.category = category;
	report.total = total;
	for (const auto &result : results) {
		if (result.success) {
			++report.succeeded;
		} else {
			++report.failed;
		}
	}

	// stable_sort keeps grid order among equal MAPEs.
	std::stable_sort(results.begin(), results.end(), [](const TuningResult &a, const TuningResult &b) {
		const int rank_a = a.success ? (a.mape ? 0 : 1) : 2;
		const int rank_b = b.success ? (b.mape ? 0 : 1) : 2;
		if (rank_a != rank_b) {
			return rank_a < rank_b;
		}
		return rank_a == 0 && *a.mape < *b.mape;
	});
	report.results = std::move(results);

	const auto &top = report.results.front();
	if (!top.success || !top.mape) {
		throw core::TuningError("No parameter combination for category '" + category +
		                        "' produced a defined MAPE (" + std::to_string(report.failed) + " of " +
		                        std::to_string(total) + " failed).");
	}
	report.best = top.params;
	report.best_mape = *top.mape;
	report.best_rmse = top.rmse;

	SALESCAST_INFO("Tuning category '{}' finished: best MAPE {:.3f}% with {} ({} failed)", category,
	               report.best_mape, report.best.fingerprint(), report.failed);
	return report;
}

} // namespace salescast::tuning
