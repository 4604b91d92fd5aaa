#pragma once

#include "salescast/calendar/holiday.hpp"
#include "salescast/core/time_series.hpp"
#include "salescast/params/hyperparameters.hpp"
#include "salescast/validation/error_evaluator.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace salescast::tuning {

/**
 * @struct ParameterGrid
 * @brief Candidate values per hyperparameter.
 *
 * A dimension left empty keeps the base set's value in every combination.
 */
struct ParameterGrid {
	std::vector<double> trend_flexibility;
	std::vector<double> seasonality_strength;
	std::vector<double> holiday_strength;
	std::vector<params::SeasonalityMode> seasonality_mode;

	bool empty() const {
		return trend_flexibility.empty() && seasonality_strength.empty() && holiday_strength.empty() &&
		       seasonality_mode.empty();
	}

	/// Cartesian product in row-major order (trend_flexibility varies slowest).
	std::vector<params::HyperparameterSet> combinations(const params::HyperparameterSet &base) const;
};

struct TuningResult {
	std::size_t grid_index = 0;
	params::HyperparameterSet params;
	bool success = false;
	std::optional<double> mape;
	double rmse = 0.0;
	std::string error;
};

struct TuningReport {
	std::string category;
	/// Successful results by ascending MAPE (undefined MAPE last), then failures in grid order.
	std::vector<TuningResult> results;
	params::HyperparameterSet best;
	double best_mape = 0.0;
	double best_rmse = 0.0;
	std::size_t total = 0;
	std::size_t succeeded = 0;
	std::size_t failed = 0;
};

struct TuningOptions {
	/// Upper bound on concurrently evaluated candidates.
	std::size_t max_parallel = 4;
	/// One month ahead from a twelve-month initial window, stepping one month.
	validation::CVConfig cv{12, 1, 1};
};

/**
 * @class ParameterTuner
 * @brief Grid search of hyperparameters for one category.
 *
 * Every combination is scored by cross-validated MAPE on its own worker task.
 * A candidate that fails is recorded with its error message and the search
 * carries on.
 */
class ParameterTuner {
public:
	using ProgressCallback = std::function<void(std::size_t done, std::size_t total)>;

	ParameterTuner(validation::ErrorEvaluator evaluator, params::HyperparameterSet base, TuningOptions options = {});

	/**
	 * @throws std::invalid_argument If @p grid is empty or yields an invalid set.
	 * @throws core::TuningError If no candidate produced a defined MAPE.
	 */
	TuningReport tune(const core::TimeSeries &series, const std::string &category, const ParameterGrid &grid,
	                  const std::vector<calendar::HolidayEvent> &holidays,
	                  const ProgressCallback &progress = nullptr) const;

	const TuningOptions &options() const {
		return options_;
	}

private:
	TuningResult evaluateCandidate(std::size_t index, const params::HyperparameterSet &candidate,
	                               const core::TimeSeries &series,
	                               const std::vector<calendar::HolidayEvent> &holidays) const;

	validation::ErrorEvaluator evaluator_;
	params::HyperparameterSet base_;
	TuningOptions options_;
};

} // namespace salescast::tuning
