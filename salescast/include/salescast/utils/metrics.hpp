#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace salescast::utils {

/// MAPE together with the number of points it was computed over.
struct PercentageError {
	/// Mean absolute percentage error in percent; empty when every actual was zero.
	std::optional<double> value;
	std::size_t evaluated = 0;
	/// Points skipped because their actual was zero.
	std::size_t excluded = 0;
};

class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static std::optional<double> mape(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// MAPE that reports how many zero actuals were left out of the average.
	static PercentageError mapeWithExclusions(const std::vector<double> &actual, const std::vector<double> &predicted);

	// Prediction interval coverage
	static double coverage(const std::vector<double> &actual, const std::vector<double> &lower,
	                       const std::vector<double> &upper);
};

} // namespace salescast::utils
