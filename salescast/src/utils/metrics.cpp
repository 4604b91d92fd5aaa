#include "salescast/utils/metrics.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace salescast::utils {

namespace {

void validate_lengths(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size() || actual.empty()) {
		throw std::invalid_argument("Actual and predicted vectors must be non-empty and equal length.");
	}
}

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		sum += std::abs(actual[i] - predicted[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff = actual[i] - predicted[i];
		sum += diff * diff;
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

std::optional<double> Metrics::mape(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return mapeWithExclusions(actual, predicted).value;
}

PercentageError Metrics::mapeWithExclusions(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	PercentageError result;
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double denom = std::abs(actual[i]);
		if (denom > std::numeric_limits<double>::epsilon()) {
			sum += std::abs(actual[i] - predicted[i]) / denom;
			++result.evaluated;
		} else {
			++result.excluded;
		}
	}
	if (result.evaluated > 0) {
		result.value = (sum / static_cast<double>(result.evaluated)) * 100.0;
	}
	return result;
}

double Metrics::coverage(const std::vector<double> &actual, const std::vector<double> &lower,
                         const std::vector<double> &upper) {
	if (actual.empty()) {
		throw std::invalid_argument("Actual values cannot be empty");
	}
	if (actual.size() != lower.size() || actual.size() != upper.size()) {
		throw std::invalid_argument("Actual, lower, and upper vectors must have the same size");
	}

	size_t covered = 0;
	for (size_t i = 0; i < actual.size(); ++i) {
		if (actual[i] >= lower[i] && actual[i] <= upper[i]) {
			++covered;
		}
	}
	return static_cast<double>(covered) / static_cast<double>(actual.size());
}

} // namespace salescast::utils
