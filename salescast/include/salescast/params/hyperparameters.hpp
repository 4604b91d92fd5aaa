#pragma once

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

namespace salescast::params {

enum class SeasonalityMode {
	Additive,
	Multiplicative
};

inline std::string toString(SeasonalityMode mode) {
	return mode == SeasonalityMode::Additive ? "additive" : "multiplicative";
}

inline SeasonalityMode parseSeasonalityMode(const std::string &text) {
	if (text == "additive") {
		return SeasonalityMode::Additive;
	}
	if (text == "multiplicative") {
		return SeasonalityMode::Multiplicative;
	}
	throw std::invalid_argument("Unknown seasonality mode '" + text + "'.");
}

/**
 * @struct HyperparameterSet
 * @brief Prior scales controlling how freely each model component may move.
 *
 * Larger values mean weaker regularization: a larger trend_flexibility lets
 * the trend bend more readily at changepoints, and the same holds for
 * seasonal and holiday coefficients.
 */
struct HyperparameterSet {
	static constexpr const char *kDefaultCategory = "default";

	std::string category = kDefaultCategory;
	double trend_flexibility = 0.05;
	double seasonality_strength = 10.0;
	double holiday_strength = 10.0;
	SeasonalityMode seasonality_mode = SeasonalityMode::Additive;

	/// @throws std::invalid_argument If a strength is not a finite positive number.
	void validate() const {
		checkScale(trend_flexibility, "trend_flexibility");
		checkScale(seasonality_strength, "seasonality_strength");
		checkScale(holiday_strength, "holiday_strength");
	}

	/// Stable textual identity of the values (category excluded), used as a cache key part.
	std::string fingerprint() const {
		std::ostringstream os;
		os.precision(17);
		os << trend_flexibility << '|' << seasonality_strength << '|' << holiday_strength << '|'
		   << toString(seasonality_mode);
		return os.str();
	}

	friend bool operator==(const HyperparameterSet &lhs, const HyperparameterSet &rhs) {
		return lhs.category == rhs.category && lhs.trend_flexibility == rhs.trend_flexibility &&
		       lhs.seasonality_strength == rhs.seasonality_strength &&
		       lhs.holiday_strength == rhs.holiday_strength && lhs.seasonality_mode == rhs.seasonality_mode;
	}

private:
	static void checkScale(double value, const char *name) {
		if (!std::isfinite(value) || value <= 0.0) {
			throw std::invalid_argument(std::string("Hyperparameter '") + name + "' must be finite and positive.");
		}
	}
};

} // namespace salescast::params
