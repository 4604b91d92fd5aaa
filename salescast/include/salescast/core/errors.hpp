#pragma once

#include <stdexcept>
#include <string>

namespace salescast::core {

/// Reason a forecast request failed; surfaced to callers and in failure payloads.
enum class FailureReason {
	InsufficientHistory,
	UnsupportedRegion,
	MissingDefaultParameters,
	ModelFit,
	InvalidPeriods,
	Tuning,
	QueueFull
};

inline std::string toString(FailureReason reason) {
	switch (reason) {
	case FailureReason::InsufficientHistory:
		return "InsufficientHistoryError";
	case FailureReason::UnsupportedRegion:
		return "UnsupportedRegionError";
	case FailureReason::MissingDefaultParameters:
		return "MissingDefaultParametersError";
	case FailureReason::ModelFit:
		return "ModelFitError";
	case FailureReason::InvalidPeriods:
		return "InvalidPeriodsError";
	case FailureReason::Tuning:
		return "TuningError";
	case FailureReason::QueueFull:
		return "QueueFullError";
	}
	return "ForecastError";
}

/**
 * @class ForecastError
 * @brief Base of every engine failure that aborts (or degrades) a forecast.
 */
class ForecastError : public std::runtime_error {
public:
	ForecastError(FailureReason reason, const std::string &message)
	    : std::runtime_error(message), reason_(reason) {
	}

	FailureReason reason() const {
		return reason_;
	}

private:
	FailureReason reason_;
};

/// Not enough history to fit a model or to run a backtest.
class InsufficientHistoryError : public ForecastError {
public:
	explicit InsufficientHistoryError(const std::string &message)
	    : ForecastError(FailureReason::InsufficientHistory, message) {
	}
};

/// Holiday lookup miss; callers degrade to an empty holiday set.
class UnsupportedRegionError : public ForecastError {
public:
	explicit UnsupportedRegionError(const std::string &region)
	    : ForecastError(FailureReason::UnsupportedRegion, "No holiday calendar for region '" + region + "'."),
	      region_(region) {
	}

	const std::string &region() const {
		return region_;
	}

private:
	std::string region_;
};

/// Neither the category nor the system default has hyperparameters configured.
class MissingDefaultParametersError : public ForecastError {
public:
	explicit MissingDefaultParametersError(const std::string &message)
	    : ForecastError(FailureReason::MissingDefaultParameters, message) {
	}
};

/// The optimizer did not converge within its iteration budget.
class ModelFitError : public ForecastError {
public:
	explicit ModelFitError(const std::string &message) : ForecastError(FailureReason::ModelFit, message) {
	}
};

/// The caller asked for a horizon outside the allowed set.
class InvalidPeriodsError : public ForecastError {
public:
	explicit InvalidPeriodsError(const std::string &message)
	    : ForecastError(FailureReason::InvalidPeriods, message) {
	}
};

/// No hyperparameter candidate could be evaluated.
class TuningError : public ForecastError {
public:
	explicit TuningError(const std::string &message) : ForecastError(FailureReason::Tuning, message) {
	}
};

/// The worker pool queue is at capacity.
class QueueFullError : public ForecastError {
public:
	explicit QueueFullError(const std::string &message) : ForecastError(FailureReason::QueueFull, message) {
	}
};

} // namespace salescast::core
