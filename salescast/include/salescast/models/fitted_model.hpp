#pragma once

#include "salescast/core/forecast.hpp"
#include "salescast/models/model_design.hpp"
#include "salescast/params/hyperparameters.hpp"

#include <Eigen/Dense>

#include <string>
#include <utility>
#include <vector>

namespace salescast::models {

/// Coefficients estimated by the fitter, in scaled model units.
struct ModelCoefficients {
	double k = 0.0;               // base growth rate
	double m = 0.0;               // offset
	Eigen::VectorXd deltas;       // rate adjustments at changepoints
	Eigen::VectorXd seasonal;     // Fourier and month-indicator coefficients
	Eigen::VectorXd holiday;      // one per holiday name
};

/// How model-space values map back to demand units.
struct OutputTransform {
	double scale = 1.0;
	bool log_transform = false;
	bool clip_negative = true;
	double interval_width = 0.95;
	double z = 1.959963984540054;
};

/**
 * @class FittedModel
 * @brief Result of fitting the decomposition model to one series.
 *
 * Immutable once constructed. Safe to share between threads as
 * std::shared_ptr<const FittedModel>.
 *
 * Prediction intervals are yhat +/- z * sigma, where sigma is the standard
 * deviation of the in-sample residuals and z the normal quantile for the
 * configured interval width. This is an approximation: it assumes residuals
 * are roughly normal with constant variance, and it ignores uncertainty in the
 * trend beyond the training range, so intervals do not widen with the horizon.
 */
class FittedModel {
public:
	FittedModel(ModelDesign design, params::HyperparameterSet params, ModelCoefficients coefficients,
	            OutputTransform transform, double residual_sigma, int iterations);

	/// Predictions for arbitrary dates, in demand units.
	std::vector<core::Prediction> predict(const std::vector<core::Date> &dates) const;

	/// In-sample predictions, one per training bucket.
	const std::vector<core::Prediction> &fittedValues() const {
		return fitted_;
	}

	const ModelDesign &design() const {
		return design_;
	}
	const params::HyperparameterSet &parameters() const {
		return params_;
	}
	const ModelCoefficients &coefficients() const {
		return coefficients_;
	}
	const OutputTransform &transform() const {
		return transform_;
	}

	/// Residual standard deviation in scaled model units.
	double residualSigma() const {
		return residual_sigma_;
	}

	int iterations() const {
		return iterations_;
	}

	core::Granularity granularity() const {
		return design_.granularity();
	}
	const core::Date &firstDate() const {
		return design_.firstBucket();
	}
	core::Date lastDate() const;
	std::size_t trainingSize() const {
		return design_.bucketCount();
	}

	/// Estimated effect per holiday name, in scaled model units.
	std::vector<std::pair<std::string, double>> holidayEffects() const;

	/**
	 * @brief Model-space components for @p dates.
	 *
	 * @p trend receives the piecewise-linear trend and @p relative the summed
	 * seasonal and holiday terms. The combined value is trend + relative
	 * (additive) or trend * (1 + relative) (multiplicative).
	 */
	void components(const std::vector<core::Date> &dates, Eigen::VectorXd &trend, Eigen::VectorXd &relative) const;

private:
	double toDemand(double model_value) const;

	ModelDesign design_;
	params::HyperparameterSet params_;
	ModelCoefficients coefficients_;
	OutputTransform transform_;
	double residual_sigma_;
	int iterations_;
	std::vector<core::Prediction> fitted_;
};

} // namespace salescast::models
