#include "salescast/models/model_fitter.hpp"

#include "salescast/core/errors.hpp"
#include "salescast/optimization/lbfgs_optimizer.hpp"
#include "salescast/utils/logging.hpp"

#include <boost/math/distributions/normal.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace salescast::models {

void FitterOptions::validate() const {
	if (n_changepoints < 0) {
		throw std::invalid_argument("n_changepoints must be non-negative.");
	}
	if (!(changepoint_range > 0.0 && changepoint_range <= 1.0)) {
		throw std::invalid_argument("changepoint_range must be in (0, 1].");
	}
	if (holiday_window < 0) {
		throw std::invalid_argument("holiday_window must be non-negative.");
	}
	if (!(interval_width > 0.0 && interval_width < 1.0)) {
		throw std::invalid_argument("interval_width must be in (0, 1).");
	}
	if (max_iterations <= 0) {
		throw std::invalid_argument("max_iterations must be positive.");
	}
	if (yearly_order && *yearly_order < 0) {
		throw std::invalid_argument("yearly_order must be non-negative.");
	}
	if (weekly_order < 0) {
		throw std::invalid_argument("weekly_order must be non-negative.");
	}
}

ForecastModelFitter::ForecastModelFitter(FitterOptions options) : options_(std::move(options)) {
	options_.validate();
}

std::vector<SeasonalityTerm> ForecastModelFitter::seasonalitiesFor(core::Granularity granularity) const {
	std::vector<SeasonalityTerm> terms;
	const int natural_order = static_cast<int>(std::floor(core::bucketsPerYear(granularity) / 2.0));
	const int yearly = options_.yearly_order.value_or(std::min(10, natural_order));
	if (yearly > 0) {
		terms.push_back(SeasonalityTerm{"yearly", 365.25, yearly});
	}
	// Weekly harmonics sampled once per week are constant, so only daily buckets carry them.
	if (granularity == core::Granularity::Daily && options_.weekly_order > 0) {
		terms.push_back(SeasonalityTerm{"weekly", 7.0, options_.weekly_order});
	}
	return terms;
}

FittedModel ForecastModelFitter::fit(const core::TimeSeries &series, const params::HyperparameterSet &params,
                                     const std::vector<calendar::HolidayEvent> &holidays) const {
	params.validate();
	const std::size_t n = series.size();
	if (n < 2) {
		throw core::InsufficientHistoryError("At least 2 buckets are required to fit a model; got " +
		                                     std::to_string(n) + ".");
	}

	// Model-space targets: optional log1p, then scaled by the largest magnitude.
	Eigen::VectorXd y(static_cast<Eigen::Index>(n));
	for (std::size_t i = 0; i < n; ++i) {
		double value = series.values()[i];
		if (options_.log_transform) {
			if (value <= -1.0) {
				throw std::invalid_argument("Log transform requires values greater than -1.");
			}
			value = std::log1p(value);
		}
		y(static_cast<Eigen::Index>(i)) = value;
	}
	OutputTransform transform;
	transform.scale = y.cwiseAbs().maxCoeff();
	if (transform.scale == 0.0) {
		transform.scale = 1.0;
	}
	transform.log_transform = options_.log_transform;
	transform.clip_negative = options_.clip_negative;
	transform.interval_width = options_.interval_width;
	const boost::math::normal_distribution<double> standard_normal(0.0, 1.0);
	transform.z = boost::math::quantile(standard_normal, 0.5 + options_.interval_width / 2.0);
	y /= transform.scale;

	ModelDesign design(series.granularity(), series.firstDate(), n,
	                   ModelDesign::placeChangepoints(n, options_.n_changepoints, options_.changepoint_range),
	                   seasonalitiesFor(series.granularity()), options_.monthly_indicators, holidays,
	                   options_.holiday_window);

	const Eigen::MatrixXd X = design.designMatrix(design.trainingDates());
	const auto p_trend = static_cast<Eigen::Index>(design.trendColumns());
	const auto p_seasonal = static_cast<Eigen::Index>(design.seasonalColumns());
	const auto p_holiday = static_cast<Eigen::Index>(design.holidayColumns());
	const auto p_relative = p_seasonal + p_holiday;
	const Eigen::Index p = X.cols();

	// Ridge weight per coefficient.
	Eigen::VectorXd lambda(p);
	lambda.head(2).setConstant(kPriorWeight / (kTrendPriorScale * kTrendPriorScale));
	lambda.segment(2, p_trend - 2)
	    .setConstant(kPriorWeight / (params.trend_flexibility * params.trend_flexibility));
	lambda.segment(p_trend, p_seasonal)
	    .setConstant(kPriorWeight / (params.seasonality_strength * params.seasonality_strength));
	lambda.tail(p_holiday).setConstant(kPriorWeight / (params.holiday_strength * params.holiday_strength));

	// Jacobi preconditioner: the optimizer works on phi with theta = D * phi.
	Eigen::VectorXd D(p);
	for (Eigen::Index j = 0; j < p; ++j) {
		D(j) = 1.0 / std::sqrt(X.col(j).squaredNorm() + lambda(j));
	}

	const bool multiplicative = params.seasonality_mode == params::SeasonalityMode::Multiplicative;
	const Eigen::MatrixXd X_trend = X.leftCols(p_trend);
	const Eigen::MatrixXd X_relative = X.rightCols(p_relative);

	auto model_values = [&](const Eigen::VectorXd &theta, Eigen::VectorXd &trend, Eigen::VectorXd &relative) {
		trend = X_trend * theta.head(p_trend);
		if (p_relative > 0) {
			relative = X_relative * theta.tail(p_relative);
		} else {
			relative = Eigen::VectorXd::Zero(y.size());
		}
		if (multiplicative) {
			return Eigen::VectorXd(trend.cwiseProduct(Eigen::VectorXd::Ones(y.size()) + relative));
		}
		return Eigen::VectorXd(trend + relative);
	};

	auto objective = [&](const Eigen::VectorXd &phi, Eigen::VectorXd &grad) {
		const Eigen::VectorXd theta = D.cwiseProduct(phi);
		Eigen::VectorXd trend;
		Eigen::VectorXd relative;
		const Eigen::VectorXd residual = y - model_values(theta, trend, relative);

		Eigen::VectorXd grad_theta(p);
		if (multiplicative) {
			grad_theta.head(p_trend) =
			    -X_trend.transpose() * residual.cwiseProduct(Eigen::VectorXd::Ones(y.size()) + relative);
			if (p_relative > 0) {
				grad_theta.tail(p_relative) = -X_relative.transpose() * residual.cwiseProduct(trend);
			}
		} else {
			grad_theta = -X.transpose() * residual;
		}
		grad_theta += lambda.cwiseProduct(theta);
		grad = D.cwiseProduct(grad_theta);

		return 0.5 * residual.squaredNorm() + 0.5 * theta.cwiseProduct(theta).dot(lambda);
	};

	// Deterministic start: the line through the first and last observation.
	Eigen::VectorXd theta0 = Eigen::VectorXd::Zero(p);
	theta0(0) = y(y.size() - 1) - y(0);
	theta0(1) = y(0);
	const Eigen::VectorXd phi0 = theta0.cwiseQuotient(D);

	optimization::LBFGSOptimizer::Options opt;
	opt.max_iterations = options_.max_iterations;
	opt.epsilon = 1e-6;
	opt.epsilon_rel = 1e-6;
	opt.past = 3;
	opt.delta = 1e-10;
	const auto result = optimization::LBFGSOptimizer::minimize(objective, phi0, opt);
	if (!result.converged) {
		throw core::ModelFitError("Model fit did not converge after " + std::to_string(result.iterations) +
		                          " iterations: " + result.message);
	}

	const Eigen::VectorXd theta = D.cwiseProduct(result.x);
	if (!theta.allFinite()) {
		throw core::ModelFitError("Model fit produced non-finite coefficients.");
	}

	Eigen::VectorXd trend;
	Eigen::VectorXd relative;
	const Eigen::VectorXd residual = y - model_values(theta, trend, relative);
	const double sigma = std::sqrt(residual.squaredNorm() / static_cast<double>(n));

	ModelCoefficients coefficients;
	coefficients.k = theta(0);
	coefficients.m = theta(1);
	coefficients.deltas = theta.segment(2, p_trend - 2);
	coefficients.seasonal = theta.segment(p_trend, p_seasonal);
	coefficients.holiday = theta.tail(p_holiday);

	SALESCAST_DEBUG("Fitted {} model on {} {} buckets: {} changepoints, {} seasonal and {} holiday terms, "
	                "{} iterations, objective {:.6g}, sigma {:.4g}",
	                params::toString(params.seasonality_mode), n, core::toString(series.granularity()),
	                design.changepoints().size(), p_seasonal, p_holiday, result.iterations, result.fx, sigma);

	return FittedModel(std::move(design), params, std::move(coefficients), transform, sigma, result.iterations);
}

} // namespace salescast::models
