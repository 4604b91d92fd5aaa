#include "salescast/models/fitted_model.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace salescast::models {

FittedModel::FittedModel(ModelDesign design, params::HyperparameterSet params, ModelCoefficients coefficients,
                         OutputTransform transform, double residual_sigma, int iterations)
    : design_(std::move(design)), params_(std::move(params)), coefficients_(std::move(coefficients)),
      transform_(transform), residual_sigma_(residual_sigma), iterations_(iterations) {
	if (static_cast<std::size_t>(coefficients_.deltas.size()) != design_.changepoints().size() ||
	    static_cast<std::size_t>(coefficients_.seasonal.size()) != design_.seasonalColumns() ||
	    static_cast<std::size_t>(coefficients_.holiday.size()) != design_.holidayColumns()) {
		throw std::invalid_argument("FittedModel coefficients do not match the model design.");
	}
	fitted_ = predict(design_.trainingDates());
}

core::Date FittedModel::lastDate() const {
	return core::advanceBuckets(design_.firstBucket(), design_.granularity(),
	                            static_cast<int>(design_.bucketCount()) - 1);
}

void FittedModel::components(const std::vector<core::Date> &dates, Eigen::VectorXd &trend,
                             Eigen::VectorXd &relative) const {
	const Eigen::MatrixXd T = design_.trendMatrix(dates);
	Eigen::VectorXd trend_coef(T.cols());
	trend_coef(0) = coefficients_.k;
	trend_coef(1) = coefficients_.m;
	if (coefficients_.deltas.size() > 0) {
		trend_coef.tail(coefficients_.deltas.size()) = coefficients_.deltas;
	}
	trend = T * trend_coef;

	relative = Eigen::VectorXd::Zero(T.rows());
	if (coefficients_.seasonal.size() > 0) {
		relative += design_.seasonalMatrix(dates) * coefficients_.seasonal;
	}
	if (coefficients_.holiday.size() > 0) {
		relative += design_.holidayMatrix(dates) * coefficients_.holiday;
	}
}

double FittedModel::toDemand(double model_value) const {
	double value = model_value * transform_.scale;
	if (transform_.log_transform) {
		value = std::expm1(value);
	}
	if (transform_.clip_negative) {
		value = std::max(0.0, value);
	}
	return value;
}

std::vector<core::Prediction> FittedModel::predict(const std::vector<core::Date> &dates) const {
	std::vector<core::Prediction> predictions;
	if (dates.empty()) {
		return predictions;
	}

	Eigen::VectorXd trend;
	Eigen::VectorXd relative;
	components(dates, trend, relative);

	const bool multiplicative = params_.seasonality_mode == params::SeasonalityMode::Multiplicative;
	const double half_width = transform_.z * residual_sigma_;

	predictions.reserve(dates.size());
	for (Eigen::Index i = 0; i < trend.size(); ++i) {
		const double yhat = multiplicative ? trend(i) * (1.0 + relative(i)) : trend(i) + relative(i);
		core::Prediction p;
		p.yhat = toDemand(yhat);
		p.yhat_lower = toDemand(yhat - half_width);
		p.yhat_upper = toDemand(yhat + half_width);
		predictions.push_back(p);
	}
	return predictions;
}

std::vector<std::pair<std::string, double>> FittedModel::holidayEffects() const {
	std::vector<std::pair<std::string, double>> effects;
	const auto &names = design_.holidayNames();
	effects.reserve(names.size());
	for (std::size_t i = 0; i < names.size(); ++i) {
		effects.emplace_back(names[i], coefficients_.holiday(static_cast<Eigen::Index>(i)));
	}
	return effects;
}

} // namespace salescast::models
