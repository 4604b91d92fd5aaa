#include "salescast/service/forecast_orchestrator.hpp"

#include "salescast/calendar/builtin_holidays.hpp"
#include "salescast/core/errors.hpp"
#include "salescast/utils/logging.hpp"

#include <sstream>
#include <stdexcept>

namespace salescast::service {

namespace {

std::string describe(const std::set<int> &periods) {
	std::ostringstream os;
	os << '{';
	bool first = true;
	for (int p : periods) {
		os << (first ? "" : ", ") << p;
		first = false;
	}
	os << '}';
	return os.str();
}

} // namespace

ForecastOrchestrator::ForecastOrchestrator(std::shared_ptr<const core::TransactionSource> transactions,
                                           std::shared_ptr<const calendar::HolidaySource> holidays,
                                           params::ParameterResolver resolver, OrchestratorConfig config,
                                           std::shared_ptr<ModelCache> cache)
    : transactions_(std::move(transactions)), holidays_(std::move(holidays)), resolver_(std::move(resolver)),
      config_(std::move(config)), cache_(std::move(cache)), aggregator_(config_.aggregator),
      fitter_(config_.fitter), evaluator_(fitter_) {
	if (!transactions_) {
		throw std::invalid_argument("ForecastOrchestrator requires a transaction source.");
	}
	if (config_.allowed_periods.empty()) {
		throw std::invalid_argument("At least one forecast horizon must be allowed.");
	}
	for (int p : config_.allowed_periods) {
		if (p <= 0) {
			throw std::invalid_argument("Allowed forecast horizons must be positive.");
		}
	}
	if (config_.holdout_size == 0) {
		throw std::invalid_argument("Backtest holdout must be at least one bucket.");
	}
}

core::ForecastResult ForecastOrchestrator::forecast(const std::string &product_id, const std::string &category,
                                                    int periods, core::Granularity granularity) const {
	if (config_.allowed_periods.count(periods) == 0) {
		throw core::InvalidPeriodsError("Forecast horizon " + std::to_string(periods) + " is not one of " +
		                                describe(config_.allowed_periods) + ".");
	}
	SALESCAST_INFO("Forecast requested: product '{}', category '{}', {} {} periods", product_id, category, periods,
	               core::toString(granularity));

	const auto series = aggregator_.aggregate(transactions_->transactionsFor(product_id), product_id, granularity);
	const auto future_dates = series.futureDates(static_cast<std::size_t>(periods));

	// Holidays span the longest allowed horizon; the fitted model must not depend on the requested one.
	const auto longest = static_cast<std::size_t>(*config_.allowed_periods.rbegin());
	const auto holidays = holidays_.holidaysOrEmpty(config_.region, series.firstDate().year(),
	                                                series.futureDates(longest).back().year());
	const auto params = resolver_.resolve(category);

	std::shared_ptr<const models::FittedModel> model;
	if (cache_) {
		model = cache_->getOrFit(ModelCache::makeKey(product_id, category, params, series),
		                         [&]() { return fitter_.fit(series, params, holidays); });
	} else {
		model = std::make_shared<const models::FittedModel>(fitter_.fit(series, params, holidays));
	}

	const auto backtest = evaluator_.evaluate(series, params, holidays, config_.holdout_size);
	const auto projected = model->predict(future_dates);

	std::vector<core::ForecastPoint> points;
	points.reserve(series.size() + future_dates.size());
	const auto &fitted = model->fittedValues();
	for (std::size_t i = 0; i < series.size(); ++i) {
		points.push_back(core::ForecastPoint{series.dates()[i], fitted[i].yhat, fitted[i].yhat_lower,
		                                     fitted[i].yhat_upper, true});
	}
	for (std::size_t i = 0; i < future_dates.size(); ++i) {
		points.push_back(core::ForecastPoint{future_dates[i], projected[i].yhat, projected[i].yhat_lower,
		                                     projected[i].yhat_upper, false});
	}

	if (backtest.mape) {
		SALESCAST_INFO("Forecast for '{}' ready: {} historical + {} future points, MAPE {:.2f}%", product_id,
		               series.size(), periods, *backtest.mape);
	} else {
		SALESCAST_INFO("Forecast for '{}' ready: {} historical + {} future points, MAPE undefined", product_id,
		               series.size(), periods);
	}
	return core::ForecastResult(std::move(points), backtest.mape, backtest.excluded_zero_actuals, periods);
}

void ForecastOrchestrator::onTransactionsRecorded(const std::string &product_id) {
	if (cache_) {
		cache_->invalidate(product_id);
	}
}

std::unique_ptr<ForecastOrchestrator> ForecastOrchestratorBuilder::build() {
	std::shared_ptr<const calendar::HolidaySource> holidays = holidays_;
	if (!holidays) {
		holidays = std::make_shared<const calendar::BuiltinHolidaySource>();
	}
	std::shared_ptr<const params::ParameterSource> parameters = parameters_;
	if (!parameters) {
		parameters = std::make_shared<const params::InMemoryParameterSource>();
	}
	return std::make_unique<ForecastOrchestrator>(transactions_, std::move(holidays),
	                                              params::ParameterResolver(std::move(parameters), defaults_),
	                                              config_, cache_);
}

} // namespace salescast::service
