#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "common/series_helpers.hpp"
#include "salescast/core/errors.hpp"
#include "salescast/models/model_fitter.hpp"
#include "salescast/utils/metrics.hpp"

#include <cmath>
#include <stdexcept>

using namespace salescast;
using models::ForecastModelFitter;
using models::ForecastModelFitterBuilder;
using models::FitterOptions;
using tests::helpers::date;
using tests::helpers::makeMonthlySeries;
using tests::helpers::makeWeeklySeries;
using tests::helpers::seasonalMonthly;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

std::vector<double> yhats(const std::vector<core::Prediction> &predictions) {
	std::vector<double> out;
	for (const auto &p : predictions) {
		out.push_back(p.yhat);
	}
	return out;
}

} // namespace

TEST_CASE("Flat history forecasts its level", "[models][fitter]") {
	const auto series = makeMonthlySeries(std::vector<double>(24, 100.0));
	const ForecastModelFitter fitter;
	const auto model = fitter.fit(series, params::HyperparameterSet{}, {});

	REQUIRE(model.trainingSize() == 24);
	REQUIRE(model.firstDate() == date(2022, 1, 1));
	REQUIRE(model.lastDate() == date(2023, 12, 1));
	REQUIRE(model.fittedValues().size() == 24);
	for (const auto &p : model.fittedValues()) {
		REQUIRE_THAT(p.yhat, WithinAbs(100.0, 0.5));
	}

	const auto future = model.predict(series.futureDates(3));
	REQUIRE(future.size() == 3);
	for (const auto &p : future) {
		REQUIRE_THAT(p.yhat, WithinAbs(100.0, 1.0));
		REQUIRE(p.yhat_lower <= p.yhat);
		REQUIRE(p.yhat >= 0.0);
		REQUIRE(p.yhat_upper >= p.yhat);
	}
}

TEST_CASE("Seasonal history is captured in-sample", "[models][fitter]") {
	const auto values = seasonalMonthly(36, 100.0, 20.0, 1.0);
	const auto series = makeMonthlySeries(values);
	const auto model = ForecastModelFitter().fit(series, params::HyperparameterSet{}, {});

	const auto mape = utils::Metrics::mape(values, yhats(model.fittedValues()));
	REQUIRE(mape.has_value());
	REQUIRE(*mape < 5.0);
	REQUIRE(model.design().seasonalColumns() == 12);
	REQUIRE(model.iterations() > 0);
}

TEST_CASE("Repeated fits are identical", "[models][fitter]") {
	const auto series = makeMonthlySeries(seasonalMonthly(30, 50.0, 10.0, 0.5));
	const ForecastModelFitter fitter;
	const auto first = fitter.fit(series, params::HyperparameterSet{}, {});
	const auto second = fitter.fit(series, params::HyperparameterSet{}, {});

	REQUIRE(first.coefficients().k == second.coefficients().k);
	REQUIRE(first.coefficients().m == second.coefficients().m);
	REQUIRE(first.coefficients().seasonal == second.coefficients().seasonal);
	REQUIRE(first.coefficients().deltas == second.coefficients().deltas);
	REQUIRE(yhats(first.fittedValues()) == yhats(second.fittedValues()));
}

TEST_CASE("Series with zero buckets fit without negative demand", "[models][fitter]") {
	std::vector<double> values(24, 0.0);
	values[3] = 12.0;
	values[10] = 4.0;
	values[17] = 9.0;
	const auto series = makeMonthlySeries(values);
	const auto model = ForecastModelFitter().fit(series, params::HyperparameterSet{}, {});

	for (const auto &p : model.predict(series.futureDates(6))) {
		REQUIRE(std::isfinite(p.yhat));
		REQUIRE(p.yhat >= 0.0);
		REQUIRE(p.yhat_lower >= 0.0);
	}

	const auto zeros = ForecastModelFitter().fit(makeMonthlySeries(std::vector<double>(12, 0.0)),
	                                             params::HyperparameterSet{}, {});
	for (const auto &p : zeros.fittedValues()) {
		REQUIRE(p.yhat == 0.0);
	}
}

TEST_CASE("Fitting needs at least two buckets", "[models][fitter][error]") {
	const ForecastModelFitter fitter;
	REQUIRE_THROWS_AS(fitter.fit(makeMonthlySeries({5.0}), params::HyperparameterSet{}, {}),
	                  core::InsufficientHistoryError);
	REQUIRE_NOTHROW(fitter.fit(makeMonthlySeries({5.0, 7.0}), params::HyperparameterSet{}, {}));
}

TEST_CASE("Multiplicative seasonality scales with the trend", "[models][fitter]") {
	std::vector<double> values(36);
	for (std::size_t i = 0; i < values.size(); ++i) {
		const double level = 50.0 + 2.0 * static_cast<double>(i);
		values[i] = level * (1.0 + 0.2 * std::sin(2.0 * M_PI * static_cast<double>(i + 1) / 12.0));
	}
	params::HyperparameterSet params;
	params.seasonality_mode = params::SeasonalityMode::Multiplicative;
	const auto model = ForecastModelFitter().fit(makeMonthlySeries(values), params, {});

	REQUIRE(model.parameters().seasonality_mode == params::SeasonalityMode::Multiplicative);
	const auto mape = utils::Metrics::mape(values, yhats(model.fittedValues()));
	REQUIRE(mape.has_value());
	REQUIRE(*mape < 10.0);
}

TEST_CASE("Log transform maps predictions back to demand units", "[models][fitter]") {
	const auto series = makeMonthlySeries(std::vector<double>(24, 100.0));
	const auto fitter = ForecastModelFitterBuilder().withLogTransform(true).build();
	const auto model = fitter->fit(series, params::HyperparameterSet{}, {});

	REQUIRE(model.transform().log_transform);
	REQUIRE_THAT(model.transform().scale, WithinRel(std::log1p(100.0), 1e-12));
	for (const auto &p : model.predict(series.futureDates(3))) {
		REQUIRE_THAT(p.yhat, WithinRel(100.0, 0.02));
	}

	REQUIRE_THROWS_AS(fitter->fit(makeMonthlySeries({1.0, -2.0, 3.0}), params::HyperparameterSet{}, {}),
	                  std::invalid_argument);
}

TEST_CASE("Prediction intervals bracket the point forecast", "[models][fitter]") {
	const auto series = makeMonthlySeries(seasonalMonthly(24, 80.0, 15.0));
	const auto model = ForecastModelFitter().fit(series, params::HyperparameterSet{}, {});

	REQUIRE_THAT(model.transform().z, WithinAbs(1.959964, 1e-5));
	REQUIRE(model.residualSigma() >= 0.0);
	for (const auto &p : model.predict(series.futureDates(3))) {
		REQUIRE(p.yhat_lower <= p.yhat);
		REQUIRE(p.yhat <= p.yhat_upper);
	}

	const auto narrow = ForecastModelFitterBuilder().withIntervalWidth(0.5).build()->fit(
	    series, params::HyperparameterSet{}, {});
	REQUIRE_THAT(narrow.transform().z, WithinAbs(0.674490, 1e-5));
}

TEST_CASE("Holiday effects are estimated for holidays in the history", "[models][fitter]") {
	std::vector<double> values(24, 100.0);
	values[5] = 160.0;
	values[17] = 160.0;
	const std::vector<calendar::HolidayEvent> holidays{
	    {date(2022, 6, 20), "Mid-year sale"},
	    {date(2023, 6, 20), "Mid-year sale"},
	};
	const auto fitter = ForecastModelFitterBuilder().withHolidayWindow(0).build();
	const auto model = fitter->fit(makeMonthlySeries(values), params::HyperparameterSet{}, holidays);

	const auto effects = model.holidayEffects();
	REQUIRE(effects.size() == 1);
	REQUIRE(effects[0].first == "Mid-year sale");
	REQUIRE(effects[0].second > 0.0);
	REQUIRE(model.fittedValues()[5].yhat > model.fittedValues()[4].yhat);
}

TEST_CASE("Weekly buckets use yearly seasonality only", "[models][fitter]") {
	const ForecastModelFitter fitter;
	const auto weekly = fitter.seasonalitiesFor(core::Granularity::Weekly);
	REQUIRE(weekly.size() == 1);
	REQUIRE(weekly[0].name == "yearly");
	REQUIRE(weekly[0].order == 10);

	const auto daily = fitter.seasonalitiesFor(core::Granularity::Daily);
	REQUIRE(daily.size() == 2);
	REQUIRE(daily[1].name == "weekly");
	REQUIRE(daily[1].order == 3);

	REQUIRE(fitter.seasonalitiesFor(core::Granularity::Monthly)[0].order == 6);

	const auto model = fitter.fit(makeWeeklySeries(std::vector<double>(30, 10.0)), params::HyperparameterSet{}, {});
	REQUIRE(model.granularity() == core::Granularity::Weekly);
}

TEST_CASE("Fitter reports optimizer failure as a model fit error", "[models][fitter][error]") {
	const auto fitter = ForecastModelFitterBuilder().withMaxIterations(1).build();
	REQUIRE_THROWS_AS(fitter->fit(makeMonthlySeries(seasonalMonthly(36, 100.0, 30.0, 2.0)),
	                              params::HyperparameterSet{}, {}),
	                  core::ModelFitError);
}

TEST_CASE("Fitter options are validated", "[models][fitter][error]") {
	FitterOptions options;
	REQUIRE_NOTHROW(options.validate());

	options.changepoint_range = 0.0;
	REQUIRE_THROWS_AS(ForecastModelFitter(options), std::invalid_argument);
	options = FitterOptions{};
	options.interval_width = 1.0;
	REQUIRE_THROWS_AS(options.validate(), std::invalid_argument);
	options = FitterOptions{};
	options.max_iterations = 0;
	REQUIRE_THROWS_AS(options.validate(), std::invalid_argument);
	REQUIRE_THROWS_AS(ForecastModelFitterBuilder().withHolidayWindow(-1).build(), std::invalid_argument);

	const auto custom =
	    ForecastModelFitterBuilder().withChangepoints(5).withYearlyOrder(2).withMonthlyIndicators(true).build();
	REQUIRE(custom->options().n_changepoints == 5);
	REQUIRE(custom->seasonalitiesFor(core::Granularity::Monthly)[0].order == 2);
	REQUIRE(custom->options().monthly_indicators);
}
