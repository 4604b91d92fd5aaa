#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "salescast/core/errors.hpp"
#include "salescast/core/forecast.hpp"

#include <stdexcept>
#include <vector>

using namespace salescast::core;
using tests::helpers::date;

namespace {

ForecastPoint point(Date d, bool historical) {
	return ForecastPoint{d, 1.0, 0.5, 1.5, historical};
}

} // namespace

TEST_CASE("ForecastResult partitions historical and future points", "[core][forecast]") {
	ForecastResult result({point(date(2024, 1, 1), true), point(date(2024, 2, 1), true),
	                       point(date(2024, 3, 1), false), point(date(2024, 4, 1), false)},
	                      12.5, 1, 2);

	REQUIRE(result.points().size() == 4);
	REQUIRE(result.historicalCount() == 2);
	REQUIRE(result.future().size() == 2);
	REQUIRE(result.future().front().date == date(2024, 3, 1));
	REQUIRE(result.mape().has_value());
	REQUIRE(*result.mape() == 12.5);
	REQUIRE(result.mapeExcluded() == 1);
	REQUIRE(result.periods() == 2);
}

TEST_CASE("ForecastResult rejects malformed point sequences", "[core][forecast]") {
	SECTION("future count differs from periods") {
		REQUIRE_THROWS_AS(ForecastResult({point(date(2024, 1, 1), true), point(date(2024, 2, 1), false)},
		                                 std::nullopt, 0, 2),
		                  std::invalid_argument);
	}
	SECTION("historical after future") {
		REQUIRE_THROWS_AS(ForecastResult({point(date(2024, 1, 1), false), point(date(2024, 2, 1), true)},
		                                 std::nullopt, 0, 1),
		                  std::invalid_argument);
	}
	SECTION("dates not increasing") {
		REQUIRE_THROWS_AS(ForecastResult({point(date(2024, 2, 1), true), point(date(2024, 1, 1), false)},
		                                 std::nullopt, 0, 1),
		                  std::invalid_argument);
	}
}

TEST_CASE("ForecastResult keeps an undefined MAPE distinct from zero", "[core][forecast]") {
	ForecastResult result({point(date(2024, 1, 1), true), point(date(2024, 2, 1), false)}, std::nullopt, 3, 1);
	REQUIRE_FALSE(result.mape().has_value());
	REQUIRE(result.mapeExcluded() == 3);
}

TEST_CASE("Forecast errors carry their failure reason", "[core][errors]") {
	const InvalidPeriodsError error("bad horizon");
	const ForecastError &base = error;
	REQUIRE(base.reason() == FailureReason::InvalidPeriods);
	REQUIRE(toString(base.reason()) == "InvalidPeriodsError");
	REQUIRE(std::string(base.what()) == "bad horizon");

	const UnsupportedRegionError region("XX");
	REQUIRE(region.region() == "XX");
	REQUIRE(region.reason() == FailureReason::UnsupportedRegion);
}
