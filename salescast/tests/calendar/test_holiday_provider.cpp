#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "salescast/calendar/builtin_holidays.hpp"
#include "salescast/calendar/holiday_provider.hpp"
#include "salescast/core/errors.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>

using namespace salescast::calendar;
using tests::helpers::date;

TEST_CASE("Provider returns a sorted, de-duplicated set over the year range", "[calendar][provider]") {
	auto source = std::make_shared<InMemoryHolidaySource>();
	source->add("ACME", {date(2024, 12, 24), "Closure"});
	source->add("ACME", {date(2023, 7, 1), "Stocktake"});
	source->add("ACME", {date(2023, 7, 1), "Stocktake"});
	source->add("ACME", {date(2025, 1, 2), "Closure"});

	const HolidayCalendarProvider provider(source);
	const auto events = provider.holidaysFor("ACME", 2023, 2024);

	REQUIRE(events.size() == 2);
	REQUIRE(events[0] == HolidayEvent{date(2023, 7, 1), "Stocktake"});
	REQUIRE(events[1] == HolidayEvent{date(2024, 12, 24), "Closure"});
	REQUIRE(std::is_sorted(events.begin(), events.end()));
}

TEST_CASE("Provider output is deterministic", "[calendar][provider]") {
	const HolidayCalendarProvider provider(std::make_shared<BuiltinHolidaySource>());
	REQUIRE(provider.holidaysFor("ID", 2020, 2025) == provider.holidaysFor("ID", 2020, 2025));
}

TEST_CASE("Provider reports unsupported regions and degrades on request", "[calendar][provider][error]") {
	const HolidayCalendarProvider provider(std::make_shared<BuiltinHolidaySource>());

	REQUIRE_THROWS_AS(provider.holidaysFor("XX", 2024, 2024), salescast::core::UnsupportedRegionError);
	REQUIRE(provider.holidaysOrEmpty("XX", 2024, 2024).empty());
	REQUIRE_FALSE(provider.holidaysOrEmpty("ID", 2024, 2024).empty());
}

TEST_CASE("Provider rejects bad arguments", "[calendar][provider][error]") {
	REQUIRE_THROWS_AS(HolidayCalendarProvider(nullptr), std::invalid_argument);

	const HolidayCalendarProvider provider(std::make_shared<BuiltinHolidaySource>());
	REQUIRE_THROWS_AS(provider.holidaysFor("ID", 2025, 2024), std::invalid_argument);
}

TEST_CASE("Registered region with no events yields an empty set", "[calendar][provider]") {
	auto source = std::make_shared<InMemoryHolidaySource>();
	source->addRegion("NONE");
	const HolidayCalendarProvider provider(source);
	REQUIRE(provider.holidaysFor("NONE", 2024, 2024).empty());
}
