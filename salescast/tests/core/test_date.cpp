#include <catch2/catch_test_macros.hpp>

#include "salescast/core/date.hpp"

#include <sstream>
#include <stdexcept>
#include <unordered_set>

using salescast::core::Date;

TEST_CASE("Date converts between civil fields and day numbers", "[core][date]") {
	REQUIRE(Date::fromCivil(1970, 1, 1).dayNumber() == 0);
	REQUIRE(Date::fromCivil(2000, 3, 1).dayNumber() == 11017);
	REQUIRE(Date::fromCivil(1969, 12, 31).dayNumber() == -1);

	const auto d = Date::fromDayNumber(19358);
	REQUIRE(d.year() == 2023);
	REQUIRE(d.month() == 1);
	REQUIRE(d.day() == 1);
}

TEST_CASE("Date parses and prints ISO dates", "[core][date]") {
	const auto d = Date::parse("2024-02-29");
	REQUIRE(d.year() == 2024);
	REQUIRE(d.month() == 2);
	REQUIRE(d.day() == 29);
	REQUIRE(d.toString() == "2024-02-29");

	std::ostringstream os;
	os << d;
	REQUIRE(os.str() == "2024-02-29");

	REQUIRE_THROWS_AS(Date::parse("2023-02-29"), std::invalid_argument);
	REQUIRE_THROWS_AS(Date::parse("2023-13-01"), std::invalid_argument);
	REQUIRE_THROWS_AS(Date::parse("2023/01/01"), std::invalid_argument);
	REQUIRE_THROWS_AS(Date::parse("23-01-01"), std::invalid_argument);
	REQUIRE_THROWS_AS(Date::parse("2023-0a-01"), std::invalid_argument);
}

TEST_CASE("Date reports ISO weekdays", "[core][date]") {
	REQUIRE(Date::fromCivil(1970, 1, 1).isoWeekday() == 4);
	REQUIRE(Date::fromCivil(2024, 1, 1).isoWeekday() == 1);
	REQUIRE(Date::fromCivil(2023, 12, 31).isoWeekday() == 7);
	REQUIRE(Date::fromCivil(1969, 12, 27).isoWeekday() == 6);
	REQUIRE(Date::fromCivil(1969, 12, 21).isoWeekday() == 7);
}

TEST_CASE("Date month arithmetic clamps to month end", "[core][date]") {
	const auto jan31 = Date::fromCivil(2023, 1, 31);
	REQUIRE(jan31.plusMonths(1) == Date::fromCivil(2023, 2, 28));
	REQUIRE(Date::fromCivil(2024, 1, 31).plusMonths(1) == Date::fromCivil(2024, 2, 29));
	REQUIRE(jan31.plusMonths(-1) == Date::fromCivil(2022, 12, 31));
	REQUIRE(jan31.plusMonths(12) == Date::fromCivil(2024, 1, 31));
	REQUIRE(jan31.plusDays(1) == Date::fromCivil(2023, 2, 1));
}

TEST_CASE("Date leap years and month lengths", "[core][date]") {
	REQUIRE(Date::isLeapYear(2000));
	REQUIRE_FALSE(Date::isLeapYear(1900));
	REQUIRE(Date::isLeapYear(2024));
	REQUIRE(Date::daysInMonth(2023, 2) == 28);
	REQUIRE(Date::daysInMonth(2023, 4) == 30);
	REQUIRE_THROWS_AS(Date::daysInMonth(2023, 0), std::invalid_argument);
}

TEST_CASE("Date is ordered and hashable", "[core][date]") {
	const auto a = Date::fromCivil(2023, 5, 1);
	const auto b = Date::fromCivil(2023, 5, 2);
	REQUIRE(a < b);
	REQUIRE(b > a);
	REQUIRE(a != b);

	std::unordered_set<Date> set{a, b, a};
	REQUIRE(set.size() == 2);
}
