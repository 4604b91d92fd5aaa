#include "salescast/core/date.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace salescast::core {

namespace {

struct Civil {
	int year;
	unsigned month;
	unsigned day;
};

std::int64_t daysFromCivil(int y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const auto yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

Civil civilFromDays(std::int64_t z) {
	z += 719468;
	const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const auto doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	const auto y = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400) + (m <= 2 ? 1 : 0);
	return Civil{y, m, d};
}

int parseDigits(const std::string &text, std::size_t pos, std::size_t count) {
	int value = 0;
	for (std::size_t i = pos; i < pos + count; ++i) {
		if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
			throw std::invalid_argument("Date '" + text + "' is not in YYYY-MM-DD format.");
		}
		value = value * 10 + (text[i] - '0');
	}
	return value;
}

} // namespace

bool Date::isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned Date::daysInMonth(int year, unsigned month) {
	static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be within [1, 12].");
	}
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return kDays[month - 1];
}

Date Date::fromCivil(int year, unsigned month, unsigned day) {
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be within [1, 12].");
	}
	if (day < 1 || day > daysInMonth(year, month)) {
		throw std::invalid_argument("Day is out of range for the given month.");
	}
	return fromDayNumber(static_cast<DayNumber>(daysFromCivil(year, month, day)));
}

Date Date::parse(const std::string &text) {
	if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
		throw std::invalid_argument("Date '" + text + "' is not in YYYY-MM-DD format.");
	}
	const int year = parseDigits(text, 0, 4);
	const int month = parseDigits(text, 5, 2);
	const int day = parseDigits(text, 8, 2);
	return fromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

int Date::year() const {
	return civilFromDays(days_).year;
}

unsigned Date::month() const {
	return civilFromDays(days_).month;
}

unsigned Date::day() const {
	return civilFromDays(days_).day;
}

unsigned Date::isoWeekday() const {
	const std::int64_t z = days_;
	// 1970-01-01 was a Thursday.
	const auto weekday = static_cast<unsigned>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);
	return weekday == 0 ? 7 : weekday;
}

Date Date::plusMonths(int months) const {
	const auto civil = civilFromDays(days_);
	const int total = civil.year * 12 + static_cast<int>(civil.month) - 1 + months;
	const int year = total >= 0 ? total / 12 : (total - 11) / 12;
	const auto month = static_cast<unsigned>(total - year * 12 + 1);
	const unsigned last_day = daysInMonth(year, month);
	return fromCivil(year, month, civil.day < last_day ? civil.day : last_day);
}

std::string Date::toString() const {
	const auto civil = civilFromDays(days_);
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", civil.year, civil.month, civil.day);
	return std::string(buffer);
}

} // namespace salescast::core
