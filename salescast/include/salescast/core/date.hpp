#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace salescast::core {

/**
 * @class Date
 * @brief A proleptic Gregorian calendar day, stored as days since 1970-01-01.
 *
 * Dates are the unit of every series bucket and holiday in the engine. The
 * conversions follow the civil-from-days / days-from-civil algorithms so that
 * arithmetic is exact over the whole int32 range of day numbers.
 */
class Date {
public:
	using DayNumber = std::int32_t;

	Date() = default;

	/**
	 * @brief Builds a date from its civil fields.
	 * @throws std::invalid_argument If the month or day is out of range.
	 */
	static Date fromCivil(int year, unsigned month, unsigned day);

	static Date fromDayNumber(DayNumber days) {
		Date date;
		date.days_ = days;
		return date;
	}

	/**
	 * @brief Parses an ISO-8601 calendar date ("YYYY-MM-DD").
	 * @throws std::invalid_argument On any malformed input.
	 */
	static Date parse(const std::string &text);

	DayNumber dayNumber() const {
		return days_;
	}

	int year() const;
	unsigned month() const;
	unsigned day() const;

	/// ISO weekday: Monday = 1 ... Sunday = 7.
	unsigned isoWeekday() const;

	Date plusDays(int days) const {
		return fromDayNumber(days_ + days);
	}

	/// Adds calendar months, clamping the day to the target month's length.
	Date plusMonths(int months) const;

	std::string toString() const;

	static bool isLeapYear(int year);
	static unsigned daysInMonth(int year, unsigned month);

	friend bool operator==(const Date &lhs, const Date &rhs) {
		return lhs.days_ == rhs.days_;
	}
	friend bool operator!=(const Date &lhs, const Date &rhs) {
		return lhs.days_ != rhs.days_;
	}
	friend bool operator<(const Date &lhs, const Date &rhs) {
		return lhs.days_ < rhs.days_;
	}
	friend bool operator<=(const Date &lhs, const Date &rhs) {
		return lhs.days_ <= rhs.days_;
	}
	friend bool operator>(const Date &lhs, const Date &rhs) {
		return lhs.days_ > rhs.days_;
	}
	friend bool operator>=(const Date &lhs, const Date &rhs) {
		return lhs.days_ >= rhs.days_;
	}

private:
	DayNumber days_ = 0;
};

inline std::ostream &operator<<(std::ostream &os, const Date &date) {
	return os << date.toString();
}

} // namespace salescast::core

namespace std {
template <>
struct hash<salescast::core::Date> {
	size_t operator()(const salescast::core::Date &date) const noexcept {
		return hash<salescast::core::Date::DayNumber>{}(date.dayNumber());
	}
};
} // namespace std
