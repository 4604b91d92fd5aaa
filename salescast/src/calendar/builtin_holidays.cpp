#include "salescast/calendar/builtin_holidays.hpp"

#include <stdexcept>

namespace salescast::calendar {

namespace {

struct LunarEntry {
	int year;
	unsigned month;
	unsigned day;
};

// Observed dates in Indonesia; lunar holidays are not derivable from the Gregorian calendar alone.
constexpr LunarEntry kEidAlFitr[] = {
    {2015, 7, 17}, {2016, 7, 6},  {2017, 6, 25}, {2018, 6, 15}, {2019, 6, 5},  {2020, 5, 24},
    {2021, 5, 13}, {2022, 5, 2},  {2023, 4, 22}, {2024, 4, 10}, {2025, 3, 31}, {2026, 3, 20},
    {2027, 3, 10}, {2028, 2, 27}, {2029, 2, 14}, {2030, 2, 5},
};

constexpr LunarEntry kEidAlAdha[] = {
    {2015, 9, 24}, {2016, 9, 12}, {2017, 9, 1},  {2018, 8, 22}, {2019, 8, 11}, {2020, 7, 31},
    {2021, 7, 20}, {2022, 7, 10}, {2023, 6, 29}, {2024, 6, 17}, {2025, 6, 6},  {2026, 5, 27},
    {2027, 5, 17}, {2028, 5, 5},  {2029, 4, 24}, {2030, 4, 13},
};

constexpr LunarEntry kChineseNewYear[] = {
    {2015, 2, 19}, {2016, 2, 8},  {2017, 1, 28}, {2018, 2, 16}, {2019, 2, 5},  {2020, 1, 25},
    {2021, 2, 12}, {2022, 2, 1},  {2023, 1, 22}, {2024, 2, 10}, {2025, 1, 29}, {2026, 2, 17},
    {2027, 2, 6},  {2028, 1, 26}, {2029, 2, 13}, {2030, 2, 3},
};

template <std::size_t N>
void appendLunar(std::vector<HolidayEvent> &events, const LunarEntry (&table)[N], int year,
                 const std::string &name) {
	for (const auto &entry : table) {
		if (entry.year == year) {
			events.push_back({core::Date::fromCivil(entry.year, entry.month, entry.day), name});
		}
	}
}

} // namespace

std::vector<std::string> BuiltinHolidaySource::supportedRegions() {
	return {"ID", "US"};
}

std::optional<std::vector<HolidayEvent>> BuiltinHolidaySource::lookup(const std::string &region, int year) const {
	if (region == "ID") {
		return indonesia(year);
	}
	if (region == "US") {
		return unitedStates(year);
	}
	return std::nullopt;
}

core::Date BuiltinHolidaySource::easterSunday(int year) {
	const int a = year % 19;
	const int b = year / 100;
	const int c = year % 100;
	const int d = b / 4;
	const int e = b % 4;
	const int f = (b + 8) / 25;
	const int g = (b - f + 1) / 3;
	const int h = (19 * a + b - d - g + 15) % 30;
	const int i = c / 4;
	const int k = c % 4;
	const int l = (32 + 2 * e + 2 * i - h - k) % 7;
	const int m = (a + 11 * h + 22 * l) / 451;
	const int month = (h + l - 7 * m + 114) / 31;
	const int day = (h + l - 7 * m + 114) % 31 + 1;
	return core::Date::fromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

core::Date BuiltinHolidaySource::nthWeekday(int year, unsigned month, unsigned weekday, int n) {
	if (weekday < 1 || weekday > 7 || n == 0 || n < -1 || n > 5) {
		throw std::invalid_argument("Invalid weekday rule.");
	}
	if (n == -1) {
		const core::Date last = core::Date::fromCivil(year, month, core::Date::daysInMonth(year, month));
		const int back = (static_cast<int>(last.isoWeekday()) - static_cast<int>(weekday) + 7) % 7;
		return last.plusDays(-back);
	}
	const core::Date first = core::Date::fromCivil(year, month, 1);
	const int forward = (static_cast<int>(weekday) - static_cast<int>(first.isoWeekday()) + 7) % 7;
	const core::Date result = first.plusDays(forward + 7 * (n - 1));
	if (result.month() != month) {
		throw std::invalid_argument("Month has no such weekday occurrence.");
	}
	return result;
}

std::vector<HolidayEvent> BuiltinHolidaySource::indonesia(int year) {
	std::vector<HolidayEvent> events;
	const core::Date easter = easterSunday(year);

	events.push_back({core::Date::fromCivil(year, 1, 1), "New Year's Day"});
	appendLunar(events, kChineseNewYear, year, "Chinese New Year");
	events.push_back({easter.plusDays(-2), "Good Friday"});
	events.push_back({core::Date::fromCivil(year, 5, 1), "Labour Day"});
	events.push_back({easter.plusDays(39), "Ascension Day"});
	if (year >= 2017) {
		events.push_back({core::Date::fromCivil(year, 6, 1), "Pancasila Day"});
	}
	appendLunar(events, kEidAlFitr, year, "Eid al-Fitr");
	for (const auto &entry : kEidAlFitr) {
		if (entry.year == year) {
			events.push_back({core::Date::fromCivil(entry.year, entry.month, entry.day).plusDays(1),
			                  "Eid al-Fitr Second Day"});
		}
	}
	appendLunar(events, kEidAlAdha, year, "Eid al-Adha");
	events.push_back({core::Date::fromCivil(year, 8, 17), "Independence Day"});
	events.push_back({core::Date::fromCivil(year, 12, 25), "Christmas Day"});
	return events;
}

std::vector<HolidayEvent> BuiltinHolidaySource::unitedStates(int year) {
	constexpr unsigned kMonday = 1;
	constexpr unsigned kThursday = 4;
	std::vector<HolidayEvent> events;
	events.push_back({core::Date::fromCivil(year, 1, 1), "New Year's Day"});
	if (year >= 1986) {
		events.push_back({nthWeekday(year, 1, kMonday, 3), "Martin Luther King Jr. Day"});
	}
	events.push_back({nthWeekday(year, 2, kMonday, 3), "Washington's Birthday"});
	events.push_back({nthWeekday(year, 5, kMonday, -1), "Memorial Day"});
	if (year >= 2021) {
		events.push_back({core::Date::fromCivil(year, 6, 19), "Juneteenth"});
	}
	events.push_back({core::Date::fromCivil(year, 7, 4), "Independence Day"});
	events.push_back({nthWeekday(year, 9, kMonday, 1), "Labor Day"});
	events.push_back({nthWeekday(year, 10, kMonday, 2), "Columbus Day"});
	events.push_back({core::Date::fromCivil(year, 11, 11), "Veterans Day"});
	events.push_back({nthWeekday(year, 11, kThursday, 4), "Thanksgiving Day"});
	events.push_back({core::Date::fromCivil(year, 12, 25), "Christmas Day"});
	return events;
}

} // namespace salescast::calendar
