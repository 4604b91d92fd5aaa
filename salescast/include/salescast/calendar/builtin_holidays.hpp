#pragma once

#include "salescast/calendar/holiday.hpp"

#include <optional>
#include <string>
#include <vector>

namespace salescast::calendar {

/**
 * @class BuiltinHolidaySource
 * @brief Computed national public holidays.
 *
 * Supported regions:
 *  - "ID" (Indonesia): fixed-date and Easter-relative holidays for any year;
 *    lunar holidays (Eid al-Fitr, Eid al-Adha, Chinese New Year) from a
 *    reference table covering 2015-2030 and omitted outside it.
 *  - "US" (United States): federal holidays, including nth-weekday rules.
 */
class BuiltinHolidaySource : public HolidaySource {
public:
	std::optional<std::vector<HolidayEvent>> lookup(const std::string &region, int year) const override;

	static std::vector<std::string> supportedRegions();

	/// Western (Gregorian) Easter Sunday.
	static core::Date easterSunday(int year);

	/// The @p n-th (1-based) occurrence of ISO @p weekday in a month; n = -1 selects the last one.
	static core::Date nthWeekday(int year, unsigned month, unsigned weekday, int n);

private:
	static std::vector<HolidayEvent> indonesia(int year);
	static std::vector<HolidayEvent> unitedStates(int year);
};

} // namespace salescast::calendar
