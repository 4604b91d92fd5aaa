#pragma once

#include "salescast/calendar/holiday.hpp"

#include <memory>
#include <string>
#include <vector>

namespace salescast::calendar {

/**
 * @class HolidayCalendarProvider
 * @brief Resolves the holiday set for a region and an inclusive year range.
 *
 * Output is sorted by (date, name) and free of duplicates, so repeated calls
 * with the same inputs return identical sets.
 */
class HolidayCalendarProvider {
public:
	explicit HolidayCalendarProvider(std::shared_ptr<const HolidaySource> source);

	/**
	 * @throws core::UnsupportedRegionError If the source does not know @p region.
	 * @throws std::invalid_argument If @p first_year > @p last_year.
	 */
	std::vector<HolidayEvent> holidaysFor(const std::string &region, int first_year, int last_year) const;

	/// Same as holidaysFor(), but an unsupported region yields an empty set and a warning.
	std::vector<HolidayEvent> holidaysOrEmpty(const std::string &region, int first_year, int last_year) const;

private:
	std::shared_ptr<const HolidaySource> source_;
};

} // namespace salescast::calendar
