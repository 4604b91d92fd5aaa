#include "salescast/calendar/holiday_provider.hpp"

#include "salescast/core/errors.hpp"
#include "salescast/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace salescast::calendar {

HolidayCalendarProvider::HolidayCalendarProvider(std::shared_ptr<const HolidaySource> source)
    : source_(std::move(source)) {
	if (!source_) {
		throw std::invalid_argument("HolidayCalendarProvider requires a holiday source.");
	}
}

std::vector<HolidayEvent> HolidayCalendarProvider::holidaysFor(const std::string &region, int first_year,
                                                               int last_year) const {
	if (first_year > last_year) {
		throw std::invalid_argument("Holiday year range must not be reversed.");
	}

	std::vector<HolidayEvent> events;
	for (int year = first_year; year <= last_year; ++year) {
		auto yearly = source_->lookup(region, year);
		if (!yearly) {
			throw core::UnsupportedRegionError(region);
		}
		events.insert(events.end(), yearly->begin(), yearly->end());
	}

	std::sort(events.begin(), events.end());
	events.erase(std::unique(events.begin(), events.end()), events.end());
	return events;
}

std::vector<HolidayEvent> HolidayCalendarProvider::holidaysOrEmpty(const std::string &region, int first_year,
                                                                   int last_year) const {
	try {
		return holidaysFor(region, first_year, last_year);
	} catch (const core::UnsupportedRegionError &e) {
		SALESCAST_WARN("Holiday effects disabled: {}", e.what());
		return {};
	}
}

} // namespace salescast::calendar
