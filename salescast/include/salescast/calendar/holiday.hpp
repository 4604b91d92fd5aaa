#pragma once

#include "salescast/core/date.hpp"

#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace salescast::calendar {

struct HolidayEvent {
	core::Date date;
	std::string name;

	friend bool operator==(const HolidayEvent &lhs, const HolidayEvent &rhs) {
		return lhs.date == rhs.date && lhs.name == rhs.name;
	}
	friend bool operator<(const HolidayEvent &lhs, const HolidayEvent &rhs) {
		return std::tie(lhs.date, lhs.name) < std::tie(rhs.date, rhs.name);
	}
};

/**
 * @class HolidaySource
 * @brief Key-based lookup of holiday reference data.
 *
 * Returns std::nullopt when the region is unknown. An empty vector means the
 * region is known but has no holidays in that year.
 */
class HolidaySource {
public:
	virtual ~HolidaySource() = default;

	virtual std::optional<std::vector<HolidayEvent>> lookup(const std::string &region, int year) const = 0;
};

/// Serves caller-provided events, e.g. company closures or promotions.
class InMemoryHolidaySource : public HolidaySource {
public:
	void add(const std::string &region, HolidayEvent event) {
		regions_[region].push_back(std::move(event));
	}

	/// Registers a region with no events so lookups succeed with an empty set.
	void addRegion(const std::string &region) {
		regions_[region];
	}

	std::optional<std::vector<HolidayEvent>> lookup(const std::string &region, int year) const override {
		const auto it = regions_.find(region);
		if (it == regions_.end()) {
			return std::nullopt;
		}
		std::vector<HolidayEvent> events;
		for (const auto &event : it->second) {
			if (event.date.year() == year) {
				events.push_back(event);
			}
		}
		return events;
	}

private:
	std::map<std::string, std::vector<HolidayEvent>> regions_;
};

} // namespace salescast::calendar
