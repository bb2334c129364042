#include "event_scheduler.h"

#include <algorithm>

namespace ForkOracle {

bool ScheduledBefore(const Event& a, const Event& b) {
	if (a.t != b.t) return a.t < b.t;
	if (a.label != b.label) return a.label < b.label;
	return a.declaration_index < b.declaration_index;
}

Schedule ScheduleEvents(const std::vector<Event>& events) {
	Schedule schedule;
	schedule.reserve(events.size());
	for (const auto& ev : events) {
		schedule.push_back(&ev);
	}
	// Equal declaration_index values keep list order.
	std::stable_sort(schedule.begin(), schedule.end(), [](const Event* a, const Event* b) {
		return ScheduledBefore(*a, *b);
	});
	return schedule;
}

} // namespace ForkOracle
