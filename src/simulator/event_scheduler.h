#pragma once

#include <vector>

#include "../corpus/epoch_types.h"

namespace ForkOracle {

/// Processing order of a scenario's events; pointers into the scenario's event list.
using Schedule = std::vector<const Event*>;

// Strict weak order used by the scheduler: t ascending, then event label
// lexicographically, then declaration order.
bool ScheduledBefore(const Event& a, const Event& b);

/**
 * Produces the single deterministic processing order for an event list.
 * The result points into events, which must outlive it.
 */
Schedule ScheduleEvents(const std::vector<Event>& events);

} // namespace ForkOracle
