#pragma once

#include <cstdint>
#include <optional>

#include "../corpus/epoch_types.h"
#include "event_scheduler.h"

namespace ForkOracle {

/**
 * Detection latency.
 *
 * ForkObservable measures from detection_time itself and is therefore 0 whenever a fork
 * was detected. ForkCreated measures from fork_created_time, falling back to
 * detection_time, and is clamped to >= 0. nullopt when nothing was detected.
 */
std::optional<int64_t> DetectionLatencyMs(DetectionReference reference,
		std::optional<int64_t> detection_time,
		std::optional<int64_t> fork_created_time);

// First merge in the schedule minus detection_time, clamped to >= 0. nullopt if there
// is no detection or no merge.
std::optional<int64_t> ReconciliationLatencyMs(const Schedule& schedule,
		std::optional<int64_t> detection_time);

// Sum of count over every replay_attempt, regardless of fork state. Throws CorpusError
// if the sum leaves int64.
int64_t CountDroppedMessages(const Schedule& schedule);

} // namespace ForkOracle
