#include "metrics.h"

#include <limits>
#include <string>

namespace ForkOracle {

namespace {

// max(0, later - earlier), saturating instead of overflowing.
int64_t ClampedElapsed(int64_t later, int64_t earlier) {
	if (later <= earlier) return 0;
	if (earlier < 0 && later > std::numeric_limits<int64_t>::max() + earlier) {
		return std::numeric_limits<int64_t>::max();
	}
	return later - earlier;
}

} // namespace

std::optional<int64_t> DetectionLatencyMs(DetectionReference reference,
		std::optional<int64_t> detection_time,
		std::optional<int64_t> fork_created_time) {
	if (!detection_time) return std::nullopt;

	int64_t reference_time = *detection_time;
	if (reference == DetectionReference::ForkCreated && fork_created_time) {
		reference_time = *fork_created_time;
	}
	return ClampedElapsed(*detection_time, reference_time);
}

std::optional<int64_t> ReconciliationLatencyMs(const Schedule& schedule,
		std::optional<int64_t> detection_time) {
	if (!detection_time) return std::nullopt;
	for (const Event* ev : schedule) {
		if (ev->type == EventType::Merge) {
			return ClampedElapsed(ev->t, *detection_time);
		}
	}
	return std::nullopt;
}

int64_t CountDroppedMessages(const Schedule& schedule) {
	int64_t dropped = 0;
	for (const Event* ev : schedule) {
		if (ev->type != EventType::ReplayAttempt || !ev->count) continue;
		const int64_t count = *ev->count;
		if ((count > 0 && dropped > std::numeric_limits<int64_t>::max() - count)
				|| (count < 0 && dropped < std::numeric_limits<int64_t>::min() - count)) {
			throw CorpusError("replay_attempt counts overflow at t=" + std::to_string(ev->t));
		}
		dropped += count;
	}
	return dropped;
}

} // namespace ForkOracle
