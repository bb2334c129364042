#include "expectation_evaluator.h"

#include <algorithm>

#include "../common/config.h"

namespace ForkOracle {

Verdict EvaluateExpectations(const Expectations& exp, const SimulationResult& result) {
	Verdict verdict;
	auto& failures = verdict.failures;

	if (result.detection != exp.detected) {
		failures.push_back(kFailureDetectionMismatch);
	}
	if (exp.detected) {
		if (!result.detection_ms) {
			failures.push_back(kFailureMissingDetectionMs);
		} else if (exp.max_detection_ms > 0 && *result.detection_ms > exp.max_detection_ms) {
			failures.push_back(kFailureDetectionSla);
		}
	}

	// A reconciled epoch is only compared when both sides name one.
	if (result.winner) {
		const auto& expected = exp.reconciled_epoch;
		if (!expected.eare_hash.empty() && expected.eare_hash != result.winner->eare_hash) {
			failures.push_back(kFailureWinningHashMismatch);
		}
		if (expected.epoch_id != 0 && expected.epoch_id != result.winner->epoch_id) {
			failures.push_back(kFailureWinningEpochMismatch);
		}
	}

	if (exp.healing_required) {
		if (!result.reconciliation_ms) {
			failures.push_back(kFailureMissingReconciliation);
		} else if (exp.max_reconciliation_ms > 0 && *result.reconciliation_ms > exp.max_reconciliation_ms) {
			failures.push_back(kFailureReconciliationSla);
		}
	}

	if (exp.allow_replay_gap.max_messages > 0 && result.messages_dropped > exp.allow_replay_gap.max_messages) {
		failures.push_back(kFailureReplayGapMessages);
	}

	for (const auto& category : exp.expected_error_categories) {
		if (std::find(result.errors.begin(), result.errors.end(), category) == result.errors.end()) {
			failures.push_back(kFailureMissingErrorCategories);
			break;
		}
	}

	verdict.status = failures.empty() ? kStatusPass : kStatusFail;
	return verdict;
}

} // namespace ForkOracle
