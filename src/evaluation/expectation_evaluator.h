#pragma once

#include <string>
#include <vector>

#include "../corpus/epoch_types.h"
#include "../simulator/simulation.h"

namespace ForkOracle {

/// Failure codes, reported in this order when several apply
inline constexpr char kFailureDetectionMismatch[] = "detection_mismatch";
inline constexpr char kFailureMissingDetectionMs[] = "missing_detection_ms";
inline constexpr char kFailureDetectionSla[] = "detection_sla";
inline constexpr char kFailureWinningHashMismatch[] = "winning_hash_mismatch";
inline constexpr char kFailureWinningEpochMismatch[] = "winning_epoch_mismatch";
inline constexpr char kFailureMissingReconciliation[] = "missing_reconciliation";
inline constexpr char kFailureReconciliationSla[] = "reconciliation_sla";
inline constexpr char kFailureReplayGapMessages[] = "replay_gap_messages";
inline constexpr char kFailureMissingErrorCategories[] = "missing_error_categories";

struct Verdict {
	std::string status;                 // "pass" or "fail"
	std::vector<std::string> failures;

	bool passed() const { return failures.empty(); }
};

/**
 * Diffs a simulation result against the scenario's declared expectations.
 * Never throws on a mismatch; each one becomes a failure code.
 */
Verdict EvaluateExpectations(const Expectations& expectations, const SimulationResult& result);

} // namespace ForkOracle
