#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "epoch_graph.h"
#include "fork_detector.h"

namespace ForkOracle {

struct ForkChoiceCandidate {
	const EpochNode* node;
	size_t depth;
};

/**
 * Fork-choice order, most preferred first:
 *   1. depth descending
 *   2. epoch_id descending
 *   3. timestamp_ms ascending
 *   4. eare_hash descending (byte-wise)
 */
bool ForkChoicePrecedes(const ForkChoiceCandidate& a, const ForkChoiceCandidate& b);

struct CanonicalEpoch {
	int64_t epoch_id;
	std::string node_id;
	std::string eare_hash;
};

/**
 * Picks the canonical record among every record the network observed.
 *
 * Candidates that compare equal on all four keys keep observation order, so the first
 * observed one wins. Records whose node_id is not in the graph are skipped.
 * Returns nullopt when nothing was observed.
 */
std::optional<CanonicalEpoch> ResolveCanonicalEpoch(const EpochGraph& graph,
		const std::vector<ObservedRecord>& observed);

} // namespace ForkOracle
