#include "reconciliation.h"

#include <algorithm>

#include <glog/logging.h>

namespace ForkOracle {

bool ForkChoicePrecedes(const ForkChoiceCandidate& a, const ForkChoiceCandidate& b) {
	if (a.depth != b.depth) return a.depth > b.depth;
	if (a.node->epoch_id != b.node->epoch_id) return a.node->epoch_id > b.node->epoch_id;
	if (a.node->timestamp_ms != b.node->timestamp_ms) return a.node->timestamp_ms < b.node->timestamp_ms;
	return a.node->eare_hash > b.node->eare_hash;
}

std::optional<CanonicalEpoch> ResolveCanonicalEpoch(const EpochGraph& graph,
		const std::vector<ObservedRecord>& observed) {
	std::vector<ForkChoiceCandidate> candidates;
	candidates.reserve(observed.size());
	for (const auto& record : observed) {
		const EpochNode* node = graph.Find(record.node_id);
		if (!node) {
			LOG(WARNING) << "Observed record " << record.node_id << " is not in the graph, skipping";
			continue;
		}
		// Depth is computed once per candidate, not per comparison.
		candidates.push_back({node, graph.Depth(node->node_id)});
	}
	if (candidates.empty()) return std::nullopt;

	std::stable_sort(candidates.begin(), candidates.end(), ForkChoicePrecedes);

	const ForkChoiceCandidate& winner = candidates.front();
	VLOG(1) << "Canonical epoch " << winner.node->epoch_id << " node=" << winner.node->node_id
		<< " depth=" << winner.depth << " among " << candidates.size() << " candidates";
	return CanonicalEpoch{winner.node->epoch_id, winner.node->node_id, winner.node->eare_hash};
}

} // namespace ForkOracle
