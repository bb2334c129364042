#pragma once

#include <cstddef>

#include "epoch_graph.h"
#include "error_registry.h"
#include "interfaces.h"

namespace ForkOracle {

/**
 * Verifies that each delivered record's previous_epoch_hash matches its parent's
 * eare_hash. Runs for every delivered record whether or not a fork was seen.
 * Records without a parent_id or previous_epoch_hash, and records whose parent is
 * not in the graph, are not checked.
 */
class ChainIntegrityChecker : public IEpochIssueObserver {
public:
	ChainIntegrityChecker(const EpochGraph& graph, ErrorRegistry& errors)
		: graph_(graph), errors_(errors) {}

	void OnEpochIssue(const Event& event, const EpochNode& node) override;

	size_t breaks() const { return breaks_; }

private:
	const EpochGraph& graph_;
	ErrorRegistry& errors_;
	size_t breaks_ = 0;
};

} // namespace ForkOracle
