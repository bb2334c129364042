#include "chain_integrity.h"

#include <glog/logging.h>

#include "../common/config.h"

namespace ForkOracle {

void ChainIntegrityChecker::OnEpochIssue(const Event& event, const EpochNode& node) {
	if (!node.parent_id || !node.previous_epoch_hash) return;

	const EpochNode* parent = graph_.Find(*node.parent_id);
	if (!parent) {
		VLOG(2) << "Chain check skipped for " << node.node_id << ": parent "
			<< *node.parent_id << " not in graph";
		return;
	}
	if (parent->eare_hash == *node.previous_epoch_hash) return;

	++breaks_;
	if (errors_.Register(kErrorHashChainBreak)) {
		VLOG(1) << "Hash chain break at t=" << event.t << ": " << node.node_id
			<< " references " << *node.previous_epoch_hash << " but parent "
			<< parent->node_id << " is " << parent->eare_hash;
	}
}

} // namespace ForkOracle
