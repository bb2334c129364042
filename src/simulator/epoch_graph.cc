#include "epoch_graph.h"

#include <unordered_set>

namespace ForkOracle {

EpochGraph::EpochGraph(const std::vector<EpochNode>& nodes) : nodes_(nodes) {
	index_.reserve(nodes.size());
	for (size_t i = 0; i < nodes.size(); ++i) {
		if (!index_.emplace(nodes[i].node_id, i).second) {
			throw CorpusError("duplicate node_id " + nodes[i].node_id);
		}
	}
}

const EpochNode* EpochGraph::Find(const std::string& node_id) const {
	auto it = index_.find(node_id);
	if (it == index_.end()) return nullptr;
	return &nodes_[it->second];
}

const EpochNode& EpochGraph::Get(const std::string& node_id) const {
	const EpochNode* node = Find(node_id);
	if (!node) {
		throw CorpusError("unknown node_id " + node_id);
	}
	return *node;
}

size_t EpochGraph::Depth(const std::string& node_id) const {
	size_t depth = 0;
	std::unordered_set<std::string> seen;
	const EpochNode* cursor = Find(node_id);
	while (cursor && cursor->parent_id) {
		if (!seen.insert(cursor->node_id).second) {
			break;
		}
		++depth;
		cursor = Find(*cursor->parent_id);
	}
	return depth;
}

} // namespace ForkOracle
