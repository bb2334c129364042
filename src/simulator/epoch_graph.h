#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "../corpus/epoch_types.h"

namespace ForkOracle {

/**
 * node_id -> EpochNode lookup over one scenario's graph.
 *
 * The graph borrows the scenario's node list, which must outlive it. Lookups go through
 * a hash index, but nothing output-affecting ever iterates that index.
 */
class EpochGraph {
public:
	// Throws CorpusError on a duplicate node_id.
	explicit EpochGraph(const std::vector<EpochNode>& nodes);

	// nullptr if node_id is unknown
	const EpochNode* Find(const std::string& node_id) const;

	// Throws CorpusError if node_id is unknown
	const EpochNode& Get(const std::string& node_id) const;

	bool Contains(const std::string& node_id) const { return Find(node_id) != nullptr; }
	size_t size() const { return nodes_.size(); }

	/**
	 * Number of parent_id hops from node_id towards a root. A parent that is not in the
	 * graph ends the walk after counting the hop to it, and a cycle ends the walk at
	 * the first revisited node. Unknown node_id has depth 0.
	 */
	size_t Depth(const std::string& node_id) const;

private:
	const std::vector<EpochNode>& nodes_;
	std::unordered_map<std::string, size_t> index_;
};

} // namespace ForkOracle
