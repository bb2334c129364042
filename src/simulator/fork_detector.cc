#include "fork_detector.h"

#include <limits>
#include <string>

#include <glog/logging.h>

#include "../common/config.h"
#include "../corpus/fault.h"

namespace ForkOracle {

bool ForkDetector::CollidesWithinEpoch(const EpochNode& node) const {
	auto it = observed_.find(node.epoch_id);
	if (it == observed_.end() || it->second.empty()) return false;
	for (const auto& entry : it->second) {
		if (entry.hash == node.eare_hash) return false;
	}
	return true;
}

bool ForkDetector::DivergesFromSiblings(const EpochNode& node) const {
	auto it = children_by_parent_.find(node.parent_id);
	if (it == children_by_parent_.end() || it->second.empty()) return false;
	for (const auto& child : it->second) {
		if (child.epoch_id == node.epoch_id && child.hash == node.eare_hash) return false;
	}
	return true;
}

void ForkDetector::OnEpochIssue(const Event& event, const EpochNode& node) {
	const bool collision = CollidesWithinEpoch(node);
	const bool divergence = DivergesFromSiblings(node);

	observed_[node.epoch_id].push_back({node.node_id, node.eare_hash});
	children_by_parent_[node.parent_id].push_back({node.epoch_id, node.node_id, node.eare_hash});
	delivery_log_.push_back({node.node_id, node.eare_hash});

	if (!collision && !divergence) return;

	VLOG(2) << "Fork shape at t=" << event.t << " node=" << node.node_id
		<< " epoch=" << node.epoch_id << " collision=" << collision << " divergence=" << divergence;

	if (fork_created_time_) return;

	const int64_t delay = ValidationDelayMs(event.faults);
	if ((delay > 0 && event.t > std::numeric_limits<int64_t>::max() - delay)
			|| (delay < 0 && event.t < std::numeric_limits<int64_t>::min() - delay)) {
		throw CorpusError("detection time overflows at t=" + std::to_string(event.t)
				+ " with delay " + std::to_string(delay) + " for node " + node.node_id);
	}

	fork_created_time_ = event.t;
	if (!detection_time_) {
		detection_time_ = event.t + delay;
	}
	errors_.Register(kErrorEpochForkDetected);
	VLOG(1) << "Fork detected: created t=" << *fork_created_time_
		<< " observed t=" << *detection_time_ << " by node " << node.node_id;
}

const std::vector<ObservedRecord>* ForkDetector::ObservedForEpoch(int64_t epoch_id) const {
	auto it = observed_.find(epoch_id);
	return it == observed_.end() ? nullptr : &it->second;
}

const std::vector<ChildRecord>* ForkDetector::ChildrenOf(const std::optional<std::string>& parent_id) const {
	auto it = children_by_parent_.find(parent_id);
	return it == children_by_parent_.end() ? nullptr : &it->second;
}

} // namespace ForkOracle
