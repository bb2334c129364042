#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "error_registry.h"
#include "interfaces.h"

namespace ForkOracle {

struct ObservedRecord {
	std::string node_id;
	std::string hash;
};

struct ChildRecord {
	int64_t epoch_id;
	std::string node_id;
	std::string hash;
};

/**
 * ForkDetector flags the first moment two delivered epoch records stop forming a
 * single linear history.
 *
 * Two shapes count as a fork:
 *  - same-epoch collision: a hash not yet seen for an epoch_id that already has records
 *  - sibling divergence: a parent (or the root) that already has a child record with a
 *    different (epoch_id, hash) pair
 *
 * All indices are owned by the detector, which is built fresh for every scenario run.
 */
class ForkDetector : public IEpochIssueObserver {
public:
	explicit ForkDetector(ErrorRegistry& errors) : errors_(errors) {}

	void OnEpochIssue(const Event& event, const EpochNode& node) override;

	bool detection() const { return detection_time_.has_value(); }

	// Time the validator noticed the fork: event time plus any delay_validation fault.
	std::optional<int64_t> detection_time() const { return detection_time_; }

	// Time the first diverging record was issued.
	std::optional<int64_t> fork_created_time() const { return fork_created_time_; }

	// Every delivered record in delivery order, forked branches included.
	const std::vector<ObservedRecord>& observed_records() const { return delivery_log_; }

	const std::vector<ObservedRecord>* ObservedForEpoch(int64_t epoch_id) const;

	// nullopt parent means the root bucket.
	const std::vector<ChildRecord>* ChildrenOf(const std::optional<std::string>& parent_id) const;

private:
	bool CollidesWithinEpoch(const EpochNode& node) const;
	bool DivergesFromSiblings(const EpochNode& node) const;

	ErrorRegistry& errors_;

	std::map<int64_t, std::vector<ObservedRecord>> observed_;
	std::map<std::optional<std::string>, std::vector<ChildRecord>> children_by_parent_;
	std::vector<ObservedRecord> delivery_log_;

	std::optional<int64_t> fork_created_time_;
	std::optional<int64_t> detection_time_;
};

} // namespace ForkOracle
