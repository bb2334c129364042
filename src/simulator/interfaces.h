#pragma once

#include "../corpus/epoch_types.h"

namespace ForkOracle {

/**
 * Interface for components that inspect every delivered epoch_issue event
 */
class IEpochIssueObserver {
public:
	virtual ~IEpochIssueObserver() = default;

	// node is the graph record the event resolved to
	virtual void OnEpochIssue(const Event& event, const EpochNode& node) = 0;
};

} // namespace ForkOracle
