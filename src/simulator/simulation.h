#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../corpus/epoch_types.h"
#include "chain_integrity.h"
#include "epoch_graph.h"
#include "error_registry.h"
#include "event_scheduler.h"
#include "fork_detector.h"
#include "interfaces.h"
#include "reconciliation.h"

namespace ForkOracle {

struct SimulationResult {
	bool detection = false;
	std::optional<int64_t> detection_ms;
	std::optional<int64_t> reconciliation_ms;
	std::optional<CanonicalEpoch> winner;
	int64_t messages_dropped = 0;
	std::vector<std::string> errors;

	// Raw timeline points behind the latencies
	std::optional<int64_t> detection_time;
	std::optional<int64_t> fork_created_time;
	size_t records_delivered = 0;
	size_t records_dropped = 0;
};

/**
 * One run of the epoch-fork state machine over a single scenario.
 *
 * Owns every index it builds; nothing survives into another run. Not reusable: Run()
 * may be called once.
 */
class EpochForkSimulation {
public:
	// Throws CorpusError on a duplicate node_id.
	explicit EpochForkSimulation(const Scenario& scenario);

	EpochForkSimulation(const EpochForkSimulation&) = delete;
	EpochForkSimulation& operator=(const EpochForkSimulation&) = delete;

	// Throws CorpusError if an epoch_issue names no node or an unknown node, or if a
	// timeline value overflows.
	SimulationResult Run();

private:
	void DeliverEpochIssue(const Event& event);

	const Scenario& scenario_;
	EpochGraph graph_;
	ErrorRegistry errors_;
	ForkDetector fork_detector_;
	ChainIntegrityChecker chain_checker_;
	std::vector<IEpochIssueObserver*> observers_;

	size_t records_delivered_ = 0;
	size_t records_dropped_ = 0;
	bool ran_ = false;
};

// Pure: identical scenarios give identical results.
SimulationResult Simulate(const Scenario& scenario);

} // namespace ForkOracle
