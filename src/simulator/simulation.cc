#include "simulation.h"

#include <stdexcept>

#include <glog/logging.h>

#include "../corpus/fault.h"
#include "metrics.h"

namespace ForkOracle {

EpochForkSimulation::EpochForkSimulation(const Scenario& scenario)
	: scenario_(scenario),
	  graph_(scenario.nodes),
	  fork_detector_(errors_),
	  chain_checker_(graph_, errors_) {
	// Fork detection runs before the chain check for each record, so a record that is
	// both a fork and a chain break registers EPOCH_FORK_DETECTED first.
	observers_.push_back(&fork_detector_);
	observers_.push_back(&chain_checker_);
}

void EpochForkSimulation::DeliverEpochIssue(const Event& event) {
	if (DropsRecord(event.faults)) {
		++records_dropped_;
		VLOG(2) << scenario_.scenario_id << ": record at t=" << event.t
			<< " dropped before delivery";
		return;
	}

	if (!event.node_id) {
		throw CorpusError("epoch_issue at t=" + std::to_string(event.t) + " has no node_id in scenario "
				+ scenario_.scenario_id);
	}
	const EpochNode* node = graph_.Find(*event.node_id);
	if (!node) {
		throw CorpusError("Unknown node_id " + *event.node_id + " in scenario " + scenario_.scenario_id);
	}

	++records_delivered_;
	for (IEpochIssueObserver* observer : observers_) {
		observer->OnEpochIssue(event, *node);
	}
}

SimulationResult EpochForkSimulation::Run() {
	if (ran_) {
		throw std::logic_error("EpochForkSimulation::Run called twice");
	}
	ran_ = true;

	const Schedule schedule = ScheduleEvents(scenario_.events);
	for (const Event* ev : schedule) {
		if (ev->type == EventType::EpochIssue) {
			DeliverEpochIssue(*ev);
		}
	}

	SimulationResult result;
	result.detection = fork_detector_.detection();
	result.detection_time = fork_detector_.detection_time();
	result.fork_created_time = fork_detector_.fork_created_time();
	result.detection_ms = DetectionLatencyMs(scenario_.expectations.detection_reference,
			result.detection_time, result.fork_created_time);
	result.reconciliation_ms = ReconciliationLatencyMs(schedule, result.detection_time);
	result.messages_dropped = CountDroppedMessages(schedule);
	result.winner = ResolveCanonicalEpoch(graph_, fork_detector_.observed_records());
	result.errors = errors_.categories();
	result.records_delivered = records_delivered_;
	result.records_dropped = records_dropped_;

	VLOG(1) << scenario_.scenario_id << ": delivered=" << records_delivered_
		<< " dropped=" << records_dropped_ << " detection=" << result.detection
		<< " errors=" << result.errors.size();
	return result;
}

SimulationResult Simulate(const Scenario& scenario) {
	EpochForkSimulation simulation(scenario);
	return simulation.Run();
}

} // namespace ForkOracle
