#include "result_envelope.h"

#include "../common/config.h"

namespace ForkOracle {

bool ResultEnvelope::is_structural_fault() const {
	return status == kStatusError;
}

ResultEnvelope BuildEnvelope(const Scenario& scenario,
		const SimulationResult& result,
		const Verdict& verdict,
		const std::string& language) {
	ResultEnvelope env;
	env.scenario_id = scenario.scenario_id;
	env.language = language;
	env.status = verdict.status;
	env.detection = result.detection;
	env.detection_ms = result.detection_ms;
	env.reconciliation_ms = result.reconciliation_ms;
	if (result.winner) {
		env.winning_epoch_id = result.winner->epoch_id;
		env.winning_hash = result.winner->eare_hash;
		env.winning_node_id = result.winner->node_id;
	}
	env.messages_dropped = result.messages_dropped;
	env.errors = result.errors;
	env.failures = verdict.failures;
	env.tags = scenario.tags;
	return env;
}

ResultEnvelope BuildStructuralFaultEnvelope(const std::string& scenario_id,
		const std::vector<std::string>& tags,
		const std::string& language,
		const std::string& message) {
	ResultEnvelope env;
	env.scenario_id = scenario_id;
	env.language = language;
	env.status = kStatusError;
	env.notes.push_back(message);
	env.tags = tags;
	return env;
}

void to_json(nlohmann::json& j, const ResultEnvelope& env) {
	j = nlohmann::json{
		{"scenario_id", env.scenario_id},
		{"language", env.language},
		{"status", env.status},
		{"detection", env.detection},
		{"detection_ms", OptionalToJson(env.detection_ms)},
		{"reconciliation_ms", OptionalToJson(env.reconciliation_ms)},
		{"winning_epoch_id", OptionalToJson(env.winning_epoch_id)},
		{"winning_hash", OptionalToJson(env.winning_hash)},
		{"winning_node_id", OptionalToJson(env.winning_node_id)},
		{"messages_dropped", env.messages_dropped},
		{"healing_actions", env.healing_actions},
		{"errors", env.errors},
		{"false_positives", {
			{"warnings", env.false_positives.warnings},
			{"hard_errors", env.false_positives.hard_errors},
		}},
		{"notes", env.notes},
		{"failures", env.failures},
		{"tags", env.tags},
	};
	if (env.wall_time_ms) {
		j["wall_time_ms"] = *env.wall_time_ms;
	}
}

std::string SerializeEnvelope(const ResultEnvelope& envelope) {
	nlohmann::json j = envelope;
	return j.dump();
}

} // namespace ForkOracle
