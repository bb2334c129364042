#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../corpus/epoch_types.h"
#include "../simulator/simulation.h"
#include "expectation_evaluator.h"

namespace ForkOracle {

struct FalsePositiveCounts {
	int64_t warnings = 0;
	int64_t hard_errors = 0;
};

/**
 * Per-scenario output record. Serialized with sorted keys, absent optionals as null.
 */
struct ResultEnvelope {
	std::string scenario_id;
	std::string language;
	std::string status;         // pass, fail, or error for a structural fault
	bool detection = false;
	std::optional<int64_t> detection_ms;
	std::optional<int64_t> reconciliation_ms;
	std::optional<int64_t> winning_epoch_id;
	std::optional<std::string> winning_hash;
	std::optional<std::string> winning_node_id;
	int64_t messages_dropped = 0;
	std::vector<std::string> healing_actions;
	std::vector<std::string> errors;
	FalsePositiveCounts false_positives;
	std::vector<std::string> notes;
	std::vector<std::string> failures;
	std::vector<std::string> tags;
	std::optional<int64_t> wall_time_ms;    // only serialized when set

	bool is_structural_fault() const;
};

ResultEnvelope BuildEnvelope(const Scenario& scenario,
		const SimulationResult& result,
		const Verdict& verdict,
		const std::string& language);

// Envelope for a scenario that could not be parsed or simulated.
ResultEnvelope BuildStructuralFaultEnvelope(const std::string& scenario_id,
		const std::vector<std::string>& tags,
		const std::string& language,
		const std::string& message);

// null for an absent value
template<typename T>
nlohmann::json OptionalToJson(const std::optional<T>& value) {
	if (!value) return nullptr;
	return *value;
}

void to_json(nlohmann::json& j, const ResultEnvelope& envelope);

// Single-line JSON, as written to stdout and JSONL files.
std::string SerializeEnvelope(const ResultEnvelope& envelope);

} // namespace ForkOracle
