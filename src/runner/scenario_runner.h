#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../evaluation/result_envelope.h"

namespace ForkOracle {

struct RunOptions {
	std::string scenario_filter;    // empty: every scenario
	bool include_stress = false;
	std::string language;
	bool emit_wall_time = false;
	int worker_threads = 1;
};

struct RunReport {
	std::vector<ResultEnvelope> envelopes;  // corpus order
	size_t matched = 0;
	size_t passed = 0;
	size_t failed = 0;
	size_t structural_faults = 0;
	size_t skipped_stress = 0;

	// True iff something matched and every envelope passed.
	bool ok() const { return matched > 0 && failed == 0 && structural_faults == 0; }
};

/**
 * Runs every selected scenario of a corpus document through parse, simulate and
 * evaluate. A structural fault in one scenario becomes that scenario's envelope and
 * never stops the others.
 */
class ScenarioRunner {
public:
	explicit ScenarioRunner(RunOptions options);

	// corpus must be the array returned by LoadCorpusDocument
	RunReport Run(const nlohmann::json& corpus) const;

	// Parse, simulate and evaluate one raw scenario object.
	ResultEnvelope RunScenario(const nlohmann::json& raw) const;

	bool Selects(const nlohmann::json& raw) const;

	const RunOptions& options() const { return options_; }

private:
	RunOptions options_;
};

} // namespace ForkOracle
