#include "scenario_runner.h"

#include <algorithm>
#include <chrono>
#include <future>
#include <utility>

#include <glog/logging.h>

#include "../common/config.h"
#include "../corpus/corpus_loader.h"
#include "../evaluation/expectation_evaluator.h"
#include "../simulator/simulation.h"

namespace ForkOracle {

ScenarioRunner::ScenarioRunner(RunOptions options) : options_(std::move(options)) {
	if (options_.language.empty()) {
		options_.language = kDefaultLanguage;
	}
	if (options_.worker_threads < 1) {
		options_.worker_threads = 1;
	}
}

bool ScenarioRunner::Selects(const nlohmann::json& raw) const {
	const std::string id = PeekScenarioId(raw);
	if (!options_.scenario_filter.empty()) {
		// An explicitly named scenario runs even when tagged stress.
		return id == options_.scenario_filter;
	}
	if (!options_.include_stress) {
		const auto tags = PeekScenarioTags(raw);
		if (std::find(tags.begin(), tags.end(), kStressTag) != tags.end()) {
			return false;
		}
	}
	return true;
}

ResultEnvelope ScenarioRunner::RunScenario(const nlohmann::json& raw) const {
	const std::string peeked_id = PeekScenarioId(raw);
	const auto start = std::chrono::steady_clock::now();

	ResultEnvelope envelope;
	try {
		const Scenario scenario = ParseScenario(raw);
		const SimulationResult result = Simulate(scenario);
		const Verdict verdict = EvaluateExpectations(scenario.expectations, result);
		envelope = BuildEnvelope(scenario, result, verdict, options_.language);
		if (!verdict.passed()) {
			VLOG(1) << scenario.scenario_id << " failed expectations (" << verdict.failures.size() << ")";
		}
	} catch (const CorpusError& e) {
		LOG(ERROR) << "Structural fault in scenario " << (peeked_id.empty() ? "<unnamed>" : peeked_id)
			<< ": " << e.what();
		envelope = BuildStructuralFaultEnvelope(peeked_id, PeekScenarioTags(raw), options_.language, e.what());
	} catch (const nlohmann::json::exception& e) {
		LOG(ERROR) << "Malformed JSON value in scenario " << (peeked_id.empty() ? "<unnamed>" : peeked_id)
			<< ": " << e.what();
		envelope = BuildStructuralFaultEnvelope(peeked_id, PeekScenarioTags(raw), options_.language, e.what());
	}

	if (options_.emit_wall_time) {
		const auto elapsed = std::chrono::steady_clock::now() - start;
		envelope.wall_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
	}
	return envelope;
}

RunReport ScenarioRunner::Run(const nlohmann::json& corpus) const {
	RunReport report;

	std::vector<const nlohmann::json*> selected;
	for (const auto& raw : corpus) {
		if (Selects(raw)) {
			selected.push_back(&raw);
		} else if (options_.scenario_filter.empty()) {
			++report.skipped_stress;
			VLOG(1) << "Skipping stress scenario " << PeekScenarioId(raw);
		}
	}
	report.matched = selected.size();

	if (options_.worker_threads == 1 || selected.size() <= 1) {
		for (const nlohmann::json* raw : selected) {
			report.envelopes.push_back(RunScenario(*raw));
		}
	} else {
		// Scenarios share no mutable state; run them in waves of worker_threads and
		// collect in corpus order.
		const size_t wave = static_cast<size_t>(options_.worker_threads);
		for (size_t begin = 0; begin < selected.size(); begin += wave) {
			const size_t end = std::min(selected.size(), begin + wave);
			std::vector<std::future<ResultEnvelope>> futures;
			futures.reserve(end - begin);
			for (size_t i = begin; i < end; ++i) {
				const nlohmann::json* raw = selected[i];
				futures.push_back(std::async(std::launch::async, [this, raw]() {
					return RunScenario(*raw);
				}));
			}
			for (auto& f : futures) {
				report.envelopes.push_back(f.get());
			}
		}
	}

	for (const auto& env : report.envelopes) {
		if (env.is_structural_fault()) {
			++report.structural_faults;
		} else if (env.status == kStatusPass) {
			++report.passed;
		} else {
			++report.failed;
		}
	}
	return report;
}

} // namespace ForkOracle
