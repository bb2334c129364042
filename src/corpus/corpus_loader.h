#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "epoch_types.h"

namespace ForkOracle {

/**
 * Reads a corpus file and checks that its root is an array of scenario objects.
 * Scenarios are not parsed here, so one malformed scenario cannot hide the rest.
 *
 * @throws CorpusError if the file cannot be read, is not JSON, or the root is not an array
 */
nlohmann::json LoadCorpusDocument(const std::string& path);

/**
 * Parses one scenario object.
 *
 * Rejects a missing scenario_id, missing or ill-typed node fields, duplicate node_id
 * values and unrecognized event types. Edges are parsed but not cross-checked.
 *
 * @throws CorpusError on any structural problem
 */
Scenario ParseScenario(const nlohmann::json& data);

// scenario_id of a raw scenario object, empty if absent or not a string.
std::string PeekScenarioId(const nlohmann::json& data);

// tags of a raw scenario object, skipping anything that is not a string.
std::vector<std::string> PeekScenarioTags(const nlohmann::json& data);

// Loads and parses every scenario. The first structural error aborts the load.
std::vector<Scenario> LoadCorpus(const std::string& path);

} // namespace ForkOracle
