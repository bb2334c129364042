#include "corpus_loader.h"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <unordered_set>

#include <glog/logging.h>

#include "../common/config.h"
#include "fault.h"

namespace ForkOracle {

using nlohmann::json;

namespace {

std::string Where(const std::string& scenario_id, const std::string& field) {
	return "scenario " + (scenario_id.empty() ? std::string("<unnamed>") : scenario_id) + ": " + field;
}

// Identifiers may be written as strings or integers.
std::string AsIdentifier(const json& value, const std::string& ctx) {
	if (value.is_string()) return value.get<std::string>();
	if (value.is_number_integer()) return value.dump();
	throw CorpusError(ctx + " must be a string");
}

// Integral floats such as 1e3 are accepted; fractions and anything outside int64 are not.
int64_t AsInt64(const json& value, const std::string& ctx) {
	if (value.is_number_unsigned()) {
		const uint64_t u = value.get<uint64_t>();
		if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
			throw CorpusError(ctx + " is out of range");
		}
		return static_cast<int64_t>(u);
	}
	if (value.is_number_integer()) return value.get<int64_t>();
	if (value.is_number_float()) {
		const double d = value.get<double>();
		if (!std::isfinite(d) || std::trunc(d) != d) {
			throw CorpusError(ctx + " must be an integer");
		}
		// [-2^63, 2^63) is exactly representable as double bounds.
		if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
			throw CorpusError(ctx + " is out of range");
		}
		return static_cast<int64_t>(d);
	}
	throw CorpusError(ctx + " must be an integer");
}

bool AsBool(const json& value, const std::string& ctx) {
	if (value.is_boolean()) return value.get<bool>();
	throw CorpusError(ctx + " must be a boolean");
}

const json* Member(const json& obj, const char* key) {
	auto it = obj.find(key);
	if (it == obj.end() || it->is_null()) return nullptr;
	return &*it;
}

std::optional<std::string> OptionalString(const json& obj, const char* key, const std::string& ctx) {
	const json* v = Member(obj, key);
	if (!v) return std::nullopt;
	return AsIdentifier(*v, ctx + "." + key);
}

std::optional<int64_t> OptionalInt(const json& obj, const char* key, const std::string& ctx) {
	const json* v = Member(obj, key);
	if (!v) return std::nullopt;
	return AsInt64(*v, ctx + "." + key);
}

std::vector<std::string> StringList(const json& obj, const char* key, const std::string& ctx) {
	std::vector<std::string> out;
	const json* v = Member(obj, key);
	if (!v) return out;
	if (!v->is_array()) throw CorpusError(ctx + "." + key + " must be an array");
	for (const auto& item : *v) {
		out.push_back(AsIdentifier(item, ctx + "." + key + "[]"));
	}
	return out;
}

const json& ObjectOrEmpty(const json& obj, const char* key, const std::string& ctx) {
	static const json kEmpty = json::object();
	const json* v = Member(obj, key);
	if (!v) return kEmpty;
	if (!v->is_object()) throw CorpusError(ctx + "." + key + " must be an object");
	return *v;
}

EpochNode ParseNode(const json& data, const std::string& ctx) {
	if (!data.is_object()) throw CorpusError(ctx + " must be an object");
	EpochNode node;

	const json* id = Member(data, "node_id");
	if (!id) throw CorpusError(ctx + ".node_id is required");
	node.node_id = AsIdentifier(*id, ctx + ".node_id");

	const std::string node_ctx = ctx + "(" + node.node_id + ")";
	const json* epoch = Member(data, "epoch_id");
	if (!epoch) throw CorpusError(node_ctx + ".epoch_id is required");
	node.epoch_id = AsInt64(*epoch, node_ctx + ".epoch_id");

	const json* hash = Member(data, "eare_hash");
	if (!hash) throw CorpusError(node_ctx + ".eare_hash is required");
	node.eare_hash = AsIdentifier(*hash, node_ctx + ".eare_hash");

	node.previous_epoch_hash = OptionalString(data, "previous_epoch_hash", node_ctx);
	node.membership_digest = OptionalString(data, "membership_digest", node_ctx);
	node.parent_id = OptionalString(data, "parent_id", node_ctx);
	// An empty parent_id names the root, same as an absent one.
	if (node.parent_id && node.parent_id->empty()) node.parent_id.reset();
	node.issued_by = OptionalString(data, "issued_by", node_ctx).value_or("");
	node.timestamp_ms = OptionalInt(data, "timestamp_ms", node_ctx).value_or(0);
	return node;
}

EpochEdge ParseEdge(const json& data, const std::string& ctx) {
	if (!data.is_object()) throw CorpusError(ctx + " must be an object");
	EpochEdge edge;
	edge.from = OptionalString(data, "from", ctx).value_or("");
	edge.to = OptionalString(data, "to", ctx).value_or("");
	edge.type = OptionalString(data, "type", ctx).value_or("linear");
	return edge;
}

EventType ParseEventType(const std::string& label, const std::string& ctx) {
	if (label == kEventEpochIssue) return EventType::EpochIssue;
	if (label == kEventReplayAttempt) return EventType::ReplayAttempt;
	if (label == kEventMerge) return EventType::Merge;
	throw CorpusError(ctx + " has unrecognized event type '" + label + "'");
}

Event ParseEvent(const json& data, size_t index, const std::string& ctx) {
	if (!data.is_object()) throw CorpusError(ctx + " must be an object");
	Event ev;
	ev.declaration_index = index;

	const json* label = Member(data, "event");
	if (!label || !label->is_string()) throw CorpusError(ctx + ".event must be a string");
	ev.label = label->get<std::string>();
	ev.type = ParseEventType(ev.label, ctx);

	ev.t = OptionalInt(data, "t", ctx).value_or(0);
	ev.node_id = OptionalString(data, "node_id", ctx);
	ev.count = OptionalInt(data, "count", ctx);
	ev.faults = ParseFaultDirectives(StringList(data, "faults", ctx));

	ev.controller = OptionalString(data, "controller", ctx);
	ev.epoch_id = OptionalInt(data, "epoch_id", ctx);
	ev.participants = StringList(data, "participants", ctx);
	ev.reconcile_strategy = OptionalString(data, "reconcile_strategy", ctx);
	return ev;
}

Expectations ParseExpectations(const json& data, const std::string& ctx) {
	Expectations exp;

	if (const json* v = Member(data, "detected")) exp.detected = AsBool(*v, ctx + ".detected");

	const std::string reference = OptionalString(data, "detection_reference", ctx).value_or(kReferenceForkCreated);
	if (reference == kReferenceForkObservable) {
		exp.detection_reference = DetectionReference::ForkObservable;
	} else {
		if (reference != kReferenceForkCreated) {
			LOG(WARNING) << ctx << ": unknown detection_reference '" << reference
				<< "', measuring from fork creation";
		}
		exp.detection_reference = DetectionReference::ForkCreated;
	}

	exp.max_detection_ms = OptionalInt(data, "max_detection_ms", ctx).value_or(0);
	exp.max_reconciliation_ms = OptionalInt(data, "max_reconciliation_ms", ctx).value_or(0);

	const json& reconciled = ObjectOrEmpty(data, "reconciled_epoch", ctx);
	const std::string rctx = ctx + ".reconciled_epoch";
	exp.reconciled_epoch.epoch_id = OptionalInt(reconciled, "epoch_id", rctx).value_or(0);
	exp.reconciled_epoch.node_id = OptionalString(reconciled, "node_id", rctx).value_or("");
	exp.reconciled_epoch.eare_hash = OptionalString(reconciled, "eare_hash", rctx).value_or("");

	const json& allow = ObjectOrEmpty(data, "allow_replay_gap", ctx);
	const std::string actx = ctx + ".allow_replay_gap";
	exp.allow_replay_gap.max_messages = OptionalInt(allow, "max_messages", actx).value_or(0);
	exp.allow_replay_gap.max_ms = OptionalInt(allow, "max_ms", actx).value_or(0);

	exp.expected_error_categories = StringList(data, "expected_error_categories", ctx);

	if (const json* v = Member(data, "healing_required")) exp.healing_required = AsBool(*v, ctx + ".healing_required");
	return exp;
}

} // namespace

nlohmann::json LoadCorpusDocument(const std::string& path) {
	std::ifstream in(path);
	if (!in.is_open()) {
		throw CorpusError("cannot open corpus file " + path);
	}

	json data;
	try {
		in >> data;
	} catch (const json::parse_error& e) {
		throw CorpusError("corpus file " + path + " is not valid JSON: " + e.what());
	}

	if (!data.is_array()) {
		throw CorpusError("corpus root must be a list of scenarios");
	}
	VLOG(1) << "Loaded corpus " << path << " with " << data.size() << " scenarios";
	return data;
}

std::string PeekScenarioId(const nlohmann::json& data) {
	if (!data.is_object()) return "";
	auto it = data.find("scenario_id");
	if (it == data.end() || !it->is_string()) return "";
	return it->get<std::string>();
}

std::vector<std::string> PeekScenarioTags(const nlohmann::json& data) {
	std::vector<std::string> tags;
	if (!data.is_object()) return tags;
	auto it = data.find("tags");
	if (it == data.end() || !it->is_array()) return tags;
	for (const auto& t : *it) {
		if (t.is_string()) tags.push_back(t.get<std::string>());
	}
	return tags;
}

Scenario ParseScenario(const nlohmann::json& data) {
	if (!data.is_object()) {
		throw CorpusError("scenario entry must be an object");
	}

	Scenario scenario;
	const json* id = Member(data, "scenario_id");
	if (!id) throw CorpusError("scenario_id is required");
	scenario.scenario_id = AsIdentifier(*id, "scenario_id");
	if (scenario.scenario_id.empty()) throw CorpusError("scenario_id is required");

	const std::string& sid = scenario.scenario_id;
	scenario.tags = StringList(data, "tags", Where(sid, "tags"));
	scenario.group_context = ObjectOrEmpty(data, "group_context", Where(sid, "scenario"));

	const json& graph = ObjectOrEmpty(data, "graph", Where(sid, "scenario"));

	if (const json* nodes = Member(graph, "nodes")) {
		if (!nodes->is_array()) throw CorpusError(Where(sid, "graph.nodes must be an array"));
		std::unordered_set<std::string> seen;
		for (size_t i = 0; i < nodes->size(); ++i) {
			EpochNode node = ParseNode((*nodes)[i], Where(sid, "graph.nodes[" + std::to_string(i) + "]"));
			if (!seen.insert(node.node_id).second) {
				throw CorpusError("Duplicate node_id " + node.node_id + " in scenario " + sid);
			}
			scenario.nodes.push_back(std::move(node));
		}
	}

	if (const json* edges = Member(graph, "edges")) {
		if (!edges->is_array()) throw CorpusError(Where(sid, "graph.edges must be an array"));
		for (size_t i = 0; i < edges->size(); ++i) {
			scenario.edges.push_back(ParseEdge((*edges)[i], Where(sid, "graph.edges[" + std::to_string(i) + "]")));
		}
	}

	if (const json* stream = Member(data, "event_stream")) {
		if (!stream->is_array()) throw CorpusError(Where(sid, "event_stream must be an array"));
		for (size_t i = 0; i < stream->size(); ++i) {
			scenario.events.push_back(ParseEvent((*stream)[i], i, Where(sid, "event_stream[" + std::to_string(i) + "]")));
		}
	}

	scenario.expectations = ParseExpectations(ObjectOrEmpty(data, "expectations", Where(sid, "scenario")),
			Where(sid, "expectations"));
	return scenario;
}

std::vector<Scenario> LoadCorpus(const std::string& path) {
	json document = LoadCorpusDocument(path);
	std::vector<Scenario> scenarios;
	scenarios.reserve(document.size());
	for (const auto& entry : document) {
		scenarios.push_back(ParseScenario(entry));
	}
	return scenarios;
}

} // namespace ForkOracle
