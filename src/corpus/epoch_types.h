#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ForkOracle {

/**
 * Structural problem in a corpus or scenario. Fatal to the scenario it was raised
 * for, never a detection outcome.
 */
class CorpusError : public std::runtime_error {
public:
    explicit CorpusError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * One issued epoch-authenticity record. Immutable once loaded.
 */
struct EpochNode {
    std::string node_id;
    int64_t epoch_id = 0;
    std::string eare_hash;
    std::optional<std::string> previous_epoch_hash;
    std::optional<std::string> membership_digest;
    std::optional<std::string> parent_id;
    std::string issued_by;
    int64_t timestamp_ms = 0;
};

// Informational only. Structure is derived from parent_id.
struct EpochEdge {
    std::string from;
    std::string to;
    std::string type{"linear"};
};

enum class FaultKind {
    None,
    DropNextEare,
    DelayValidation,
};

struct FaultDirective {
    FaultKind kind = FaultKind::None;
    int64_t delay_ms = 0;   // DelayValidation only
    std::string raw;
};

enum class EventType {
    EpochIssue,
    ReplayAttempt,
    Merge,
};

struct Event {
    int64_t t = 0;
    EventType type = EventType::EpochIssue;
    std::string label;          // event type as spelled in the corpus
    size_t declaration_index = 0;

    std::optional<std::string> node_id;
    std::optional<int64_t> count;
    std::vector<FaultDirective> faults;

    // Carried for tooling, not consumed by the simulation
    std::optional<std::string> controller;
    std::optional<int64_t> epoch_id;
    std::vector<std::string> participants;
    std::optional<std::string> reconcile_strategy;
};

enum class DetectionReference {
    ForkCreated,
    ForkObservable,
};

struct ReconciledEpochExpectation {
    int64_t epoch_id = 0;       // 0: not asserted
    std::string node_id;
    std::string eare_hash;      // empty: not asserted
};

struct ReplayGapAllowance {
    int64_t max_messages = 0;   // 0: no ceiling
    int64_t max_ms = 0;         // parsed, not enforced
};

struct Expectations {
    bool detected = false;
    DetectionReference detection_reference = DetectionReference::ForkCreated;
    int64_t max_detection_ms = 0;
    int64_t max_reconciliation_ms = 0;
    ReconciledEpochExpectation reconciled_epoch;
    ReplayGapAllowance allow_replay_gap;
    std::vector<std::string> expected_error_categories;
    bool healing_required = false;
};

struct Scenario {
    std::string scenario_id;
    nlohmann::json group_context = nlohmann::json::object();
    std::vector<EpochNode> nodes;   // declaration order
    std::vector<EpochEdge> edges;
    std::vector<Event> events;      // declaration order
    Expectations expectations;
    std::vector<std::string> tags;

    bool HasTag(const std::string& tag) const {
        return std::find(tags.begin(), tags.end(), tag) != tags.end();
    }
};

} // namespace ForkOracle
