#pragma once

#include <cstdint>

namespace ForkOracle {

/// Corpus location used when neither the config file nor the command line names one.
inline constexpr char kDefaultCorpusPath[] = "tests/common/adversarial/epoch_forks.json";
/// Label written into every envelope's "language" field.
inline constexpr char kDefaultLanguage[] = "cpp";

/// Event type labels accepted in an event_stream
inline constexpr char kEventEpochIssue[] = "epoch_issue";
inline constexpr char kEventReplayAttempt[] = "replay_attempt";
inline constexpr char kEventMerge[] = "merge";

/// Fault directive vocabulary
inline constexpr char kFaultDropNextEare[] = "drop_next_eare";
inline constexpr char kFaultDelayValidationPrefix[] = "delay_validation:";

/// Protocol-detection error categories
inline constexpr char kErrorEpochForkDetected[] = "EPOCH_FORK_DETECTED";
inline constexpr char kErrorHashChainBreak[] = "HASH_CHAIN_BREAK";

/// Detection latency references
inline constexpr char kReferenceForkCreated[] = "fork_created";
inline constexpr char kReferenceForkObservable[] = "fork_observable";

/// Scenario tag that keeps a scenario out of default runs
inline constexpr char kStressTag[] = "stress";

/// Envelope status values
inline constexpr char kStatusPass[] = "pass";
inline constexpr char kStatusFail[] = "fail";
inline constexpr char kStatusError[] = "error";

/// Environment variable carrying an externally assigned run identifier
inline constexpr char kRunIdEnv[] = "FORK_ORACLE_RUN_ID";

}  // namespace ForkOracle
