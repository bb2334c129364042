#include <gtest/gtest.h>
#include "../../src/common/config.h"
#include "../../src/corpus/corpus_loader.h"
#include "../../src/runner/scenario_runner.h"
#include <string>

using namespace ForkOracle;
using nlohmann::json;

class ScenarioRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        corpus_ = LoadCorpusDocument(Fixture("epoch_forks.json"));
        malformed_ = LoadCorpusDocument(Fixture("malformed_scenarios.json"));
    }

    static std::string Fixture(const std::string& name) {
        return std::string(FORK_ORACLE_FIXTURE_DIR) + "/" + name;
    }

    static RunOptions Options() {
        RunOptions options;
        options.language = "cpp";
        return options;
    }

    json corpus_;
    json malformed_;
};

TEST_F(ScenarioRunnerTest, FixtureCorpusPasses) {
    ScenarioRunner runner(Options());
    RunReport report = runner.Run(corpus_);

    EXPECT_EQ(report.matched, 5u);
    EXPECT_EQ(report.skipped_stress, 1u);
    EXPECT_EQ(report.passed, 5u);
    EXPECT_TRUE(report.ok());
    for (const auto& env : report.envelopes) {
        EXPECT_EQ(env.status, kStatusPass) << env.scenario_id << " " << SerializeEnvelope(env);
    }
}

TEST_F(ScenarioRunnerTest, EnvelopesFollowCorpusOrder) {
    ScenarioRunner runner(Options());
    RunReport report = runner.Run(corpus_);

    ASSERT_EQ(report.envelopes.size(), 5u);
    EXPECT_EQ(report.envelopes[0].scenario_id, "linear_chain_no_fork");
    EXPECT_EQ(report.envelopes[1].scenario_id, "same_epoch_collision");
    EXPECT_EQ(report.envelopes[4].scenario_id, "sibling_divergence_chain_break");
}

TEST_F(ScenarioRunnerTest, SameEpochCollisionEnvelope) {
    RunOptions options = Options();
    options.scenario_filter = "same_epoch_collision";
    RunReport report = ScenarioRunner(options).Run(corpus_);

    ASSERT_EQ(report.envelopes.size(), 1u);
    const ResultEnvelope& env = report.envelopes[0];
    EXPECT_TRUE(env.detection);
    EXPECT_EQ(env.detection_ms.value(), 150);
    EXPECT_EQ(env.reconciliation_ms.value(), 245);
    EXPECT_EQ(env.winning_hash.value(), "h1");
    EXPECT_EQ(env.messages_dropped, 4);
}

TEST_F(ScenarioRunnerTest, StressScenariosNeedOptInOrExplicitFilter) {
    RunOptions options = Options();
    options.include_stress = true;
    RunReport all = ScenarioRunner(options).Run(corpus_);
    EXPECT_EQ(all.matched, 6u);
    EXPECT_EQ(all.skipped_stress, 0u);

    RunOptions named = Options();
    named.scenario_filter = "replay_storm_long_chain";
    RunReport one = ScenarioRunner(named).Run(corpus_);
    ASSERT_EQ(one.matched, 1u);
    EXPECT_EQ(one.envelopes[0].messages_dropped, 500);
    EXPECT_TRUE(one.ok());
}

TEST_F(ScenarioRunnerTest, UnknownFilterMatchesNothing) {
    RunOptions options = Options();
    options.scenario_filter = "no_such_scenario";
    RunReport report = ScenarioRunner(options).Run(corpus_);
    EXPECT_EQ(report.matched, 0u);
    EXPECT_FALSE(report.ok());
}

TEST_F(ScenarioRunnerTest, StructuralFaultsAreIsolated) {
    RunReport report = ScenarioRunner(Options()).Run(malformed_);

    ASSERT_EQ(report.envelopes.size(), 4u);
    EXPECT_EQ(report.structural_faults, 3u);
    EXPECT_EQ(report.passed, 1u);
    EXPECT_FALSE(report.ok());

    EXPECT_EQ(report.envelopes[0].scenario_id, "unknown_node_reference");
    EXPECT_EQ(report.envelopes[0].status, kStatusError);
    ASSERT_EQ(report.envelopes[0].notes.size(), 1u);
    EXPECT_NE(report.envelopes[0].notes[0].find("ghost"), std::string::npos);
    EXPECT_EQ(report.envelopes[0].tags, std::vector<std::string>{"malformed"});

    EXPECT_EQ(report.envelopes[1].status, kStatusError);
    EXPECT_EQ(report.envelopes[2].scenario_id, "healthy_after_faults");
    EXPECT_EQ(report.envelopes[2].status, kStatusPass);
    EXPECT_EQ(report.envelopes[3].status, kStatusError);
}

TEST_F(ScenarioRunnerTest, FailingExpectationMakesRunFail) {
    json corpus = corpus_;
    corpus[0]["expectations"]["detected"] = true;
    RunOptions options = Options();
    options.scenario_filter = "linear_chain_no_fork";

    RunReport report = ScenarioRunner(options).Run(corpus);
    ASSERT_EQ(report.envelopes.size(), 1u);
    EXPECT_EQ(report.envelopes[0].status, kStatusFail);
    EXPECT_EQ(report.failed, 1u);
    EXPECT_FALSE(report.ok());
}

TEST_F(ScenarioRunnerTest, ParallelMatchesSerial) {
    RunOptions serial = Options();
    serial.include_stress = true;
    RunOptions parallel = serial;
    parallel.worker_threads = 4;

    json combined = corpus_;
    for (const auto& entry : malformed_) {
        combined.push_back(entry);
    }

    RunReport a = ScenarioRunner(serial).Run(combined);
    RunReport b = ScenarioRunner(parallel).Run(combined);
    ASSERT_EQ(a.envelopes.size(), b.envelopes.size());
    for (size_t i = 0; i < a.envelopes.size(); ++i) {
        EXPECT_EQ(SerializeEnvelope(a.envelopes[i]), SerializeEnvelope(b.envelopes[i]));
    }
    EXPECT_EQ(a.passed, b.passed);
    EXPECT_EQ(a.structural_faults, b.structural_faults);
}

TEST_F(ScenarioRunnerTest, WallTimeOnlyWhenRequested) {
    RunOptions options = Options();
    options.scenario_filter = "linear_chain_no_fork";
    EXPECT_FALSE(ScenarioRunner(options).Run(corpus_).envelopes[0].wall_time_ms.has_value());

    options.emit_wall_time = true;
    RunReport report = ScenarioRunner(options).Run(corpus_);
    ASSERT_TRUE(report.envelopes[0].wall_time_ms.has_value());
    EXPECT_GE(*report.envelopes[0].wall_time_ms, 0);
}

TEST_F(ScenarioRunnerTest, IllTypedValueBecomesStructuralFault) {
    json corpus = json::array();
    corpus.push_back(json::parse(R"({
        "scenario_id": "bad_count",
        "graph": {"nodes": []},
        "event_stream": [{"t": 0, "event": "replay_attempt", "count": "many"}]
    })"));
    RunReport report = ScenarioRunner(Options()).Run(corpus);
    ASSERT_EQ(report.envelopes.size(), 1u);
    EXPECT_EQ(report.envelopes[0].status, kStatusError);
}

TEST_F(ScenarioRunnerTest, EmptyParentIdSharesRootBucket) {
    json corpus = json::array();
    corpus.push_back(json::parse(R"({
        "scenario_id": "empty_parent_roots",
        "graph": {"nodes": [
            {"node_id": "a", "epoch_id": 1, "eare_hash": "h1", "timestamp_ms": 0},
            {"node_id": "b", "epoch_id": 2, "eare_hash": "h2", "parent_id": "", "timestamp_ms": 4}
        ]},
        "event_stream": [
            {"t": 0, "event": "epoch_issue", "node_id": "a"},
            {"t": 4, "event": "epoch_issue", "node_id": "b"}
        ],
        "expectations": {"detected": true}
    })"));
    RunReport report = ScenarioRunner(Options()).Run(corpus);
    ASSERT_EQ(report.envelopes.size(), 1u);
    EXPECT_EQ(report.envelopes[0].status, kStatusPass);
    EXPECT_TRUE(report.envelopes[0].detection);
}
