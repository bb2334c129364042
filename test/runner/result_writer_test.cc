#include <gtest/gtest.h>
#include "../../src/common/config.h"
#include "../../src/runner/result_writer.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace ForkOracle;
using nlohmann::json;
namespace fs = std::filesystem;

class ResultWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::path(::testing::TempDir()) / "fork_oracle_writer_test";
        fs::remove_all(dir_);
        unsetenv(kRunIdEnv);
    }

    void TearDown() override {
        fs::remove_all(dir_);
        unsetenv(kRunIdEnv);
    }

    static ResultEnvelope Passing(const std::string& id) {
        ResultEnvelope env;
        env.scenario_id = id;
        env.language = "cpp";
        env.status = kStatusPass;
        env.winning_epoch_id = 2;
        env.winning_hash = "h2";
        return env;
    }

    static std::vector<std::string> ReadLines(const fs::path& path) {
        std::vector<std::string> lines;
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    fs::path dir_;
};

TEST_F(ResultWriterTest, AppendsJsonLinesAndCreatesDirectories) {
    const fs::path envelopes = dir_ / "nested" / "envelopes.jsonl";
    {
        ResultWriter writer(envelopes.string(), "", "cpp");
        EXPECT_TRUE(writer.Record(Passing("one")));
        EXPECT_TRUE(writer.Record(Passing("two")));
    }
    {
        ResultWriter writer(envelopes.string(), "", "cpp");
        EXPECT_TRUE(writer.Record(Passing("three")));
    }

    auto lines = ReadLines(envelopes);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(json::parse(lines[0])["scenario_id"], "one");
    EXPECT_EQ(json::parse(lines[2])["scenario_id"], "three");
}

TEST_F(ResultWriterTest, SummaryListsRecordedScenarios) {
    const fs::path summary = dir_ / "summary.json";
    setenv(kRunIdEnv, "run-42", 1);

    ResultWriter writer("", summary.string(), "cpp");
    ResultEnvelope fault = BuildStructuralFaultEnvelope("broken", {}, "cpp", "duplicate node_id a");
    writer.Record(Passing("ok"));
    writer.Record(fault);
    ASSERT_TRUE(writer.Finish());

    std::ifstream in(summary);
    json doc = json::parse(in);
    EXPECT_EQ(doc["language"], "cpp");
    EXPECT_EQ(doc["run_id"], "run-42");
    ASSERT_EQ(doc["scenarios"].size(), 2u);
    EXPECT_EQ(doc["scenarios"][0]["winning_hash"], "h2");
    EXPECT_TRUE(doc["scenarios"][0]["wall_time_ms"].is_null());
    EXPECT_EQ(doc["scenarios"][1]["status"], kStatusError);
    EXPECT_EQ(doc["scenarios"][1]["notes"], json::array({"duplicate node_id a"}));
}

TEST_F(ResultWriterTest, RunIdIsNullWithoutEnvironment) {
    ResultWriter writer("", "", "cpp");
    EXPECT_TRUE(writer.BuildSummary()["run_id"].is_null());
    EXPECT_TRUE(writer.BuildSummary()["scenarios"].empty());
    EXPECT_TRUE(writer.Finish());
}
