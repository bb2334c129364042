#include <gtest/gtest.h>
#include "../../src/common/config.h"
#include "../../src/corpus/fault.h"
#include "../../src/simulator/fork_detector.h"
#include <limits>
#include <memory>

using namespace ForkOracle;

class ForkDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        detector_ = std::make_unique<ForkDetector>(errors_);
    }

    static EpochNode MakeNode(const std::string& id, int64_t epoch, const std::string& hash,
                              std::optional<std::string> parent = std::nullopt) {
        EpochNode node;
        node.node_id = id;
        node.epoch_id = epoch;
        node.eare_hash = hash;
        node.parent_id = std::move(parent);
        return node;
    }

    void Deliver(int64_t t, const EpochNode& node, const std::vector<std::string>& faults = {}) {
        Event ev;
        ev.t = t;
        ev.label = "epoch_issue";
        ev.node_id = node.node_id;
        ev.faults = ParseFaultDirectives(faults);
        detector_->OnEpochIssue(ev, node);
    }

    ErrorRegistry errors_;
    std::unique_ptr<ForkDetector> detector_;
};

TEST_F(ForkDetectorTest, LinearChainIsNotAFork) {
    Deliver(0, MakeNode("a", 1, "h1"));
    Deliver(10, MakeNode("b", 2, "h2", std::string("a")));
    Deliver(20, MakeNode("c", 3, "h3", std::string("b")));

    EXPECT_FALSE(detector_->detection());
    EXPECT_FALSE(detector_->detection_time().has_value());
    EXPECT_FALSE(detector_->fork_created_time().has_value());
    EXPECT_TRUE(errors_.empty());
    EXPECT_EQ(detector_->observed_records().size(), 3u);
}

TEST_F(ForkDetectorTest, SameEpochCollision) {
    Deliver(0, MakeNode("a", 3, "h1"));
    Deliver(5, MakeNode("b", 3, "h2"));

    EXPECT_TRUE(detector_->detection());
    EXPECT_EQ(detector_->fork_created_time().value(), 5);
    EXPECT_EQ(detector_->detection_time().value(), 5);
    EXPECT_TRUE(errors_.Contains(kErrorEpochForkDetected));

    const auto* epoch3 = detector_->ObservedForEpoch(3);
    ASSERT_NE(epoch3, nullptr);
    EXPECT_EQ(epoch3->size(), 2u);
}

TEST_F(ForkDetectorTest, RedeliveryOfSameRecordIsNotAFork) {
    EpochNode a = MakeNode("a", 3, "h1");
    Deliver(0, a);
    Deliver(5, a);
    EXPECT_FALSE(detector_->detection());
}

TEST_F(ForkDetectorTest, SiblingDivergenceAcrossEpochs) {
    Deliver(0, MakeNode("g", 1, "hg"));
    Deliver(10, MakeNode("left", 2, "hl", std::string("g")));
    Deliver(20, MakeNode("right", 3, "hr", std::string("g")));

    EXPECT_TRUE(detector_->detection());
    EXPECT_EQ(detector_->fork_created_time().value(), 20);

    const auto* children = detector_->ChildrenOf(std::string("g"));
    ASSERT_NE(children, nullptr);
    EXPECT_EQ(children->size(), 2u);
}

TEST_F(ForkDetectorTest, RootSiblingsDiverge) {
    Deliver(0, MakeNode("r1", 1, "h1"));
    Deliver(4, MakeNode("r2", 2, "h2"));

    EXPECT_TRUE(detector_->detection());
    const auto* roots = detector_->ChildrenOf(std::nullopt);
    ASSERT_NE(roots, nullptr);
    EXPECT_EQ(roots->size(), 2u);
}

TEST_F(ForkDetectorTest, DelayShiftsOnlyDetectionTime) {
    Deliver(0, MakeNode("a", 3, "h1"));
    Deliver(5, MakeNode("b", 3, "h2"), {"delay_validation:150"});

    EXPECT_EQ(detector_->fork_created_time().value(), 5);
    EXPECT_EQ(detector_->detection_time().value(), 155);
}

TEST_F(ForkDetectorTest, FirstForkWins) {
    Deliver(0, MakeNode("a", 3, "h1"));
    Deliver(5, MakeNode("b", 3, "h2"));
    Deliver(9, MakeNode("c", 3, "h3"), {"delay_validation:1"});

    EXPECT_EQ(detector_->fork_created_time().value(), 5);
    EXPECT_EQ(detector_->detection_time().value(), 5);
    EXPECT_EQ(errors_.categories().size(), 1u);
}

TEST_F(ForkDetectorTest, DetectionTimeOverflowIsStructuralError) {
    const int64_t late = std::numeric_limits<int64_t>::max() - 10;
    Deliver(late, MakeNode("a", 3, "h1"));
    EXPECT_THROW(Deliver(late, MakeNode("b", 3, "h2"), {"delay_validation:150"}), CorpusError);
    EXPECT_FALSE(detector_->detection());
}

TEST_F(ForkDetectorTest, DelayUpToTheLimitIsAccepted) {
    const int64_t late = std::numeric_limits<int64_t>::max() - 150;
    Deliver(late, MakeNode("a", 3, "h1"));
    Deliver(late, MakeNode("b", 3, "h2"), {"delay_validation:150"});
    EXPECT_EQ(detector_->detection_time().value(), std::numeric_limits<int64_t>::max());
}
