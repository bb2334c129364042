#include <gtest/gtest.h>
#include "../../src/simulator/event_scheduler.h"
#include "../common/scenario_builder.h"

using namespace ForkOracle;
using test_support::ScenarioBuilder;

TEST(EventSchedulerTest, OrdersByTime) {
    Scenario s = ScenarioBuilder()
        .Node("a", 1, "h1")
        .Merge(30)
        .Issue(10, "a")
        .Replay(20, 1)
        .Build();

    Schedule schedule = ScheduleEvents(s.events);
    ASSERT_EQ(schedule.size(), 3u);
    EXPECT_EQ(schedule[0]->t, 10);
    EXPECT_EQ(schedule[1]->t, 20);
    EXPECT_EQ(schedule[2]->t, 30);
}

TEST(EventSchedulerTest, EqualTimesBreakByLabelThenDeclaration) {
    Scenario s = ScenarioBuilder()
        .Node("a", 1, "h1")
        .Node("b", 1, "h2")
        .Replay(5, 1)
        .Merge(5)
        .Issue(5, "b")
        .Issue(5, "a")
        .Build();

    Schedule schedule = ScheduleEvents(s.events);
    ASSERT_EQ(schedule.size(), 4u);
    // "epoch_issue" < "merge" < "replay_attempt"
    EXPECT_EQ(schedule[0]->node_id.value(), "b");
    EXPECT_EQ(schedule[1]->node_id.value(), "a");
    EXPECT_EQ(schedule[2]->type, EventType::Merge);
    EXPECT_EQ(schedule[3]->type, EventType::ReplayAttempt);
}

TEST(EventSchedulerTest, ScheduledBeforeIsStrict) {
    Event a;
    a.t = 1;
    a.label = "merge";
    a.declaration_index = 0;
    Event b = a;
    EXPECT_FALSE(ScheduledBefore(a, b));
    EXPECT_FALSE(ScheduledBefore(b, a));

    b.declaration_index = 1;
    EXPECT_TRUE(ScheduledBefore(a, b));
    EXPECT_FALSE(ScheduledBefore(b, a));
}

TEST(EventSchedulerTest, EmptyStream) {
    std::vector<Event> events;
    EXPECT_TRUE(ScheduleEvents(events).empty());
}
