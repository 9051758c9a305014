#include "navigation.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

namespace {

class NavigationTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.appendLocal(make_event("git status", 10));
        store.appendLocal(make_event("git push", 20));
        store.appendLocal(make_event("ls", 30));
        state.session_id = "s1";
    }

    EventStore store{"m1"};
    NavigationState state;
};

}

TEST_F(NavigationTest, PreviousThenNextReturnsToPrefix) {
    NavigationStep back1 = step_previous(store, state, "git", 3, 100);
    ASSERT_TRUE(back1.moved);
    EXPECT_EQ(back1.buffer, "git push");
    EXPECT_TRUE(back1.state.armed);
    EXPECT_EQ(back1.state.prefix, "git");

    NavigationStep back2 = step_previous(store, back1.state, back1.buffer, back1.buffer.size(), 101);
    ASSERT_TRUE(back2.moved);
    EXPECT_EQ(back2.buffer, "git status");

    NavigationStep forward1 = step_next(store, back2.state, back2.buffer, back2.buffer.size(), 102);
    ASSERT_TRUE(forward1.moved);
    EXPECT_EQ(forward1.buffer, "git push");

    NavigationStep forward2 = step_next(store, forward1.state, forward1.buffer, forward1.buffer.size(), 103);
    ASSERT_TRUE(forward2.moved);
    EXPECT_EQ(forward2.buffer, "git");
    EXPECT_FALSE(forward2.event);

    NavigationStep forward3 = step_next(store, forward2.state, forward2.buffer, forward2.buffer.size(), 104);
    EXPECT_FALSE(forward3.moved);
    EXPECT_EQ(forward3.buffer, "git");
}

TEST_F(NavigationTest, PreviousPastOldestMatchFailsAndKeepsState) {
    NavigationStep back1 = step_previous(store, state, "git", 3, 100);
    NavigationStep back2 = step_previous(store, back1.state, back1.buffer, back1.buffer.size(), 100);
    NavigationStep back3 = step_previous(store, back2.state, back2.buffer, back2.buffer.size(), 100);

    EXPECT_FALSE(back3.moved);
    EXPECT_EQ(back3.buffer, "git status");
    EXPECT_EQ(back3.state.reference_sequence, back2.state.reference_sequence);
    EXPECT_EQ(back3.state.reference_time, back2.state.reference_time);
}

TEST_F(NavigationTest, NoMatchLeavesStateIdle) {
    NavigationStep step = step_previous(store, state, "zzz", 3, 100);
    EXPECT_FALSE(step.moved);
    EXPECT_EQ(step.buffer, "zzz");
    EXPECT_FALSE(step.state.armed);
}

TEST_F(NavigationTest, PrefixEndsAtTheCursor) {
    NavigationStep step = step_previous(store, state, "git status --short", 3, 100);
    ASSERT_TRUE(step.moved);
    EXPECT_EQ(step.state.prefix, "git");
    EXPECT_EQ(step.buffer, "git push");
}

TEST_F(NavigationTest, EventsAfterArmingAreNotReturned) {
    NavigationStep step = step_previous(store, state, "", 0, 25);
    ASSERT_TRUE(step.moved);
    EXPECT_EQ(step.buffer, "git push");
}

TEST_F(NavigationTest, EventsAtTheArmingInstantAreReachable) {
    store.appendLocal(make_event("echo one", 50));
    store.appendLocal(make_event("echo two", 50));

    NavigationStep first = step_previous(store, state, "echo", 4, 50);
    ASSERT_TRUE(first.moved);
    EXPECT_EQ(first.buffer, "echo two");
    NavigationStep second = step_previous(store, first.state, first.buffer, first.buffer.size(), 50);
    ASSERT_TRUE(second.moved);
    EXPECT_EQ(second.buffer, "echo one");
}

TEST_F(NavigationTest, OtherSessionsOnlyContributeEarlierHistory) {
    store.appendLocal(make_event("git fetch", 40, 0, "other"));
    store.appendLocal(make_event("git commit", 50, 0, "s1"));
    state.session_start = 35;

    NavigationStep step1 = step_previous(store, state, "git", 3, 100);
    EXPECT_EQ(step1.buffer, "git commit");
    NavigationStep step2 = step_previous(store, step1.state, step1.buffer, step1.buffer.size(), 100);
    EXPECT_EQ(step2.buffer, "git push");
}

TEST_F(NavigationTest, WithoutSessionStartOnlyTheSessionIsSearched) {
    store.appendLocal(make_event("git fetch", 40, 0, "other"));
    NavigationStep step = step_previous(store, state, "git f", 5, 100);
    EXPECT_FALSE(step.moved);
}

TEST_F(NavigationTest, ResetStartsANewPrefix) {
    NavigationStep step = step_previous(store, state, "git", 3, 100);
    NavigationState next = step.state;
    reset_navigation(next);
    EXPECT_FALSE(next.armed);
    EXPECT_EQ(next.session_id, "s1");

    NavigationStep fresh = step_previous(store, next, "l", 1, 100);
    ASSERT_TRUE(fresh.moved);
    EXPECT_EQ(fresh.buffer, "ls");
    EXPECT_EQ(fresh.state.prefix, "l");
}

TEST_F(NavigationTest, StateTravelsAsJson) {
    NavigationStep step = step_previous(store, state, "git", 3, 100);
    nlohmann::json wire = step.state;
    NavigationState decoded = wire.get<NavigationState>();

    NavigationStep again = step_previous(store, decoded, step.buffer, step.buffer.size(), 100);
    ASSERT_TRUE(again.moved);
    EXPECT_EQ(again.buffer, "git status");
}
