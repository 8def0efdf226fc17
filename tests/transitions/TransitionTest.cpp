#include "common/StateMachineException.h"
#include "mocks/ManualClock.h"
#include "transitions/Transition.h"
#include "transitions/TransitionAfter.h"
#include "transitions/TransitionOnSignal.h"
#include <gtest/gtest.h>
#include <string>

using namespace HFSM;

TEST(TransitionBaseTest, EndpointsAndFlags) {
    Transition<> transition("A", "B", nullptr, nullptr, nullptr, true);

    ASSERT_TRUE(transition.getFrom().has_value());
    EXPECT_EQ(*transition.getFrom(), "A");
    EXPECT_EQ(transition.getTo(), "B");
    EXPECT_FALSE(transition.isFromAny());
    EXPECT_TRUE(transition.hasTarget());
    EXPECT_TRUE(transition.isForceInstantly());
    EXPECT_EQ(transition.getFsm(), nullptr);
}

TEST(TransitionBaseTest, MakeFromAnyDropsSource) {
    Transition<> transition("A", "B");
    transition.makeFromAny();

    EXPECT_TRUE(transition.isFromAny());
    EXPECT_EQ(transition.describeFrom(), "<any>");
}

TEST(TransitionBaseTest, ExitTransitionHasNoTarget) {
    Transition<> transition("A", std::nullopt);

    EXPECT_FALSE(transition.hasTarget());
    EXPECT_EQ(transition.describeTo(), "<exit>");
    EXPECT_THROW(transition.getTo(), ConfigurationException);
}

TEST(TransitionTest, EmptyConditionPasses) {
    Transition<> transition("A", "B");
    EXPECT_TRUE(transition.shouldTransition());
}

TEST(TransitionTest, ConditionAndCallbacks) {
    bool open = false;
    int before = 0;
    int after = 0;
    Transition<> transition(
        "A", "B", [&open](Transition<> &) { return open; }, [&before](Transition<> &) { ++before; },
        [&after](Transition<> &) { ++after; });

    EXPECT_FALSE(transition.shouldTransition());
    open = true;
    EXPECT_TRUE(transition.shouldTransition());

    transition.beforeTransition();
    transition.afterTransition();
    EXPECT_EQ(before, 1);
    EXPECT_EQ(after, 1);
}

TEST(TransitionTest, IntegerIds) {
    Transition<int> transition(1, 2);
    EXPECT_EQ(transition.getTo(), 2);
    EXPECT_EQ(transition.describeFrom(), "1");
}

class TransitionAfterTest : public ::testing::Test {
protected:
    HFSM::Test::ManualClock clock_;
};

TEST_F(TransitionAfterTest, PassesOnceDelayElapsed) {
    TransitionAfter<> transition("A", "B", 2.0);
    transition.onEnter();

    EXPECT_FALSE(transition.shouldTransition());
    clock_.advance(1.99);
    EXPECT_FALSE(transition.shouldTransition());
    clock_.advance(0.01);
    EXPECT_TRUE(transition.shouldTransition());
    EXPECT_DOUBLE_EQ(transition.getDelay(), 2.0);
}

TEST_F(TransitionAfterTest, DelayRestartsOnEnter) {
    TransitionAfter<> transition("A", "B", 1.0);
    transition.onEnter();
    clock_.advance(5.0);
    EXPECT_TRUE(transition.shouldTransition());

    transition.onEnter();
    EXPECT_FALSE(transition.shouldTransition());
    EXPECT_DOUBLE_EQ(transition.getTimer().getElapsed(), 0.0);
}

TEST_F(TransitionAfterTest, ConditionCheckedAfterDelay) {
    bool ready = false;
    int evaluated = 0;
    TransitionAfter<> transition("A", "B", 1.0, [&](TransitionAfter<> &) {
        ++evaluated;
        return ready;
    });
    transition.onEnter();

    EXPECT_FALSE(transition.shouldTransition());
    EXPECT_EQ(evaluated, 0);

    clock_.advance(1.0);
    EXPECT_FALSE(transition.shouldTransition());
    ready = true;
    EXPECT_TRUE(transition.shouldTransition());
    EXPECT_EQ(evaluated, 2);
}

class TransitionOnSignalTest : public ::testing::Test {
protected:
    bool high_ = false;
    TransitionOnSignal::Signal signal_ = [this] { return high_; };
};

TEST_F(TransitionOnSignalTest, DownFollowsLevel) {
    TransitionOnSignal::Down<> transition("A", "B", signal_);

    EXPECT_FALSE(transition.shouldTransition());
    high_ = true;
    EXPECT_TRUE(transition.shouldTransition());
    EXPECT_TRUE(transition.shouldTransition());
}

TEST_F(TransitionOnSignalTest, UpFollowsInvertedLevel) {
    TransitionOnSignal::Up<> transition("A", "B", signal_);

    EXPECT_TRUE(transition.shouldTransition());
    high_ = true;
    EXPECT_FALSE(transition.shouldTransition());
}

TEST_F(TransitionOnSignalTest, PressFiresOnRisingEdgeOnly) {
    TransitionOnSignal::Press<> transition("A", "B", signal_);
    transition.onEnter();

    EXPECT_FALSE(transition.shouldTransition());
    high_ = true;
    EXPECT_TRUE(transition.shouldTransition());
    EXPECT_FALSE(transition.shouldTransition());
    high_ = false;
    EXPECT_FALSE(transition.shouldTransition());
}

TEST_F(TransitionOnSignalTest, PressIgnoresSignalHeldWhenEntering) {
    high_ = true;
    TransitionOnSignal::Press<> transition("A", "B", signal_);
    transition.onEnter();

    EXPECT_FALSE(transition.shouldTransition());
    EXPECT_FALSE(transition.shouldTransition());
}

TEST_F(TransitionOnSignalTest, ReleaseFiresOnFallingEdgeOnly) {
    high_ = true;
    TransitionOnSignal::Release<> transition("A", "B", signal_);
    transition.onEnter();

    EXPECT_FALSE(transition.shouldTransition());
    high_ = false;
    EXPECT_TRUE(transition.shouldTransition());
    EXPECT_FALSE(transition.shouldTransition());
}

TEST_F(TransitionOnSignalTest, EmptySignalRejected) {
    EXPECT_THROW(TransitionOnSignal::Down<>("A", "B", nullptr), ConfigurationException);
}
