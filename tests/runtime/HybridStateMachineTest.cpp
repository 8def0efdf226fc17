#include "runtime/HybridStateMachine.h"
#include "common/StateMachineException.h"
#include "mocks/ManualClock.h"
#include "runtime/StateMachine.h"
#include "states/State.h"
#include "transitions/Transition.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace HFSM;
using ::testing::ElementsAre;

using Hybrid = HybridStateMachine<>;
using Leaf = State<>;

class HybridStateMachineTest : public ::testing::Test {
protected:
    Hybrid::Hooks recordingHooks() {
        return Hybrid::Hooks{
            .beforeOnEnter = [this](Hybrid &) { log_.push_back("before enter"); },
            .afterOnEnter = [this](Hybrid &) { log_.push_back("after enter"); },
            .beforeOnLogic = [this](Hybrid &, double) { log_.push_back("before logic"); },
            .afterOnLogic = [this](Hybrid &, double) { log_.push_back("after logic"); },
            .beforeOnExit = [this](Hybrid &) { log_.push_back("before exit"); },
            .afterOnExit = [this](Hybrid &) { log_.push_back("after exit"); },
        };
    }

    std::unique_ptr<Leaf> recording(const std::string &name) {
        return std::make_unique<Leaf>(Leaf::Callbacks{
            .onEnter = [this, name](Leaf &) { log_.push_back("enter " + name); },
            .onLogic = [this, name](Leaf &, double) { log_.push_back("logic " + name); },
            .onExit = [this, name](Leaf &) { log_.push_back("exit " + name); },
        });
    }

    HFSM::Test::ManualClock clock_;
    std::vector<std::string> log_;
};

TEST_F(HybridStateMachineTest, HooksBracketChildLifecycle) {
    StateMachine<> root;
    auto owned = std::make_unique<Hybrid>(recordingHooks());
    owned->addState("A", recording("A"));
    root.addState("Hybrid", std::move(owned)).addState("Other");
    root.init();

    root.onLogic(0.1);
    root.requestStateChange("Other");

    EXPECT_THAT(log_, ElementsAre("before enter", "enter A", "after enter", "before logic", "logic A",
                                  "after logic", "before exit", "exit A", "after exit"));
}

TEST_F(HybridStateMachineTest, RootHybridMachine) {
    Hybrid fsm(recordingHooks());
    fsm.addState("A", recording("A"));
    fsm.init();

    EXPECT_THAT(log_, ElementsAre("before enter", "enter A", "after enter"));
    EXPECT_EQ(fsm.getActiveStateName(), "A");
}

TEST_F(HybridStateMachineTest, LogicHookCountsTicks) {
    int ticks = 0;
    double total = 0.0;
    Hybrid fsm(Hybrid::Hooks{
        .afterOnLogic =
            [&](Hybrid &, double delta) {
                ++ticks;
                total += delta;
            },
    });
    fsm.addState("A");
    fsm.init();

    for (int i = 0; i < 10; ++i) {
        fsm.onLogic(0.5);
    }

    EXPECT_EQ(ticks, 10);
    EXPECT_DOUBLE_EQ(total, 5.0);
}

TEST_F(HybridStateMachineTest, ChildTransitionsUnaffectedByHooks) {
    int counter = 0;
    Hybrid fsm(Hybrid::Hooks{
        .beforeOnLogic = [&counter](Hybrid &, double) { ++counter; },
    });
    fsm.addState("C1", recording("C1")).addState("C2", recording("C2"));
    fsm.addTransition(std::make_unique<Transition<>>("C1", "C2"));
    fsm.addTransition(std::make_unique<Transition<>>("C2", "C1"));
    fsm.init();

    StateMachine<> plain;
    plain.addState("C1").addState("C2");
    plain.addTransition(std::make_unique<Transition<>>("C1", "C2"));
    plain.addTransition(std::make_unique<Transition<>>("C2", "C1"));
    plain.init();

    for (int i = 0; i < 10; ++i) {
        fsm.onLogic(0.1);
        plain.onLogic(0.1);
        EXPECT_EQ(fsm.getActiveStateName(), plain.getActiveStateName());
    }

    EXPECT_EQ(counter, 10);
    EXPECT_EQ(fsm.getActiveStateName(), "C1");
}

TEST_F(HybridStateMachineTest, HookSeesChildTransitionsOfSameTick) {
    std::string seen;
    Hybrid fsm(Hybrid::Hooks{
        .afterOnLogic = [&seen](Hybrid &self, double) { seen = self.getActiveStateName(); },
    });
    fsm.addState("A").addState("B");
    fsm.addTransition(std::make_unique<Transition<>>("A", "B"));
    fsm.init();

    fsm.onLogic(0.1);
    EXPECT_EQ(seen, "B");
}

TEST_F(HybridStateMachineTest, TimerRestartsOnEnter) {
    StateMachine<> root;
    auto owned = std::make_unique<Hybrid>();
    auto &hybrid = *owned;
    owned->addState("A");
    root.addState("Hybrid", std::move(owned)).addState("Other");
    root.init();

    clock_.advance(2.0);
    EXPECT_DOUBLE_EQ(hybrid.getTimer().getElapsed(), 2.0);

    root.requestStateChange("Other");
    clock_.advance(1.0);
    root.requestStateChange("Hybrid");
    EXPECT_DOUBLE_EQ(hybrid.getTimer().getElapsed(), 0.0);
}

TEST_F(HybridStateMachineTest, OwnActionsRunBeforeChildActions) {
    auto child = std::make_unique<Leaf>();
    child->addAction("hit", [this] { log_.push_back("child"); });

    Hybrid fsm;
    fsm.addAction("hit", [this] { log_.push_back("self"); });
    fsm.addState("A", std::move(child));
    fsm.init();

    fsm.onAction("hit");
    EXPECT_THAT(log_, ElementsAre("self", "child"));
}

TEST_F(HybridStateMachineTest, TypedActions) {
    int selfTotal = 0;
    int childTotal = 0;
    auto child = std::make_unique<Leaf>();
    child->addAction<int>("damage", [&childTotal](const int &amount) { childTotal += amount; });

    Hybrid fsm;
    fsm.addAction<int>("damage", [&selfTotal](const int &amount) { selfTotal += amount * 2; })
        .addState("A", std::move(child));
    fsm.init();

    fsm.onAction("damage", 5);
    EXPECT_EQ(selfTotal, 10);
    EXPECT_EQ(childTotal, 5);

    EXPECT_THROW(fsm.onAction("damage"), ActionTypeMismatchException);
}

TEST_F(HybridStateMachineTest, ActionsWithoutHandlersStillReachChild) {
    int hits = 0;
    auto child = std::make_unique<Leaf>();
    child->addAction("hit", [&hits] { ++hits; });

    Hybrid fsm;
    fsm.addState("A", std::move(child));
    fsm.init();

    fsm.onAction("hit");
    EXPECT_EQ(hits, 1);
}

TEST_F(HybridStateMachineTest, ActionBeforeEnterThrows) {
    Hybrid fsm;
    fsm.addAction("hit", [this] { log_.push_back("self"); });
    fsm.addState("A");

    EXPECT_THROW(fsm.onAction("hit"), StateMachineStateException);
    EXPECT_TRUE(log_.empty());
}

TEST_F(HybridStateMachineTest, LogicBeforeEnterSkipsHooks) {
    Hybrid fsm(recordingHooks());
    fsm.addState("A");

    EXPECT_THROW(fsm.onLogic(0.1), StateMachineStateException);
    EXPECT_TRUE(log_.empty());
}

TEST_F(HybridStateMachineTest, MutationFromLogicHooksRejected) {
    Hybrid fsm(Hybrid::Hooks{
        .afterOnLogic = [](Hybrid &self, double) { self.addState("Late"); },
    });
    fsm.addState("A");
    fsm.init();

    EXPECT_THROW(fsm.onLogic(0.1), StateMachineStateException);
    EXPECT_FALSE(fsm.hasState("Late"));
    EXPECT_NO_THROW(fsm.addState("Late"));
}

TEST_F(HybridStateMachineTest, MutationFromEnterHookRejected) {
    Hybrid fsm(Hybrid::Hooks{
        .beforeOnEnter = [](Hybrid &self) { self.addState("Late"); },
    });
    fsm.addState("A");

    EXPECT_THROW(fsm.init(), StateMachineStateException);
    EXPECT_FALSE(fsm.hasState("Late"));
}

TEST_F(HybridStateMachineTest, MutationFromExitHookRejected) {
    StateMachine<> root;
    auto owned = std::make_unique<Hybrid>(Hybrid::Hooks{
        .afterOnExit = [](Hybrid &self) { self.addState("Late"); },
    });
    auto &hybrid = *owned;
    owned->addState("A");
    root.addState("Hybrid", std::move(owned)).addState("Other");
    root.init();

    EXPECT_THROW(root.requestStateChange("Other"), StateMachineStateException);
    EXPECT_FALSE(hybrid.hasState("Late"));
}

TEST_F(HybridStateMachineTest, MutationFromOwnActionRejected) {
    Hybrid fsm;
    fsm.addAction("grow", [&fsm] { fsm.addState("Late"); });
    fsm.addState("A");
    fsm.init();

    EXPECT_THROW(fsm.onAction("grow"), StateMachineStateException);
    EXPECT_FALSE(fsm.hasState("Late"));
}

TEST_F(HybridStateMachineTest, ExitTimeFlagsForwarded) {
    Hybrid fsm(Hybrid::Hooks{}, true, false, true);
    EXPECT_TRUE(fsm.needsExitTime());
    EXPECT_FALSE(fsm.isGhostState());
}
