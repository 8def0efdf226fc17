#include "actions/ActionStorage.h"
#include "common/StateMachineException.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace HFSM;

class ActionStorageTest : public ::testing::Test {
protected:
    ActionStorage<std::string> storage_;
    std::vector<std::string> calls_;
};

TEST_F(ActionStorageTest, RunsZeroArgumentHandlersInOrder) {
    storage_.addAction("hit", [this] { calls_.push_back("first"); });
    storage_.addAction("hit", [this] { calls_.push_back("second"); });

    storage_.runAction("hit");

    EXPECT_EQ(calls_, (std::vector<std::string>{"first", "second"}));
}

TEST_F(ActionStorageTest, PassesTypedArgument) {
    int received = 0;
    storage_.addAction<int>("damage", [&received](const int &amount) { received += amount; });

    storage_.runAction("damage", 5);
    storage_.runAction("damage", 7);

    EXPECT_EQ(received, 12);
}

TEST_F(ActionStorageTest, UnknownTriggerIsNoOp) {
    EXPECT_FALSE(storage_.hasAction("missing"));
    EXPECT_NO_THROW(storage_.runAction("missing"));
    EXPECT_NO_THROW(storage_.runAction("missing", 3.0));
}

TEST_F(ActionStorageTest, HasActionAfterAdd) {
    storage_.addAction("jump", [] {});
    EXPECT_TRUE(storage_.hasAction("jump"));
    EXPECT_FALSE(storage_.hasAction("duck"));
}

TEST_F(ActionStorageTest, MissingArgumentThrows) {
    storage_.addAction<int>("damage", [this](const int &) { calls_.push_back("damage"); });

    EXPECT_THROW(storage_.runAction("damage"), ActionTypeMismatchException);
    EXPECT_TRUE(calls_.empty());
}

TEST_F(ActionStorageTest, WrongArgumentTypeThrows) {
    storage_.addAction<int>("damage", [this](const int &) { calls_.push_back("damage"); });

    EXPECT_THROW(storage_.runAction("damage", std::string("five")), ActionTypeMismatchException);
    EXPECT_THROW(storage_.runAction("damage", 5.0), ActionTypeMismatchException);
    EXPECT_TRUE(calls_.empty());
}

TEST_F(ActionStorageTest, UnexpectedArgumentThrows) {
    storage_.addAction("hit", [this] { calls_.push_back("hit"); });

    EXPECT_THROW(storage_.runAction("hit", 1), ActionTypeMismatchException);
    EXPECT_TRUE(calls_.empty());
}

TEST_F(ActionStorageTest, MixedHandlersFailBeforeAnyRuns) {
    storage_.addAction("hit", [this] { calls_.push_back("plain"); });
    storage_.addAction<int>("hit", [this](const int &) { calls_.push_back("typed"); });

    EXPECT_THROW(storage_.runAction("hit"), ActionTypeMismatchException);
    EXPECT_THROW(storage_.runAction("hit", 1), ActionTypeMismatchException);
    EXPECT_TRUE(calls_.empty());
}

TEST_F(ActionStorageTest, MismatchIsAStateMachineException) {
    storage_.addAction<int>("damage", [](const int &) {});
    EXPECT_THROW(storage_.runAction("damage"), StateMachineException);
}

TEST_F(ActionStorageTest, EmptyHandlerRejected) {
    EXPECT_THROW(storage_.addAction("hit", std::function<void()>()), ConfigurationException);
    EXPECT_THROW(storage_.addAction<int>("damage", std::function<void(const int &)>()), ConfigurationException);
}

TEST_F(ActionStorageTest, HandlerAddedDuringRunTakesEffectNextRun) {
    storage_.addAction("spawn", [this] {
        calls_.push_back("spawn");
        storage_.addAction("spawn", [this] { calls_.push_back("spawned"); });
    });

    storage_.runAction("spawn");
    EXPECT_EQ(calls_, (std::vector<std::string>{"spawn"}));

    calls_.clear();
    storage_.runAction("spawn");
    EXPECT_EQ(calls_, (std::vector<std::string>{"spawn", "spawned"}));
}

TEST_F(ActionStorageTest, TypeErasedArgument) {
    std::string received;
    storage_.addAction<std::string>("say", [&received](const std::string &text) { received = text; });

    std::string text = "hello";
    storage_.runAction("say", ActionArgument::of(text));

    EXPECT_EQ(received, "hello");
}

TEST(ActionArgumentTest, HoldsAndGet) {
    double value = 2.5;
    ActionArgument argument = ActionArgument::of(value);

    EXPECT_TRUE(argument.holds<double>());
    EXPECT_FALSE(argument.holds<float>());
    EXPECT_DOUBLE_EQ(argument.get<double>(), 2.5);
    EXPECT_THROW(argument.get<int>(), ActionTypeMismatchException);
}

enum class Command { Fire, Reload };

TEST(ActionStorageEnumTest, EnumTriggers) {
    ActionStorage<Command> storage;
    int fired = 0;
    storage.addAction(Command::Fire, [&fired] { ++fired; });

    storage.runAction(Command::Fire);
    storage.runAction(Command::Reload);

    EXPECT_EQ(fired, 1);
}
