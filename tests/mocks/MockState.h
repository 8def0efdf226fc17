#pragma once

#include "states/StateBase.h"
#include <gmock/gmock.h>
#include <string>

namespace HFSM::Test {

/**
 * @brief gmock state for verifying the lifecycle calls a machine makes on its children
 */
class MockState : public StateBase<std::string> {
public:
    explicit MockState(bool needsExitTime = false, bool isGhostState = false)
        : StateBase<std::string>(needsExitTime, isGhostState) {}

    MOCK_METHOD(void, init, (), (override));
    MOCK_METHOD(void, onEnter, (), (override));
    MOCK_METHOD(void, onLogic, (double delta), (override));
    MOCK_METHOD(void, onExit, (), (override));
    MOCK_METHOD(void, onExitRequest, (), (override));
    MOCK_METHOD(void, trigger, (const std::string &event), (override));
    MOCK_METHOD(void, handleAction, (const std::string &action, const ActionArgument *argument), (override));
};

}  // namespace HFSM::Test
