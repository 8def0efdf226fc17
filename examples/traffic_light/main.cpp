#include "common/Logger.h"
#include "runtime/HybridStateMachine.h"
#include "runtime/StateMachine.h"
#include "states/State.h"
#include "timing/Clock.h"
#include "transitions/Transition.h"
#include "transitions/TransitionAfter.h"
#include <iostream>
#include <memory>
#include <string>

namespace {

enum class Light { Red, Green, Yellow, Blinking };
enum class Blink { On, Off };

const char *toString(Light light) {
    switch (light) {
    case Light::Red:
        return "Red";
    case Light::Green:
        return "Green";
    case Light::Yellow:
        return "Yellow";
    case Light::Blinking:
        return "Blinking";
    }
    return "?";
}

// Simulation time advanced by the main loop instead of the wall clock
class SimulationTime : public HFSM::ITimeSource {
public:
    explicit SimulationTime(const double &seconds) : seconds_(seconds) {}

    double now() const override {
        return seconds_;
    }

private:
    const double &seconds_;
};

}  // namespace

int main() {
    using namespace HFSM;

    Logger::setLevel(LogLevel::Warn);

    double simulationSeconds = 0.0;
    Clock::setSource(std::make_unique<SimulationTime>(simulationSeconds));

    std::cout << "=== Traffic Light Example ===" << "\n\n";

    // Out-of-order mode: yellow blinks once per second until maintenance is done
    int blinks = 0;
    auto blinking = std::make_unique<HybridStateMachine<Light, Blink>>(HybridStateMachine<Light, Blink>::Hooks{
        .afterOnEnter = [](auto &) { std::cout << "  [blinking mode on]\n"; },
        .afterOnExit = [](auto &) { std::cout << "  [blinking mode off]\n"; },
    });
    blinking->addState(Blink::On, State<Blink>::Callbacks{.onEnter = [&blinks](auto &) { ++blinks; }})
        .addState(Blink::Off)
        .addTransition(std::make_unique<TransitionAfter<Blink>>(Blink::On, Blink::Off, 0.5))
        .addTransition(std::make_unique<TransitionAfter<Blink>>(Blink::Off, Blink::On, 0.5));

    bool pedestrianWaiting = false;
    StateMachine<std::string, Light> light;
    light.addState(Light::Red)
        .addState(Light::Green)
        // Yellow always runs its full two seconds, even when the fault trigger fires
        .addState(Light::Yellow,
                  State<Light>::Callbacks{.canExit = [](auto &state) { return state.getTimer().isElapsedAtLeast(2.0); }},
                  true)
        .addState(Light::Blinking, std::move(blinking))
        .addTransition(std::make_unique<TransitionAfter<Light>>(Light::Red, Light::Green, 5.0))
        .addTransition(std::make_unique<TransitionAfter<Light>>(Light::Green, Light::Yellow, 10.0))
        .addTransition(std::make_unique<Transition<Light>>(
            Light::Green, Light::Yellow, [&pedestrianWaiting](auto &) { return pedestrianWaiting; },
            [&pedestrianWaiting](auto &) { pedestrianWaiting = false; }))
        .addTransition(std::make_unique<Transition<Light>>(Light::Yellow, Light::Red))
        .addTriggerTransitionFromAny("fault", std::make_unique<Transition<Light>>(std::nullopt, Light::Blinking))
        .addTriggerTransition("repaired", std::make_unique<Transition<Light>>(Light::Blinking, Light::Red));

    light.init();

    Light shown = light.getActiveStateName();
    std::cout << "t=0.0s  " << toString(shown) << "\n";

    const double step = 0.25;
    for (int tick = 1; tick <= 160; ++tick) {
        simulationSeconds += step;

        if (tick == 30) {
            std::cout << "t=" << simulationSeconds << "s  pedestrian button pressed\n";
            pedestrianWaiting = true;
        }
        if (tick == 90) {
            std::cout << "t=" << simulationSeconds << "s  fault detected\n";
            light.trigger("fault");
        }
        if (tick == 120) {
            std::cout << "t=" << simulationSeconds << "s  repaired after " << blinks << " blinks\n";
            light.trigger("repaired");
        }

        light.onLogic(step);

        if (light.getActiveStateName() != shown) {
            shown = light.getActiveStateName();
            std::cout << "t=" << simulationSeconds << "s  " << toString(shown) << "\n";
        }
    }

    light.onExit();
    Clock::resetSource();
    return 0;
}
