#pragma once

// Compiler output for:
//
// #Turnstile
//     -interface-
//     coin [amount:u32] : bool
//     pass
//     reset
//     -machine-
//     $Locked
//         |coin| [amount:u32]
//             #.coins = #.coins + amount
//             amount >= 50 ? -> "paid" $Unlocked ^(true) : ^(false)
//         |pass| $$[+] -> "forced" $Alarm ^
//     $Unlocked
//         var passes:u32 = 0
//         |coin| #.coins = #.coins + amount ^(false)
//         |pass| -> $Locked ^
//     $Alarm
//         |>| alarm() ^
//         |reset| -> $$[-] ^
//     -domain-
//     var coins:u32 = 0
// ##

#include "common/Logger.h"
#include "env/BasicEnvironment.h"
#include "live/InstanceCast.h"
#include "static/StaticMachineEngine.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace SMI::Generated::turnstile {

enum class State { Locked, Unlocked, Alarm };

enum class Event { Coin, Pass, Reset, Alarm_Enter };

struct TurnstilePolicy : public ::SMI::Environment {
    uint32_t coins = 0;

    static const ::SMI::MachineInfo &machineInfo() {
        static const auto info =
            ::SMI::MachineInfo::Builder("Turnstile")
                .domainVariable("coins", "u32")
                .interfaceEvent("coin", {{"amount", "u32"}}, "bool")
                .interfaceEvent("pass")
                .interfaceEvent("reset")
                .event("Alarm:>")
                .state({.name = "Locked", .handlers = {"coin", "pass"}})
                .state({.name = "Unlocked", .handlers = {"coin", "pass"}})
                .state({.name = "Alarm", .handlers = {"Alarm:>", "reset"}})
                .transition({.id = 0, .event = "coin", .label = "paid", .source = "Locked", .target = "Unlocked"})
                .transition({.id = 1, .event = "pass", .label = "forced", .source = "Locked", .target = "Alarm"})
                .transition({.id = 2, .event = "pass", .source = "Unlocked", .target = "Locked"})
                .transition({.id = 3, .event = "reset", .source = "Alarm", .stackPop = true})
                .build();
        return *info;
    }

    std::optional<::SMI::Value> lookup(const std::string &name) const override {
        if (name == "coins") {
            return ::SMI::Value{coins};
        }
        return std::nullopt;
    }

    std::vector<std::string> getNames() const override {
        return {"coins"};
    }

    static std::shared_ptr<::SMI::StateInstance> makeState(State state) {
        return std::make_shared<::SMI::BasicStateInstance>(
            *machineInfo().getStates()[static_cast<std::size_t>(state)]);
    }

    std::shared_ptr<::SMI::StateInstance> initialState() {
        return makeState(State::Locked);
    }

    template <typename Engine> void handleEvent(::SMI::MethodInstance &event, Engine &engine) {
        auto message = static_cast<Event>(event.getInfo().getIndex());
        switch (static_cast<State>(engine.getCurrentState().getInfo().getIndex())) {
        case State::Locked:
            if (message == Event::Coin) {
                uint32_t amount = event.getArguments().get<uint32_t>("amount").value();
                coins += amount;
                bool paid = amount >= 50;
                if (paid) {
                    engine.transition(*machineInfo().getTransition(0), makeState(State::Unlocked));
                }
                ::SMI::instanceAs<::SMI::BasicMethodInstance>(event).setReturnValue(::SMI::Value{paid});
            } else if (message == Event::Pass) {
                engine.pushState();
                engine.transition(*machineInfo().getTransition(1), makeState(State::Alarm));
            }
            break;
        case State::Unlocked:
            if (message == Event::Coin) {
                coins += event.getArguments().get<uint32_t>("amount").value();
                ::SMI::instanceAs<::SMI::BasicMethodInstance>(event).setReturnValue(::SMI::Value{false});
            } else if (message == Event::Pass) {
                engine.transition(*machineInfo().getTransition(2), makeState(State::Locked));
            }
            break;
        case State::Alarm:
            if (message == Event::Alarm_Enter) {
                LOG_WARN("Turnstile forced while locked");
            } else if (message == Event::Reset) {
                engine.popState(*machineInfo().getTransition(3));
            }
            break;
        }
    }
};

// User-facing state machine class
class Turnstile : public ::SMI::Static::StaticMachineEngine<TurnstilePolicy> {
public:
    Turnstile() : StaticMachineEngine(std::nullopt, std::nullopt) {
        initialize();
    }

    bool coin(uint32_t amount) {
        auto event = std::make_shared<::SMI::BasicMethodInstance>(
            *getMachineInfo().getEvent("coin"),
            std::make_shared<::SMI::BasicEnvironment>(::SMI::BasicEnvironment{{"amount", ::SMI::Value{amount}}}));
        dispatch(event);
        return ::SMI::valueAs<bool>(event->getReturnValue().value());
    }

    void pass() {
        dispatch(std::make_shared<::SMI::BasicMethodInstance>(*getMachineInfo().getEvent("pass")));
    }

    void reset() {
        dispatch(std::make_shared<::SMI::BasicMethodInstance>(*getMachineInfo().getEvent("reset")));
    }
};

}  // namespace SMI::Generated::turnstile
