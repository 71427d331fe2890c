#pragma once

#include "common/Logger.h"
#include "env/Environment.h"
#include "info/MachineInfo.h"
#include "live/InstanceCast.h"
#include "live/MethodInstance.h"
#include "live/StateInstance.h"
#include "live/TransitionInstance.h"
#include "runtime/EventMonitor.h"
#include "runtime/StateStack.h"
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace SMI::Static {

/**
 * @brief Dispatch envelope for generated state machines
 *
 * Implements the notification protocol every generated machine must follow:
 * each dispatched event is bracketed by eventSent/eventHandled, every state
 * change swaps the current state and reports exactly one transition, and
 * transitions deliver the exit sub-event of the old state and the enter
 * sub-event of the new one around the swap. Generated code only supplies the
 * handler logic through the MachinePolicy template parameter.
 *
 * For a transition from Old to New triggered by E, observers see:
 *   sent(E), sent(Old:<), handled(Old:<), transition, sent(New:>), handled(New:>), handled(E)
 * A change-state skips both sub-events.
 *
 * Handlers that dispatch or transition from inside an enter/exit handler
 * recurse through this class. The recursion depth is bounded only by the
 * machine description.
 *
 * @tparam MachinePolicy Generated policy. Must provide:
 *         - static const MachineInfo &machineInfo()
 *         - std::shared_ptr<StateInstance> initialState() (static or not)
 *         - template <typename Engine> void handleEvent(MethodInstance &event, Engine &engine)
 *         May provide:
 *         - Environment as a base class, exposing the domain variables
 *         - transitionHook(const StateInstance &oldState, const StateInstance &newState)
 *         - changeStateHook(const StateInstance &oldState, const StateInstance &newState)
 */
template <typename MachinePolicy> class StaticMachineEngine {
    friend MachinePolicy;

protected:
    MachinePolicy policy_;  // Declared first: initialState() may read policy members

private:
    std::shared_ptr<StateInstance> currentState_;
    EventMonitor eventMonitor_;
    StateStack stateStack_;
    bool initialized_ = false;

public:
    StaticMachineEngine() : currentState_(policy_.initialState()) {
        requireInitialState();
    }

    StaticMachineEngine(std::optional<std::size_t> eventHistoryCapacity,
                        std::optional<std::size_t> transitionHistoryCapacity)
        : currentState_(policy_.initialState()), eventMonitor_(eventHistoryCapacity, transitionHistoryCapacity) {
        requireInitialState();
    }

    StaticMachineEngine(const StaticMachineEngine &) = delete;
    StaticMachineEngine &operator=(const StaticMachineEngine &) = delete;

    /**
     * @brief Enter the initial state
     *
     * Dispatches the initial state's enter sub-event through the normal
     * envelope, so observers registered beforehand see it. Generated machines
     * call this from their constructor.
     */
    void initialize() {
        if (initialized_) {
            LOG_WARN("Machine '{}' already initialized, ignoring", getMachineInfo().getName());
            return;
        }
        initialized_ = true;
        LOG_DEBUG("Machine '{}' starting in {}", getMachineInfo().getName(), currentState_->getInfo().getName());
        dispatch(std::make_shared<BasicMethodInstance>(currentState_->getInfo().getEnterEvent()));
    }

    bool isInitialized() const {
        return initialized_;
    }

    const StateInstance &getCurrentState() const {
        return *currentState_;
    }

    std::shared_ptr<const StateInstance> getCurrentStatePtr() const {
        return currentState_;
    }

    const Environment &getDomainVariables() const {
        if constexpr (std::is_base_of_v<Environment, MachinePolicy>) {
            return policy_;
        } else {
            return *Environment::empty();
        }
    }

    EventMonitor &getEventMonitor() {
        return eventMonitor_;
    }

    const EventMonitor &getEventMonitor() const {
        return eventMonitor_;
    }

    const StateStack &getStateStack() const {
        return stateStack_;
    }

    static const MachineInfo &getMachineInfo() {
        return MachinePolicy::machineInfo();
    }

protected:
    /**
     * @brief Deliver one event to the policy inside the sent/handled bracket
     *
     * The event is recorded in history after handling, so a return value set
     * by the handler is visible to handled callbacks and in history.
     */
    void dispatch(std::shared_ptr<MethodInstance> event) {
        LOG_TRACE("{}: dispatch {} in {}", getMachineInfo().getName(), event->getInfo().getName(),
                  currentState_->getInfo().getName());
        eventMonitor_.eventSent(event);
        policy_.handleEvent(*event, *this);
        eventMonitor_.eventHandled(std::move(event));
    }

    /**
     * @brief Leave the current state through its exit handler and enter @p newState
     * @throws std::logic_error if @p info is not a static Transition site targeting newState's state
     */
    void transition(const TransitionInfo &info, std::shared_ptr<StateInstance> newState,
                    std::shared_ptr<const Environment> exitArguments = Environment::empty(),
                    std::shared_ptr<const Environment> enterArguments = Environment::empty()) {
        requireSite(info, TransitionKind::Transition, false);
        requireTarget(info, newState);
        performTransition(info, std::move(newState), std::move(exitArguments), std::move(enterArguments));
    }

    /**
     * @brief Replace the current state without running exit or enter handlers
     * @throws std::logic_error if @p info is not a static ChangeState site targeting newState's state
     */
    void changeState(const TransitionInfo &info, std::shared_ptr<StateInstance> newState) {
        requireSite(info, TransitionKind::ChangeState, false);
        requireTarget(info, newState);
        performChangeState(info, std::move(newState));
    }

    // Save the current state instance; the current state does not change
    void pushState() {
        stateStack_.push(currentState_);
    }

    /**
     * @brief Transition back to the most recently pushed state instance
     * @return false if the stack was empty, in which case nothing happens
     */
    bool popState(const TransitionInfo &info, std::shared_ptr<const Environment> exitArguments = Environment::empty(),
                  std::shared_ptr<const Environment> enterArguments = Environment::empty()) {
        requireSite(info, TransitionKind::Transition, true);
        auto restored = stateStack_.pop();
        if (!restored) {
            LOG_WARN("{}: pop from empty state stack in {}, ignoring", getMachineInfo().getName(),
                     currentState_->getInfo().getName());
            return false;
        }
        performTransition(info, std::move(restored), std::move(exitArguments), std::move(enterArguments));
        return true;
    }

    // Change-state flavour of popState()
    bool popChangeState(const TransitionInfo &info) {
        requireSite(info, TransitionKind::ChangeState, true);
        auto restored = stateStack_.pop();
        if (!restored) {
            LOG_WARN("{}: pop from empty state stack in {}, ignoring", getMachineInfo().getName(),
                     currentState_->getInfo().getName());
            return false;
        }
        performChangeState(info, std::move(restored));
        return true;
    }

    /**
     * @brief Current state as its concrete generated type
     *
     * Returns a shared reference so a handler keeps its state alive even if
     * it transitions away while still running.
     *
     * @throws ShapeMismatchError if the current state is not a T
     */
    template <typename T> std::shared_ptr<T> currentStateAs() {
        return instanceAs<T>(currentState_);
    }

private:
    void requireInitialState() const {
        if (!currentState_) {
            LOG_ERROR("Machine '{}' has no initial state instance", getMachineInfo().getName());
            throw std::logic_error("Machine '" + getMachineInfo().getName() + "' has no initial state instance");
        }
    }

    void requireSite(const TransitionInfo &info, TransitionKind kind, bool stackPop) const {
        std::string problem;
        if (info.getKind() != kind) {
            problem = std::string("is a ") + toString(info.getKind()) + ", expected a " + toString(kind);
        } else if (info.isStackPop() != stackPop) {
            problem = stackPop ? "has a static target, expected a stack pop" : "is a stack pop";
        } else if (&info.getSource() != &currentState_->getInfo() &&
                   !currentState_->getInfo().isDescendantOf(info.getSource())) {
            problem = "does not start from current state " + currentState_->getInfo().getName();
        }

        if (!problem.empty()) {
            LOG_ERROR("{}: transition {} {}", getMachineInfo().getName(), info.getId(), problem);
            throw std::logic_error(getMachineInfo().getName() + ": transition " + std::to_string(info.getId()) + " " +
                                   problem);
        }
    }

    void requireTarget(const TransitionInfo &info, const std::shared_ptr<StateInstance> &newState) const {
        if (!newState || &newState->getInfo() != info.getTarget()) {
            std::string actual = newState ? newState->getInfo().getName() : "null";
            LOG_ERROR("{}: transition {} targets {}, got {}", getMachineInfo().getName(), info.getId(),
                      info.getTarget()->getName(), actual);
            throw std::logic_error(getMachineInfo().getName() + ": transition " + std::to_string(info.getId()) +
                                   " targets " + info.getTarget()->getName() + ", got " + actual);
        }
    }

    void performTransition(const TransitionInfo &info, std::shared_ptr<StateInstance> newState,
                           std::shared_ptr<const Environment> exitArguments,
                           std::shared_ptr<const Environment> enterArguments) {
        dispatch(std::make_shared<BasicMethodInstance>(currentState_->getInfo().getExitEvent(), exitArguments));

        auto oldState = std::exchange(currentState_, newState);
        LOG_DEBUG("{}: {} -> {} (transition {})", getMachineInfo().getName(), oldState->getInfo().getName(),
                  newState->getInfo().getName(), info.getId());

        if constexpr (requires { policy_.transitionHook(*oldState, *newState); }) {
            policy_.transitionHook(*oldState, *newState);
        }

        eventMonitor_.transitionOccurred(TransitionInstance(info, oldState, newState, exitArguments, enterArguments));

        dispatch(std::make_shared<BasicMethodInstance>(newState->getInfo().getEnterEvent(), enterArguments));
    }

    void performChangeState(const TransitionInfo &info, std::shared_ptr<StateInstance> newState) {
        auto oldState = std::exchange(currentState_, newState);
        LOG_DEBUG("{}: {} ->> {} (transition {})", getMachineInfo().getName(), oldState->getInfo().getName(),
                  newState->getInfo().getName(), info.getId());

        if constexpr (requires { policy_.changeStateHook(*oldState, *newState); }) {
            policy_.changeStateHook(*oldState, *newState);
        }

        eventMonitor_.transitionOccurred(TransitionInstance::changeState(info, oldState, newState));
    }
};

}  // namespace SMI::Static
