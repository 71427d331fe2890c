#pragma once

#include "env/Environment.h"
#include "info/MachineInfo.h"
#include "live/StateInstance.h"
#include <memory>
#include <string>

namespace SMI {

/**
 * @brief Record of one state change that actually happened
 *
 * Holds shared references to both states, so a transition kept in history
 * keeps the old state's arguments and variables observable after the machine
 * has moved on.
 */
class TransitionInstance {
public:
    TransitionInstance(const TransitionInfo &info, std::shared_ptr<const StateInstance> oldState,
                       std::shared_ptr<const StateInstance> newState,
                       std::shared_ptr<const Environment> exitArguments = Environment::empty(),
                       std::shared_ptr<const Environment> enterArguments = Environment::empty());

    // Change-state has no exit or enter arguments
    static TransitionInstance changeState(const TransitionInfo &info, std::shared_ptr<const StateInstance> oldState,
                                          std::shared_ptr<const StateInstance> newState);

    const TransitionInfo &getInfo() const {
        return *info_;
    }

    TransitionKind getKind() const {
        return info_->getKind();
    }

    const StateInstance &getOldState() const {
        return *oldState_;
    }

    const StateInstance &getNewState() const {
        return *newState_;
    }

    const std::shared_ptr<const StateInstance> &getOldStatePtr() const {
        return oldState_;
    }

    const std::shared_ptr<const StateInstance> &getNewStatePtr() const {
        return newState_;
    }

    const Environment &getExitArguments() const {
        return *exitArguments_;
    }

    const Environment &getEnterArguments() const {
        return *enterArguments_;
    }

    // "Old->New" for transitions, "Old->>New" for change-states
    std::string toString() const;

private:
    const TransitionInfo *info_;
    std::shared_ptr<const StateInstance> oldState_;
    std::shared_ptr<const StateInstance> newState_;
    std::shared_ptr<const Environment> exitArguments_;
    std::shared_ptr<const Environment> enterArguments_;
};

}  // namespace SMI
