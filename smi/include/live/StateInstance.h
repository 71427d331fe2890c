#pragma once

#include "env/Environment.h"
#include "info/MachineInfo.h"
#include <memory>

namespace SMI {

/**
 * @brief Live instance of a state
 *
 * Generated code provides one concrete subclass per state. The instance keeps
 * the arguments it was entered with and its own state variables, so restoring
 * it from the state stack brings both back unchanged.
 */
class StateInstance {
public:
    virtual ~StateInstance() = default;

    virtual const StateInfo &getInfo() const = 0;

    // Construction arguments bound when the state was created
    virtual const Environment &getArguments() const {
        return *Environment::empty();
    }

    virtual const Environment &getVariables() const {
        return *Environment::empty();
    }
};

/**
 * @brief StateInstance for states whose arguments and variables are plain bindings
 */
class BasicStateInstance : public StateInstance {
public:
    explicit BasicStateInstance(const StateInfo &info,
                                std::shared_ptr<const Environment> arguments = Environment::empty(),
                                std::shared_ptr<const Environment> variables = Environment::empty())
        : info_(info), arguments_(arguments ? std::move(arguments) : Environment::empty()),
          variables_(variables ? std::move(variables) : Environment::empty()) {}

    const StateInfo &getInfo() const override {
        return info_;
    }

    const Environment &getArguments() const override {
        return *arguments_;
    }

    const Environment &getVariables() const override {
        return *variables_;
    }

private:
    const StateInfo &info_;
    std::shared_ptr<const Environment> arguments_;
    std::shared_ptr<const Environment> variables_;
};

}  // namespace SMI
