#pragma once

#include "env/Environment.h"
#include "info/MachineInfo.h"
#include <memory>
#include <optional>

namespace SMI {

/**
 * @brief Live instance of an event or action call
 */
class MethodInstance {
public:
    virtual ~MethodInstance() = default;

    virtual const MethodInfo &getInfo() const = 0;

    virtual const Environment &getArguments() const = 0;

    /**
     * @brief Value produced by the handler
     * @return std::nullopt until the event is handled, and for methods without a return type
     */
    virtual std::optional<Value> getReturnValue() const = 0;
};

/**
 * @brief Ready-made MethodInstance for any signature
 *
 * Used by the engine for enter/exit sub-events and by generated code for
 * interface events.
 */
class BasicMethodInstance : public MethodInstance {
public:
    explicit BasicMethodInstance(const MethodInfo &info,
                                 std::shared_ptr<const Environment> arguments = Environment::empty())
        : info_(info), arguments_(arguments ? std::move(arguments) : Environment::empty()) {}

    const MethodInfo &getInfo() const override {
        return info_;
    }

    const Environment &getArguments() const override {
        return *arguments_;
    }

    std::optional<Value> getReturnValue() const override {
        return returnValue_;
    }

    void setReturnValue(Value value) {
        returnValue_ = std::move(value);
    }

    std::shared_ptr<const Environment> getArgumentsPtr() const {
        return arguments_;
    }

private:
    const MethodInfo &info_;
    std::shared_ptr<const Environment> arguments_;
    std::optional<Value> returnValue_;
};

}  // namespace SMI
