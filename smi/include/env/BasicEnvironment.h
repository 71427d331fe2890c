#pragma once

#include "env/Environment.h"
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace SMI {

/**
 * @brief Environment backed by an ordered list of bindings
 *
 * Generated code uses it for event and sub-event arguments, where the
 * bindings are fixed once the event is created.
 */
class BasicEnvironment : public Environment {
public:
    BasicEnvironment() = default;

    BasicEnvironment(std::initializer_list<std::pair<std::string, Value>> bindings) : bindings_(bindings) {}

    std::optional<Value> lookup(const std::string &name) const override;

    std::vector<std::string> getNames() const override;

    // Replaces an existing binding in place, appends otherwise
    void set(const std::string &name, Value value);

    std::size_t size() const {
        return bindings_.size();
    }

private:
    std::vector<std::pair<std::string, Value>> bindings_;
};

}  // namespace SMI
