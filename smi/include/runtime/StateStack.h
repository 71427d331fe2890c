#pragma once

#include "live/StateInstance.h"
#include <cstddef>
#include <memory>
#include <vector>

namespace SMI {

/**
 * @brief LIFO store of saved state instances
 *
 * Entries are shared with the current-state slot and with transition
 * records, so a popped instance comes back with its arguments and variables
 * exactly as they were when it was pushed.
 */
class StateStack {
public:
    void push(std::shared_ptr<StateInstance> state);

    // nullptr if empty
    std::shared_ptr<StateInstance> pop();

    // nullptr if empty
    std::shared_ptr<StateInstance> top() const {
        return entries_.empty() ? nullptr : entries_.back();
    }

    std::size_t size() const {
        return entries_.size();
    }

    bool empty() const {
        return entries_.empty();
    }

    void clear() {
        entries_.clear();
    }

private:
    std::vector<std::shared_ptr<StateInstance>> entries_;
};

}  // namespace SMI
