#include "runtime/StateStack.h"
#include "common/Logger.h"
#include <stdexcept>

namespace SMI {

void StateStack::push(std::shared_ptr<StateInstance> state) {
    if (!state) {
        throw std::invalid_argument("Cannot push a null state");
    }
    LOG_TRACE("Push {} (depth {})", state->getInfo().getName(), entries_.size() + 1);
    entries_.push_back(std::move(state));
}

std::shared_ptr<StateInstance> StateStack::pop() {
    if (entries_.empty()) {
        return nullptr;
    }
    auto state = std::move(entries_.back());
    entries_.pop_back();
    LOG_TRACE("Pop {} (depth {})", state->getInfo().getName(), entries_.size());
    return state;
}

}  // namespace SMI
