#include "live/TransitionInstance.h"
#include <stdexcept>

namespace SMI {

TransitionInstance::TransitionInstance(const TransitionInfo &info, std::shared_ptr<const StateInstance> oldState,
                                       std::shared_ptr<const StateInstance> newState,
                                       std::shared_ptr<const Environment> exitArguments,
                                       std::shared_ptr<const Environment> enterArguments)
    : info_(&info), oldState_(std::move(oldState)), newState_(std::move(newState)),
      exitArguments_(exitArguments ? std::move(exitArguments) : Environment::empty()),
      enterArguments_(enterArguments ? std::move(enterArguments) : Environment::empty()) {
    if (!oldState_ || !newState_) {
        throw std::invalid_argument("TransitionInstance requires both states");
    }
}

TransitionInstance TransitionInstance::changeState(const TransitionInfo &info,
                                                   std::shared_ptr<const StateInstance> oldState,
                                                   std::shared_ptr<const StateInstance> newState) {
    return TransitionInstance(info, std::move(oldState), std::move(newState));
}

std::string TransitionInstance::toString() const {
    const char *arrow = getKind() == TransitionKind::ChangeState ? "->>" : "->";
    return oldState_->getInfo().getName() + arrow + newState_->getInfo().getName();
}

}  // namespace SMI
