#include "info/MachineInfo.h"
#include "common/Logger.h"
#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace SMI {

namespace {

[[noreturn]] void failBuild(const std::string &machineName, const std::string &message) {
    LOG_ERROR("Invalid machine description '{}': {}", machineName, message);
    throw std::invalid_argument(machineName + ": " + message);
}

template <typename T> T *findByName(const std::vector<std::unique_ptr<T>> &items, const std::string &name) {
    for (const auto &item : items) {
        if (item->getName() == name) {
            return item.get();
        }
    }
    return nullptr;
}

}  // namespace

const char *toString(TransitionKind kind) {
    switch (kind) {
    case TransitionKind::Transition:
        return "Transition";
    case TransitionKind::ChangeState:
        return "ChangeState";
    }
    return "Unknown";
}

const NameInfo *MethodInfo::getParameter(const std::string &name) const {
    auto it = std::find_if(parameters_.begin(), parameters_.end(), [&](const NameInfo &p) { return p.name == name; });
    return it == parameters_.end() ? nullptr : &*it;
}

const MethodInfo *StateInfo::getHandler(const std::string &eventName) const {
    for (const MethodInfo *handler : handlers_) {
        if (handler->getName() == eventName) {
            return handler;
        }
    }
    return nullptr;
}

bool StateInfo::isDescendantOf(const StateInfo &ancestor) const {
    for (const StateInfo *current = parent_; current; current = current->parent_) {
        if (current == &ancestor) {
            return true;
        }
    }
    return false;
}

const StateInfo *MachineInfo::getState(const std::string &name) const {
    return findByName(stateStorage_, name);
}

const MethodInfo *MachineInfo::getEvent(const std::string &name) const {
    return findByName(eventStorage_, name);
}

const MethodInfo *MachineInfo::getAction(const std::string &name) const {
    return findByName(actionStorage_, name);
}

const TransitionInfo *MachineInfo::getTransition(int id) const {
    for (const auto &transition : transitionStorage_) {
        if (transition->getId() == id) {
            return transition.get();
        }
    }
    return nullptr;
}

MachineInfoBuilder::MachineInfoBuilder(std::string machineName) : machineName_(std::move(machineName)) {}

MachineInfoBuilder &MachineInfoBuilder::domainVariable(std::string name, std::string type) {
    domainVariables_.push_back(NameInfo{std::move(name), std::move(type)});
    return *this;
}

MachineInfoBuilder &MachineInfoBuilder::interfaceEvent(std::string name, std::vector<NameInfo> parameters,
                                                       std::optional<std::string> returnType) {
    events_.push_back(MethodDecl{std::move(name), std::move(parameters), std::move(returnType), true});
    return *this;
}

MachineInfoBuilder &MachineInfoBuilder::event(std::string name, std::vector<NameInfo> parameters,
                                              std::optional<std::string> returnType) {
    events_.push_back(MethodDecl{std::move(name), std::move(parameters), std::move(returnType), false});
    return *this;
}

MachineInfoBuilder &MachineInfoBuilder::action(std::string name, std::vector<NameInfo> parameters,
                                               std::optional<std::string> returnType) {
    actions_.push_back(MethodDecl{std::move(name), std::move(parameters), std::move(returnType), false});
    return *this;
}

MachineInfoBuilder &MachineInfoBuilder::state(StateDecl decl) {
    states_.push_back(std::move(decl));
    return *this;
}

MachineInfoBuilder &MachineInfoBuilder::transition(TransitionDecl decl) {
    transitions_.push_back(std::move(decl));
    return *this;
}

std::unique_ptr<const MachineInfo> MachineInfoBuilder::build() const {
    if (states_.empty()) {
        failBuild(machineName_, "a machine needs at least one state");
    }

    // make_unique cannot reach the private constructor
    std::unique_ptr<MachineInfo> machine(new MachineInfo(machineName_));
    machine->domainVariables_ = domainVariables_;

    // Phase 1: create every descriptor

    std::set<std::string> seen;
    for (const auto &decl : events_) {
        if (!seen.insert(decl.name).second) {
            failBuild(machineName_, "duplicate event '" + decl.name + "'");
        }
        machine->eventStorage_.push_back(std::unique_ptr<MethodInfo>(
            new MethodInfo(decl.name, decl.parameters, decl.returnType, machine->eventStorage_.size())));
        if (decl.isInterface) {
            machine->interface_.push_back(machine->eventStorage_.back().get());
        }
    }

    seen.clear();
    for (const auto &decl : actions_) {
        if (!seen.insert(decl.name).second) {
            failBuild(machineName_, "duplicate action '" + decl.name + "'");
        }
        machine->actionStorage_.push_back(std::unique_ptr<MethodInfo>(
            new MethodInfo(decl.name, decl.parameters, decl.returnType, machine->actionStorage_.size())));
    }

    seen.clear();
    for (const auto &decl : states_) {
        if (decl.name.empty()) {
            failBuild(machineName_, "state without a name");
        }
        if (!seen.insert(decl.name).second) {
            failBuild(machineName_, "duplicate state '" + decl.name + "'");
        }
        auto state = std::unique_ptr<StateInfo>(
            new StateInfo(decl.name, decl.parameters, decl.variables, machine->stateStorage_.size()));
        state->machine_ = machine.get();
        machine->stateStorage_.push_back(std::move(state));
    }

    // Enter/exit sub-events that were not declared explicitly get an empty signature
    for (const auto &decl : states_) {
        for (const auto &name : {enterEventName(decl.name), exitEventName(decl.name)}) {
            if (!findByName(machine->eventStorage_, name)) {
                machine->eventStorage_.push_back(
                    std::unique_ptr<MethodInfo>(new MethodInfo(name, {}, std::nullopt, machine->eventStorage_.size())));
            }
        }
    }

    // Phase 2: resolve names

    for (std::size_t i = 0; i < states_.size(); ++i) {
        const auto &decl = states_[i];
        StateInfo *state = machine->stateStorage_[i].get();

        if (!decl.parent.empty()) {
            StateInfo *parent = findByName(machine->stateStorage_, decl.parent);
            if (!parent) {
                failBuild(machineName_, "state '" + decl.name + "' has unknown parent '" + decl.parent + "'");
            }
            state->parent_ = parent;
            parent->children_.push_back(state);
        }

        for (const auto &handlerName : decl.handlers) {
            const MethodInfo *handler = findByName(machine->eventStorage_, handlerName);
            if (!handler) {
                failBuild(machineName_, "state '" + decl.name + "' handles unknown event '" + handlerName + "'");
            }
            state->handlers_.push_back(handler);
        }

        state->enterEvent_ = findByName(machine->eventStorage_, enterEventName(decl.name));
        state->exitEvent_ = findByName(machine->eventStorage_, exitEventName(decl.name));
    }

    for (const auto &state : machine->stateStorage_) {
        std::size_t depth = 0;
        for (const StateInfo *current = state->parent_; current; current = current->parent_) {
            if (++depth > machine->stateStorage_.size()) {
                failBuild(machineName_, "parent cycle through state '" + state->getName() + "'");
            }
        }
    }

    std::set<int> ids;
    for (const auto &decl : transitions_) {
        if (!ids.insert(decl.id).second) {
            failBuild(machineName_, "duplicate transition id " + std::to_string(decl.id));
        }

        const MethodInfo *event = findByName(machine->eventStorage_, decl.event);
        if (!event) {
            failBuild(machineName_,
                      "transition " + std::to_string(decl.id) + " is triggered by unknown event '" + decl.event + "'");
        }

        StateInfo *source = findByName(machine->stateStorage_, decl.source);
        if (!source) {
            failBuild(machineName_,
                      "transition " + std::to_string(decl.id) + " has unknown source '" + decl.source + "'");
        }

        StateInfo *target = nullptr;
        if (decl.stackPop) {
            if (!decl.target.empty()) {
                failBuild(machineName_, "stack-pop transition " + std::to_string(decl.id) + " names a target");
            }
        } else {
            target = findByName(machine->stateStorage_, decl.target);
            if (!target) {
                failBuild(machineName_,
                          "transition " + std::to_string(decl.id) + " has unknown target '" + decl.target + "'");
            }
        }

        auto transition = std::unique_ptr<TransitionInfo>(
            new TransitionInfo(decl.id, decl.kind, event, decl.label, source, target));
        source->outgoing_.push_back(transition.get());
        if (target) {
            target->incoming_.push_back(transition.get());
        }
        machine->transitionStorage_.push_back(std::move(transition));
    }

    for (const auto &state : machine->stateStorage_) {
        machine->states_.push_back(state.get());
    }
    for (const auto &event : machine->eventStorage_) {
        machine->events_.push_back(event.get());
    }
    for (const auto &action : machine->actionStorage_) {
        machine->actions_.push_back(action.get());
    }
    for (const auto &transition : machine->transitionStorage_) {
        machine->transitions_.push_back(transition.get());
    }

    LOG_DEBUG("Built machine info '{}': {} states, {} events, {} transitions", machineName_, machine->states_.size(),
              machine->events_.size(), machine->transitions_.size());
    return machine;
}

}  // namespace SMI
