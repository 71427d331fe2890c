#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace SMI {

class MachineInfo;
class MachineInfoBuilder;
class StateInfo;
class TransitionInfo;

/**
 * @brief Name and declared type of a parameter or variable
 *
 * The type is the type name as written in the machine description and may be
 * empty when the description leaves it out.
 */
struct NameInfo {
    std::string name;
    std::string type;

    bool operator==(const NameInfo &) const = default;
};

/**
 * @brief Kind of state change
 *
 * Transition runs exit/enter sub-events, ChangeState bypasses them.
 */
enum class TransitionKind { Transition, ChangeState };

const char *toString(TransitionKind kind);

/**
 * @brief Static descriptor of an event or action signature
 */
class MethodInfo {
public:
    const std::string &getName() const {
        return name_;
    }

    const std::vector<NameInfo> &getParameters() const {
        return parameters_;
    }

    const std::optional<std::string> &getReturnType() const {
        return returnType_;
    }

    /**
     * @brief Position in the machine's event list (or action list for actions)
     */
    std::size_t getIndex() const {
        return index_;
    }

    const NameInfo *getParameter(const std::string &name) const;

private:
    friend class MachineInfoBuilder;

    MethodInfo(std::string name, std::vector<NameInfo> parameters, std::optional<std::string> returnType,
               std::size_t index)
        : name_(std::move(name)), parameters_(std::move(parameters)), returnType_(std::move(returnType)),
          index_(index) {}

    std::string name_;
    std::vector<NameInfo> parameters_;
    std::optional<std::string> returnType_;
    std::size_t index_;
};

/**
 * @brief Static descriptor of one declared state
 *
 * Links to parent, children, handlers and transitions are resolved when the
 * owning MachineInfo is built, so a StateInfo is only ever observed complete.
 */
class StateInfo {
public:
    const std::string &getName() const {
        return name_;
    }

    const MachineInfo &getMachine() const {
        return *machine_;
    }

    // nullptr for top-level states
    const StateInfo *getParent() const {
        return parent_;
    }

    const std::vector<const StateInfo *> &getChildren() const {
        return children_;
    }

    const std::vector<NameInfo> &getParameters() const {
        return parameters_;
    }

    const std::vector<NameInfo> &getVariables() const {
        return variables_;
    }

    const std::vector<const MethodInfo *> &getHandlers() const {
        return handlers_;
    }

    const MethodInfo *getHandler(const std::string &eventName) const;

    bool handles(const std::string &eventName) const {
        return getHandler(eventName) != nullptr;
    }

    // Sub-event delivered when the state is entered ("<name>:>")
    const MethodInfo &getEnterEvent() const {
        return *enterEvent_;
    }

    // Sub-event delivered when the state is left ("<name>:<")
    const MethodInfo &getExitEvent() const {
        return *exitEvent_;
    }

    const std::vector<const TransitionInfo *> &getOutgoingTransitions() const {
        return outgoing_;
    }

    // Stack-pop transitions have no static target and never appear here
    const std::vector<const TransitionInfo *> &getIncomingTransitions() const {
        return incoming_;
    }

    std::size_t getIndex() const {
        return index_;
    }

    bool isDescendantOf(const StateInfo &ancestor) const;

private:
    friend class MachineInfoBuilder;

    StateInfo(std::string name, std::vector<NameInfo> parameters, std::vector<NameInfo> variables, std::size_t index)
        : name_(std::move(name)), parameters_(std::move(parameters)), variables_(std::move(variables)),
          index_(index) {}

    std::string name_;
    const MachineInfo *machine_ = nullptr;
    const StateInfo *parent_ = nullptr;
    std::vector<const StateInfo *> children_;
    std::vector<NameInfo> parameters_;
    std::vector<NameInfo> variables_;
    std::vector<const MethodInfo *> handlers_;
    const MethodInfo *enterEvent_ = nullptr;
    const MethodInfo *exitEvent_ = nullptr;
    std::vector<const TransitionInfo *> outgoing_;
    std::vector<const TransitionInfo *> incoming_;
    std::size_t index_;
};

/**
 * @brief Static descriptor of one transition or change-state site
 *
 * Ids are assigned when the machine is generated and stay stable across runs.
 * A stack-pop site has no static target: the destination is the state stack
 * top at dispatch time.
 */
class TransitionInfo {
public:
    int getId() const {
        return id_;
    }

    TransitionKind getKind() const {
        return kind_;
    }

    const MethodInfo &getEvent() const {
        return *event_;
    }

    const std::string &getLabel() const {
        return label_;
    }

    const StateInfo &getSource() const {
        return *source_;
    }

    // nullptr iff isStackPop()
    const StateInfo *getTarget() const {
        return target_;
    }

    bool isStackPop() const {
        return target_ == nullptr;
    }

private:
    friend class MachineInfoBuilder;

    TransitionInfo(int id, TransitionKind kind, const MethodInfo *event, std::string label, const StateInfo *source,
                   const StateInfo *target)
        : id_(id), kind_(kind), event_(event), label_(std::move(label)), source_(source), target_(target) {}

    int id_;
    TransitionKind kind_;
    const MethodInfo *event_;
    std::string label_;
    const StateInfo *source_;
    const StateInfo *target_;
};

/**
 * @brief Static descriptor of a whole machine type
 *
 * Built once per machine type by generated code and shared by every instance:
 *
 * @code
 * static const SMI::MachineInfo &machineInfo() {
 *     static const auto info = SMI::MachineInfo::Builder("Turnstile")
 *                                  .interfaceEvent("coin")
 *                                  .state({.name = "Locked", .handlers = {"coin"}})
 *                                  .state({.name = "Unlocked"})
 *                                  .transition({.id = 0, .event = "coin", .source = "Locked", .target = "Unlocked"})
 *                                  .build();
 *     return *info;
 * }
 * @endcode
 */
class MachineInfo {
public:
    using Builder = MachineInfoBuilder;

    MachineInfo(const MachineInfo &) = delete;
    MachineInfo &operator=(const MachineInfo &) = delete;

    const std::string &getName() const {
        return name_;
    }

    const std::vector<NameInfo> &getDomainVariables() const {
        return domainVariables_;
    }

    const std::vector<const StateInfo *> &getStates() const {
        return states_;
    }

    // Declared events followed by any enter/exit sub-events the builder added
    const std::vector<const MethodInfo *> &getEvents() const {
        return events_;
    }

    const std::vector<const MethodInfo *> &getActions() const {
        return actions_;
    }

    const std::vector<const TransitionInfo *> &getTransitions() const {
        return transitions_;
    }

    // Events callable from outside the machine
    const std::vector<const MethodInfo *> &getInterface() const {
        return interface_;
    }

    // First declared state
    const StateInfo &getInitialState() const {
        return *states_.front();
    }

    const StateInfo *getState(const std::string &name) const;
    const MethodInfo *getEvent(const std::string &name) const;
    const MethodInfo *getAction(const std::string &name) const;
    const TransitionInfo *getTransition(int id) const;

private:
    friend class MachineInfoBuilder;

    explicit MachineInfo(std::string name) : name_(std::move(name)) {}

    std::string name_;
    std::vector<NameInfo> domainVariables_;

    std::vector<std::unique_ptr<StateInfo>> stateStorage_;
    std::vector<std::unique_ptr<MethodInfo>> eventStorage_;
    std::vector<std::unique_ptr<MethodInfo>> actionStorage_;
    std::vector<std::unique_ptr<TransitionInfo>> transitionStorage_;

    std::vector<const StateInfo *> states_;
    std::vector<const MethodInfo *> events_;
    std::vector<const MethodInfo *> actions_;
    std::vector<const TransitionInfo *> transitions_;
    std::vector<const MethodInfo *> interface_;
};

/**
 * @brief Two-phase construction of a MachineInfo
 *
 * Declarations refer to each other by name. build() creates every descriptor
 * first, then resolves names to pointers (parent, handlers, transition ends,
 * back-reference to the machine), so declaration order does not matter.
 */
class MachineInfoBuilder {
public:
    struct StateDecl {
        std::string name;
        std::string parent;
        std::vector<NameInfo> parameters;
        std::vector<NameInfo> variables;
        std::vector<std::string> handlers;
    };

    struct TransitionDecl {
        int id = 0;
        TransitionKind kind = TransitionKind::Transition;
        std::string event;
        std::string label;
        std::string source;
        std::string target;  // empty for stack-pop sites
        bool stackPop = false;
    };

    explicit MachineInfoBuilder(std::string machineName);

    MachineInfoBuilder &domainVariable(std::string name, std::string type = "");

    // Event that is also part of the machine's public interface
    MachineInfoBuilder &interfaceEvent(std::string name, std::vector<NameInfo> parameters = {},
                                       std::optional<std::string> returnType = std::nullopt);

    // Event handled by states but not exposed, including "<State>:>" / "<State>:<" sub-events
    MachineInfoBuilder &event(std::string name, std::vector<NameInfo> parameters = {},
                              std::optional<std::string> returnType = std::nullopt);

    MachineInfoBuilder &action(std::string name, std::vector<NameInfo> parameters = {},
                               std::optional<std::string> returnType = std::nullopt);

    MachineInfoBuilder &state(StateDecl decl);
    MachineInfoBuilder &transition(TransitionDecl decl);

    /**
     * @brief Create the immutable MachineInfo
     * @throws std::invalid_argument on unknown or duplicate names, parent
     *         cycles, duplicate transition ids or a machine without states
     */
    std::unique_ptr<const MachineInfo> build() const;

    static std::string enterEventName(const std::string &stateName) {
        return stateName + ":>";
    }

    static std::string exitEventName(const std::string &stateName) {
        return stateName + ":<";
    }

private:
    struct MethodDecl {
        std::string name;
        std::vector<NameInfo> parameters;
        std::optional<std::string> returnType;
        bool isInterface = false;
    };

    std::string machineName_;
    std::vector<NameInfo> domainVariables_;
    std::vector<MethodDecl> events_;
    std::vector<MethodDecl> actions_;
    std::vector<StateDecl> states_;
    std::vector<TransitionDecl> transitions_;
};

}  // namespace SMI
