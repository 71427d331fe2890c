#pragma once

#include "live/MethodInstance.h"
#include "live/TransitionInstance.h"
#include <boost/signals2.hpp>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>

namespace SMI {

/**
 * @brief Per-machine event and transition observer
 *
 * Records handled events and occurred transitions in two bounded histories
 * and notifies three ordered callback lists. A capacity of std::nullopt keeps
 * everything, 0 disables recording, N keeps the N most recent entries.
 *
 * Callbacks run synchronously in registration order before the notifying
 * call returns. The returned connection disconnects a callback.
 *
 * @code
 * machine.getEventMonitor().addTransitionCallback([](const SMI::TransitionInstance &t) {
 *     LOG_INFO("{}", t.toString());
 * });
 * machine.getEventMonitor().addEventHandledCallback([&kept](std::shared_ptr<const SMI::MethodInstance> e) {
 *     kept.push_back(std::move(e));
 * });
 * @endcode
 */
class EventMonitor {
public:
    // Callbacks share ownership of the event and may keep it
    using EventCallback = std::function<void(std::shared_ptr<const MethodInstance>)>;
    using TransitionCallback = std::function<void(const TransitionInstance &)>;
    using EventHistory = std::deque<std::shared_ptr<const MethodInstance>>;
    using TransitionHistory = std::deque<TransitionInstance>;

    // No event history, only the last transition
    EventMonitor() : EventMonitor(0, 1) {}

    EventMonitor(std::optional<std::size_t> eventCapacity, std::optional<std::size_t> transitionCapacity)
        : eventCapacity_(eventCapacity), transitionCapacity_(transitionCapacity) {}

    EventMonitor(const EventMonitor &) = delete;
    EventMonitor &operator=(const EventMonitor &) = delete;

    boost::signals2::connection addEventSentCallback(EventCallback callback);
    boost::signals2::connection addEventHandledCallback(EventCallback callback);
    boost::signals2::connection addTransitionCallback(TransitionCallback callback);

    // Notifies only, the event is recorded once it has been handled
    void eventSent(std::shared_ptr<const MethodInstance> event);

    void eventHandled(std::shared_ptr<const MethodInstance> event);

    void transitionOccurred(const TransitionInstance &transition);

    // Oldest first
    const EventHistory &getEventHistory() const {
        return eventHistory_;
    }

    // Oldest first
    const TransitionHistory &getTransitionHistory() const {
        return transitionHistory_;
    }

    /**
     * @brief Most recent recorded transition
     * @return nullptr if nothing is recorded. The pointer is valid only until
     *         the next transition, clear or capacity change; copy the
     *         TransitionInstance to keep it longer.
     */
    const TransitionInstance *getLastTransition() const {
        return transitionHistory_.empty() ? nullptr : &transitionHistory_.back();
    }

    void clearEventHistory() {
        eventHistory_.clear();
    }

    void clearTransitionHistory() {
        transitionHistory_.clear();
    }

    std::optional<std::size_t> getEventHistoryCapacity() const {
        return eventCapacity_;
    }

    std::optional<std::size_t> getTransitionHistoryCapacity() const {
        return transitionCapacity_;
    }

    /**
     * @brief Change the event history bound
     *
     * Lowering the bound drops the oldest entries right away. Raising it or
     * passing std::nullopt never drops anything.
     */
    void setEventHistoryCapacity(std::optional<std::size_t> capacity);

    void setTransitionHistoryCapacity(std::optional<std::size_t> capacity);

private:
    std::optional<std::size_t> eventCapacity_;
    std::optional<std::size_t> transitionCapacity_;
    EventHistory eventHistory_;
    TransitionHistory transitionHistory_;

    boost::signals2::signal<void(std::shared_ptr<const MethodInstance>)> eventSentSignal_;
    boost::signals2::signal<void(std::shared_ptr<const MethodInstance>)> eventHandledSignal_;
    boost::signals2::signal<void(const TransitionInstance &)> transitionSignal_;
};

}  // namespace SMI
