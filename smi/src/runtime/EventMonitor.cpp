#include "runtime/EventMonitor.h"
#include "common/Logger.h"

namespace SMI {

namespace {

template <typename Entry> void evictToCapacity(std::deque<Entry> &history, std::optional<std::size_t> capacity) {
    if (!capacity.has_value()) {
        return;
    }
    while (history.size() > *capacity) {
        history.pop_front();
    }
}

template <typename Entry>
void pushBounded(std::deque<Entry> &history, Entry entry, std::optional<std::size_t> capacity) {
    if (capacity.has_value() && *capacity == 0) {
        return;
    }
    history.push_back(std::move(entry));
    evictToCapacity(history, capacity);
}

}  // namespace

boost::signals2::connection EventMonitor::addEventSentCallback(EventCallback callback) {
    return eventSentSignal_.connect(std::move(callback));
}

boost::signals2::connection EventMonitor::addEventHandledCallback(EventCallback callback) {
    return eventHandledSignal_.connect(std::move(callback));
}

boost::signals2::connection EventMonitor::addTransitionCallback(TransitionCallback callback) {
    return transitionSignal_.connect(std::move(callback));
}

void EventMonitor::eventSent(std::shared_ptr<const MethodInstance> event) {
    eventSentSignal_(std::move(event));
}

void EventMonitor::eventHandled(std::shared_ptr<const MethodInstance> event) {
    pushBounded(eventHistory_, event, eventCapacity_);
    eventHandledSignal_(std::move(event));
}

void EventMonitor::transitionOccurred(const TransitionInstance &transition) {
    pushBounded(transitionHistory_, transition, transitionCapacity_);
    transitionSignal_(transition);
}

void EventMonitor::setEventHistoryCapacity(std::optional<std::size_t> capacity) {
    LOG_DEBUG("Event history capacity: {} -> {}", eventCapacity_ ? std::to_string(*eventCapacity_) : "unbounded",
              capacity ? std::to_string(*capacity) : "unbounded");
    eventCapacity_ = capacity;
    evictToCapacity(eventHistory_, eventCapacity_);
}

void EventMonitor::setTransitionHistoryCapacity(std::optional<std::size_t> capacity) {
    LOG_DEBUG("Transition history capacity: {} -> {}",
              transitionCapacity_ ? std::to_string(*transitionCapacity_) : "unbounded",
              capacity ? std::to_string(*capacity) : "unbounded");
    transitionCapacity_ = capacity;
    evictToCapacity(transitionHistory_, transitionCapacity_);
}

}  // namespace SMI
