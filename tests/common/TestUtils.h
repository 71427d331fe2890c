#pragma once

#include "runtime/EventMonitor.h"
#include <memory>
#include <string>
#include <vector>

namespace SMI {
namespace Test {
namespace Utils {

inline std::vector<std::string> eventNames(const EventMonitor::EventHistory &history) {
    std::vector<std::string> names;
    for (const auto &event : history) {
        names.push_back(event->getInfo().getName());
    }
    return names;
}

inline std::vector<std::string> transitionStrings(const EventMonitor::TransitionHistory &history) {
    std::vector<std::string> result;
    for (const auto &transition : history) {
        result.push_back(transition.toString());
    }
    return result;
}

/**
 * @brief Records the three notification streams of an EventMonitor as strings
 *
 * Event notifications are recorded by event name, transitions by
 * TransitionInstance::toString(). When interleaved is set, transitions are
 * also appended to both event streams so relative ordering can be checked.
 */
class StreamRecorder {
public:
    explicit StreamRecorder(EventMonitor &monitor, bool interleaved = false) {
        monitor.addEventSentCallback(
            [this](std::shared_ptr<const MethodInstance> e) { sent.push_back(e->getInfo().getName()); });
        monitor.addEventHandledCallback(
            [this](std::shared_ptr<const MethodInstance> e) { handled.push_back(e->getInfo().getName()); });
        monitor.addTransitionCallback([this, interleaved](const TransitionInstance &t) {
            transitions.push_back(t.toString());
            if (interleaved) {
                sent.push_back(t.toString());
                handled.push_back(t.toString());
            }
        });
    }

    void clear() {
        sent.clear();
        handled.clear();
        transitions.clear();
    }

    std::vector<std::string> sent;
    std::vector<std::string> handled;
    std::vector<std::string> transitions;
};

}  // namespace Utils
}  // namespace Test
}  // namespace SMI
