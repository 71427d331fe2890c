#include "Turnstile.h"
#include "common/Logger.h"
#include "env/Environment.h"

using SMI::Generated::turnstile::Turnstile;

int main(int argc, char *argv[]) {
    // Optional log directory as first argument
    if (argc > 1) {
        SMI::Logger::initialize(argv[1]);
    } else {
        SMI::Logger::initialize();
    }
    // Keep the engine's debug chatter out of the walkthrough
    SMI::Logger::setLevel(spdlog::level::info);

    Turnstile turnstile;
    auto &monitor = turnstile.getEventMonitor();

    monitor.addEventSentCallback([](std::shared_ptr<const SMI::MethodInstance> event) {
        LOG_INFO("sent    {} {}", event->getInfo().getName(), SMI::toString(event->getArguments()));
    });
    monitor.addEventHandledCallback([](std::shared_ptr<const SMI::MethodInstance> event) {
        auto result = event->getReturnValue();
        LOG_INFO("handled {}{}", event->getInfo().getName(), result ? " -> " + SMI::toString(*result) : "");
    });
    monitor.addTransitionCallback([](const SMI::TransitionInstance &transition) {
        const auto &label = transition.getInfo().getLabel();
        LOG_INFO("transition #{} {}{}", transition.getInfo().getId(), transition.toString(),
                 label.empty() ? "" : " [" + label + "]");
    });

    turnstile.coin(20);
    turnstile.coin(50);
    turnstile.pass();
    turnstile.pass();
    turnstile.reset();

    LOG_INFO("Final state {}, domain {}", turnstile.getCurrentState().getInfo().getName(),
             SMI::toString(turnstile.getDomainVariables()));
    LOG_INFO("Event history holds {} entries, {} transitions",
             turnstile.getEventMonitor().getEventHistory().size(),
             turnstile.getEventMonitor().getTransitionHistory().size());
    return 0;
}
