#include "../../include/crawl_archiver/strategy/ContainerRestartStrategy.h"
#include "../../include/Logger.h"

namespace crawl_archiver { namespace strategy {

ContainerRestartStrategy::ContainerRestartStrategy(state::JobState& state, const AdaptationSettings& settings)
    : state_(state), settings_(settings) {
}

bool ContainerRestartStrategy::attempt(const monitor::MonitorEvent& event) {
    if (!settings_.enableAdaptiveRestart) {
        LOG_DEBUG("Adaptive restart strategy disabled.");
        return false;
    }
    if (event.type != monitor::MonitorEvent::Type::Stalled) {
        LOG_DEBUG("Adaptive restart only applies to stalls, got " + monitor::eventTypeName(event.type));
        return false;
    }
    if (settings_.maxContainerRestarts <= 0) {
        LOG_INFO("Adaptive restart: max container restarts is 0; restart skipped.");
        return false;
    }

    int restarts = state_.containerRestartsDone();
    if (restarts >= settings_.maxContainerRestarts) {
        LOG_WARNING("Adaptive restart: max restarts (" + std::to_string(settings_.maxContainerRestarts) +
                    ") already performed for this run.");
        return false;
    }

    LOG_WARNING("Attempting adaptive container restart...");
    state_.recordContainerRestart();
    LOG_INFO("Container restart requested (count: " + std::to_string(state_.containerRestartsDone()) + "/" +
             std::to_string(settings_.maxContainerRestarts) + ").");
    return true;
}

} } // namespace crawl_archiver::strategy
