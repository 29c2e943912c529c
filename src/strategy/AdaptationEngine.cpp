#include "../../include/crawl_archiver/strategy/AdaptationEngine.h"
#include "../../include/crawl_archiver/strategy/ContainerRestartStrategy.h"
#include "../../include/crawl_archiver/strategy/EgressRotationStrategy.h"
#include "../../include/crawl_archiver/strategy/WorkerReductionStrategy.h"
#include "../../include/Logger.h"

namespace crawl_archiver { namespace strategy {

std::string adaptationOutcomeName(AdaptationOutcome outcome) {
    switch (outcome) {
        case AdaptationOutcome::None: return "none";
        case AdaptationOutcome::ContinueLive: return "continue_live";
        case AdaptationOutcome::RestartRequired: return "restart_required";
    }
    return "none";
}

void AdaptationEngine::addStrategy(std::unique_ptr<AdaptationStrategy> strategy) {
    if (strategy) {
        strategies_.push_back(std::move(strategy));
    }
}

AdaptationOutcome AdaptationEngine::handle(const monitor::MonitorEvent& event) {
    if (event.type == monitor::MonitorEvent::Type::Progress) {
        return AdaptationOutcome::None;
    }

    LOG_INFO("Attempting adaptive strategies...");
    for (const auto& strategy : strategies_) {
        LOG_INFO("Attempting strategy: " + strategy->name());
        bool applied = false;
        try {
            applied = strategy->attempt(event);
        } catch (const std::exception& e) {
            LOG_ERROR("Error during " + strategy->name() + " strategy: " + e.what());
            continue;
        }

        if (applied) {
            LOG_INFO(strategy->name() + " strategy SUCCESSFUL.");
            return strategy->requiresRestart() ? AdaptationOutcome::RestartRequired
                                               : AdaptationOutcome::ContinueLive;
        }
        LOG_INFO(strategy->name() + " strategy skipped or not applicable.");
    }

    LOG_WARNING("No adaptation strategy successfully executed or applicable for this condition.");
    return AdaptationOutcome::None;
}

std::unique_ptr<AdaptationEngine> AdaptationEngine::fromSettings(state::JobState& state,
                                                                 const AdaptationSettings& settings,
                                                                 const ShutdownToken& shutdown,
                                                                 container::CommandRunner runner) {
    auto engine = std::make_unique<AdaptationEngine>();
    if (settings.enableAdaptiveWorkers) {
        engine->addStrategy(std::make_unique<WorkerReductionStrategy>(state, settings));
    }
    if (settings.enableVpnRotation) {
        engine->addStrategy(std::make_unique<EgressRotationStrategy>(state, settings, shutdown, std::move(runner)));
    }
    if (settings.enableAdaptiveRestart) {
        engine->addStrategy(std::make_unique<ContainerRestartStrategy>(state, settings));
    }
    return engine;
}

} } // namespace crawl_archiver::strategy
