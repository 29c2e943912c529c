#pragma once

#include <memory>
#include <vector>
#include "AdaptationStrategy.h"
#include "../common/ShutdownToken.h"
#include "../container/ChildProcess.h"
#include "../models/ArchiveConfig.h"
#include "../state/JobState.h"

namespace crawl_archiver { namespace strategy {

enum class AdaptationOutcome {
    None,             // nothing applied; caller backs off
    ContinueLive,     // applied against the running container
    RestartRequired   // applied; the container must be stopped and the crawl resumed
};

std::string adaptationOutcomeName(AdaptationOutcome outcome);

/**
 * Tries the registered strategies in priority order and stops at the first
 * one that succeeds. A strategy that throws is logged and treated as skipped.
 */
class AdaptationEngine {
public:
    AdaptationEngine() = default;

    AdaptationEngine(const AdaptationEngine&) = delete;
    AdaptationEngine& operator=(const AdaptationEngine&) = delete;

    void addStrategy(std::unique_ptr<AdaptationStrategy> strategy);

    AdaptationOutcome handle(const monitor::MonitorEvent& event);

    size_t strategyCount() const { return strategies_.size(); }

    /**
     * Engine with the strategies enabled in `settings`, in the order worker
     * reduction, egress rotation, container restart.
     */
    static std::unique_ptr<AdaptationEngine> fromSettings(state::JobState& state,
                                                          const AdaptationSettings& settings,
                                                          const ShutdownToken& shutdown,
                                                          container::CommandRunner runner = container::runCommand);

private:
    std::vector<std::unique_ptr<AdaptationStrategy>> strategies_;
};

} } // namespace crawl_archiver::strategy
