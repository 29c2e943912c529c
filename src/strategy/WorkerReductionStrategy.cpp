#include "../../include/crawl_archiver/strategy/WorkerReductionStrategy.h"
#include "../../include/Logger.h"

namespace crawl_archiver { namespace strategy {

WorkerReductionStrategy::WorkerReductionStrategy(state::JobState& state, const AdaptationSettings& settings)
    : state_(state), settings_(settings) {
}

bool WorkerReductionStrategy::attempt(const monitor::MonitorEvent&) {
    if (!settings_.enableAdaptiveWorkers) {
        LOG_DEBUG("Adaptive workers strategy disabled.");
        return false;
    }

    int reductions = state_.workerReductionsDone();
    if (reductions >= settings_.maxWorkerReductions) {
        LOG_WARNING("Adaptive workers: max reductions (" + std::to_string(settings_.maxWorkerReductions) +
                    ") already performed.");
        return false;
    }

    if (state_.currentWorkers() <= settings_.minWorkers) {
        LOG_INFO("Adaptive workers: already at minimum workers (" + std::to_string(settings_.minWorkers) +
                 "). Cannot reduce further.");
        return false;
    }

    LOG_WARNING("Attempting adaptive worker reduction...");
    if (!state_.reduceWorkers(settings_.minWorkers)) {
        return false;
    }

    LOG_INFO("Worker count is now " + std::to_string(state_.currentWorkers()) + " (reduction " +
             std::to_string(state_.workerReductionsDone()) + "/" +
             std::to_string(settings_.maxWorkerReductions) + "). The crawl will resume with it.");
    return true;
}

} } // namespace crawl_archiver::strategy
