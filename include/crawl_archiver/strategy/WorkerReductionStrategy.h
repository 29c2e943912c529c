#pragma once

#include "AdaptationStrategy.h"
#include "../models/ArchiveConfig.h"
#include "../state/JobState.h"

namespace crawl_archiver { namespace strategy {

// Drops one crawler worker per attempt, down to the configured floor
class WorkerReductionStrategy : public AdaptationStrategy {
public:
    WorkerReductionStrategy(state::JobState& state, const AdaptationSettings& settings);

    std::string name() const override { return "Worker Reduction"; }
    bool attempt(const monitor::MonitorEvent& event) override;
    bool requiresRestart() const override { return true; }

private:
    state::JobState& state_;
    AdaptationSettings settings_;
};

} } // namespace crawl_archiver::strategy
