#pragma once

#include "AdaptationStrategy.h"
#include "../models/ArchiveConfig.h"
#include "../state/JobState.h"

namespace crawl_archiver { namespace strategy {

// Restarts the crawl unchanged; only considered for stalls
class ContainerRestartStrategy : public AdaptationStrategy {
public:
    ContainerRestartStrategy(state::JobState& state, const AdaptationSettings& settings);

    std::string name() const override { return "Container Restart"; }
    bool attempt(const monitor::MonitorEvent& event) override;
    bool requiresRestart() const override { return true; }

private:
    state::JobState& state_;
    AdaptationSettings settings_;
};

} } // namespace crawl_archiver::strategy
