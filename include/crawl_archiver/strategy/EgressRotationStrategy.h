#pragma once

#include "AdaptationStrategy.h"
#include "../common/ShutdownToken.h"
#include "../container/ChildProcess.h"
#include "../models/ArchiveConfig.h"
#include "../state/JobState.h"

namespace crawl_archiver { namespace strategy {

/**
 * Rotates the host's network egress (VPN reconnect) while the container keeps
 * running. Limited by a total cap and a minimum interval between rotations.
 */
class EgressRotationStrategy : public AdaptationStrategy {
public:
    /**
     * @param state Job state receiving the rotation count and timestamp
     * @param settings Connect command, cap, frequency and settle delay
     * @param shutdown Interrupts the settle delay
     * @param runner Command executor, replaceable in tests
     */
    EgressRotationStrategy(state::JobState& state,
                           const AdaptationSettings& settings,
                           const ShutdownToken& shutdown,
                           container::CommandRunner runner = container::runCommand);

    std::string name() const override { return "VPN Rotation"; }
    bool attempt(const monitor::MonitorEvent& event) override;
    bool requiresRestart() const override { return false; }

    // Resolve `program` against PATH unless it already contains a slash
    static bool isExecutableAvailable(const std::string& program);

private:
    state::JobState& state_;
    AdaptationSettings settings_;
    const ShutdownToken& shutdown_;
    container::CommandRunner runner_;
};

} } // namespace crawl_archiver::strategy
