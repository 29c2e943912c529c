#pragma once

#include <filesystem>
#include "JobStatus.h"
#include "../common/ShutdownToken.h"
#include "../container/ContainerSupervisor.h"
#include "../models/ArchiveConfig.h"
#include "../state/JobState.h"

namespace crawl_archiver { namespace orchestrator {

/**
 * Merges every WARC the job has produced into the final artifact. Runs the
 * crawler once more without monitoring and waits for it synchronously.
 */
class FinalBuildStage {
public:
    FinalBuildStage(const ArchiveConfig& config,
                    const std::filesystem::path& hostOutputDir,
                    container::ContainerSupervisor& supervisor,
                    state::JobState& state,
                    const ShutdownToken& shutdown);

    /**
     * @return Success only if the build exited 0; FailedNoArtifacts when no
     *         WARC exists (nothing is started); FailedPathConversion when a WARC
     *         cannot be mapped into the container
     */
    JobStatus run();

private:
    const ArchiveConfig& config_;
    std::filesystem::path outputDir_;
    container::ContainerSupervisor& supervisor_;
    state::JobState& state_;
    const ShutdownToken& shutdown_;
};

} } // namespace crawl_archiver::orchestrator
