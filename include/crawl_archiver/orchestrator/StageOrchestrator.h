#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "JobStatus.h"
#include "RunMode.h"
#include "../common/ShutdownToken.h"
#include "../container/ContainerRuntime.h"
#include "../container/ContainerSupervisor.h"
#include "../container/LogDrain.h"
#include "../models/ArchiveConfig.h"
#include "../monitor/EventChannel.h"
#include "../monitor/ProgressMonitor.h"
#include "../state/JobState.h"
#include "../strategy/AdaptationEngine.h"

namespace crawl_archiver { namespace orchestrator {

// Whether a crawler exit code means the crawl completed (0 or a soft limit)
bool isSuccessfulExitCode(int exitCode);

/**
 * Drives one job from start to finish: chooses the run mode, runs crawl
 * stage attempts under supervision, reacts to monitor events, retries with
 * backoff, then runs the final build and cleans up.
 */
class StageOrchestrator {
public:
    StageOrchestrator(ArchiveConfig config,
                      std::shared_ptr<container::ContainerRuntime> runtime,
                      const ShutdownToken& shutdown,
                      container::CommandRunner commandRunner = container::runCommand);

    StageOrchestrator(const StageOrchestrator&) = delete;
    StageOrchestrator& operator=(const StageOrchestrator&) = delete;

    /**
     * Run the job.
     * @return Overall status
     * @throws FatalError when the runtime is unavailable, the output directory
     *         is unusable, or the final artifact exists without --overwrite
     */
    JobStatus run();

    // Used by the signal thread for the emergency stop
    container::ContainerSupervisor& supervisor() { return supervisor_; }

    // Valid once run() has started
    state::JobState* state() { return state_.get(); }

private:
    void prepare();
    JobStatus runCrawlStages(RunMode initialMode);
    StageOutcome runAttempt(const std::string& stageName, int attempt, const std::vector<std::string>& extraArgs);
    StageOutcome superviseAttempt(container::StartResult& started,
                                  monitor::ProgressMonitor* progressMonitor,
                                  const std::string& displayName,
                                  const std::filesystem::path& combinedLog);
    std::optional<StageOutcome> handleEvent(const monitor::MonitorEvent& event, container::StartResult& started);
    StageOutcome classifyExit(int exitCode, const std::string& displayName, const std::filesystem::path& combinedLog);
    void recordAttemptTempDir(const container::StageLogPaths& paths);

    // Sleep for the configured backoff; false if a stop was requested meanwhile
    bool applyBackoff(const std::string& reason);

    void printStatus(const std::string& displayName, state::Clock::time_point stageStart);
    void finish(JobStatus status);

    ArchiveConfig config_;
    std::filesystem::path outputDir_;
    std::shared_ptr<container::ContainerRuntime> runtime_;
    const ShutdownToken& shutdown_;
    container::CommandRunner commandRunner_;
    container::ContainerSupervisor supervisor_;
    monitor::EventChannel events_;

    std::unique_ptr<state::JobState> state_;
    std::unique_ptr<strategy::AdaptationEngine> engine_;
    state::Clock::time_point startedAt_;
    std::filesystem::path lastCombinedLog_;
};

} } // namespace crawl_archiver::orchestrator
