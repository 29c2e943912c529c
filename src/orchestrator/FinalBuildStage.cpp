#include "../../include/crawl_archiver/orchestrator/FinalBuildStage.h"
#include "../../include/crawl_archiver/orchestrator/ArtifactDiscovery.h"
#include "../../include/crawl_archiver/orchestrator/RunMode.h"
#include "../../include/crawl_archiver/container/LogDrain.h"
#include "../../include/crawl_archiver/common/Constants.h"
#include "../../include/Logger.h"

namespace crawl_archiver { namespace orchestrator {

namespace fs = std::filesystem;

FinalBuildStage::FinalBuildStage(const ArchiveConfig& config,
                                 const fs::path& hostOutputDir,
                                 container::ContainerSupervisor& supervisor,
                                 state::JobState& state,
                                 const ShutdownToken& shutdown)
    : config_(config)
    , outputDir_(hostOutputDir)
    , supervisor_(supervisor)
    , state_(state)
    , shutdown_(shutdown) {
}

JobStatus FinalBuildStage::run() {
    LOG_INFO("Crawl/Resume phase successful. Proceeding to final WARC consolidation stage.");

    if (config_.relaxPerms) {
        supervisor_.runtime().relaxPermissions(outputDir_);
    }

    std::vector<fs::path> tempDirs = state_.tempDirs();
    LOG_INFO("Searching for WARC files in " + std::to_string(tempDirs.size()) + " tracked temp dir(s)...");
    std::vector<fs::path> warcs = ArtifactDiscovery::findAllWarcFiles(tempDirs);
    if (warcs.empty()) {
        LOG_ERROR("No WARC files found in any tracked temp directories. Cannot perform final build.");
        state_.setStatus(jobStatusName(JobStatus::FailedNoArtifacts));
        return JobStatus::FailedNoArtifacts;
    }
    LOG_INFO("Found " + std::to_string(warcs.size()) + " WARC file(s) for final build.");

    std::string warcList;
    for (const auto& warc : warcs) {
        auto containerPath = ArtifactDiscovery::hostToContainerPath(warc, outputDir_);
        if (!containerPath) {
            LOG_ERROR("Failed to convert WARC path to container path: " + warc.string());
            state_.setStatus(jobStatusName(JobStatus::FailedPathConversion));
            return JobStatus::FailedPathConversion;
        }
        if (!warcList.empty()) {
            warcList += ",";
        }
        warcList += *containerPath;
    }

    std::vector<std::string> baseArgs = container::ContainerSupervisor::filterArgsForFinalBuild(config_.passthroughArgs);
    std::vector<std::string> args = container::ContainerSupervisor::buildArgs(
        baseArgs, {{}, config_.name}, state_.currentWorkers(), true, {"--warcs", warcList});

    state_.resetForNewAttempt(FINAL_BUILD_STAGE_NAME);
    LOG_INFO("--- Starting Stage: " + FINAL_BUILD_STAGE_NAME + " ---");
    auto startedAt = state::Clock::now();

    auto started = supervisor_.start(outputDir_, args, config_.name);
    if (!started) {
        LOG_ERROR("Failed to start container for stage '" + FINAL_BUILD_STAGE_NAME + "'.");
        state_.setStatus(jobStatusName(JobStatus::Failed));
        return JobStatus::Failed;
    }

    container::StageLogPaths paths = container::LogDrain::makePaths(outputDir_, FINAL_BUILD_STAGE_NAME);
    LOG_INFO("Final build logs: " + paths.combinedLog.string());
    container::LogDrain drain(started->process, paths, FINAL_BUILD_STAGE_NAME, !config_.enableMonitoring);

    std::optional<int> exitCode;
    while (!exitCode) {
        exitCode = started->process->wait(config_.eventPollInterval);
        if (!exitCode && shutdown_.isStopRequested()) {
            LOG_WARNING("Stop requested during final build.");
            drain.stop(constants::LOG_DRAIN_JOIN_GRACE);
            supervisor_.clearCurrent();
            state_.setStatus(jobStatusName(JobStatus::Stopped));
            return JobStatus::Stopped;
        }
    }

    if (!drain.stop(constants::LOG_DRAIN_JOIN_GRACE)) {
        LOG_WARNING("Log drain for the final build did not finish cleanly.");
    }
    supervisor_.clearCurrent();

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(state::Clock::now() - startedAt);
    LOG_INFO("Stage '" + FINAL_BUILD_STAGE_NAME + "' finished in " + std::to_string(elapsed.count()) +
             "s with exit code " + std::to_string(*exitCode) + ".");

    if (auto tempDir = ArtifactDiscovery::parseTempDirFromLog(paths.combinedLog, outputDir_)) {
        LOG_INFO("Tracking temp directory from final build: " + tempDir->string());
        state_.addTempDir(*tempDir);
    }

    if (*exitCode != 0) {
        LOG_ERROR("Final build failed (exit code " + std::to_string(*exitCode) + "). Check logs: " +
                  paths.combinedLog.string());
        state_.setStatus(jobStatusName(JobStatus::Failed));
        return JobStatus::Failed;
    }

    fs::path artifact = config_.finalArtifactPath();
    std::error_code ec;
    if (fs::exists(artifact, ec)) {
        LOG_INFO("Final ZIM file created: " + artifact.string() + " (" +
                 std::to_string(fs::file_size(artifact, ec)) + " bytes)");
    } else {
        LOG_WARNING("Final build exited successfully but the expected ZIM file is missing: " + artifact.string());
    }
    state_.setStatus(jobStatusName(JobStatus::Success));
    return JobStatus::Success;
}

} } // namespace crawl_archiver::orchestrator
