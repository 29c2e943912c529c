#include "../../include/crawl_archiver/orchestrator/StageOrchestrator.h"
#include "../../include/crawl_archiver/orchestrator/ArtifactDiscovery.h"
#include "../../include/crawl_archiver/orchestrator/FinalBuildStage.h"
#include "../../include/crawl_archiver/common/Constants.h"
#include "../../include/crawl_archiver/common/FatalError.h"
#include "../../include/Logger.h"
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace crawl_archiver { namespace orchestrator {

namespace fs = std::filesystem;

namespace {

std::string formatDuration(std::chrono::seconds duration) {
    long long total = duration.count();
    if (total < 0) {
        total = 0;
    }
    long long hours = total / 3600;
    long long minutes = (total % 3600) / 60;
    long long seconds = total % 60;

    std::ostringstream out;
    out << std::setfill('0');
    if (hours > 0) {
        out << hours << ":" << std::setw(2) << minutes << ":" << std::setw(2) << seconds;
    } else {
        out << minutes << ":" << std::setw(2) << seconds;
    }
    return out.str();
}

std::string countOrDash(long long value) {
    return value < 0 ? "-" : std::to_string(value);
}

} // namespace

bool isSuccessfulExitCode(int exitCode) {
    return exitCode == 0 || constants::SOFT_LIMIT_EXIT_CODES.count(exitCode) > 0;
}

StageOrchestrator::StageOrchestrator(ArchiveConfig config,
                                     std::shared_ptr<container::ContainerRuntime> runtime,
                                     const ShutdownToken& shutdown,
                                     container::CommandRunner commandRunner)
    : config_(std::move(config))
    , outputDir_(fs::absolute(config_.outputDir).lexically_normal())
    , runtime_(std::move(runtime))
    , shutdown_(shutdown)
    , commandRunner_(std::move(commandRunner))
    , supervisor_(runtime_, config_.container, shutdown) {
}

JobStatus StageOrchestrator::run() {
    startedAt_ = state::Clock::now();
    LOG_INFO("--- Crawl Archiver Started: job '" + config_.name + "' ---");

    prepare();
    RunModeDecision decision = RunModeSelector::select(*state_, config_);

    JobStatus status = runCrawlStages(decision.mode);
    if (status == JobStatus::Success) {
        if (shutdown_.isStopRequested()) {
            status = JobStatus::Stopped;
        } else {
            status = FinalBuildStage(config_, outputDir_, supervisor_, *state_, shutdown_).run();
        }
    }

    finish(status);
    return status;
}

void StageOrchestrator::prepare() {
    if (!runtime_->isAvailable()) {
        throw FatalError("Container runtime is not available. Is Docker installed and running?");
    }

    std::error_code ec;
    fs::create_directories(outputDir_, ec);
    if (ec) {
        throw FatalError("Cannot create output directory " + outputDir_.string() + ": " + ec.message());
    }
    fs::path canonical = fs::canonical(outputDir_, ec);
    if (!ec) {
        outputDir_ = canonical;
    }

    fs::path probe = outputDir_ / (".writable_test_" + std::to_string(::getpid()));
    {
        std::ofstream out(probe);
        if (!out || !(out << "ok")) {
            throw FatalError("Output directory is not writable: " + outputDir_.string());
        }
    }
    fs::remove(probe, ec);
    LOG_INFO("Output directory: " + outputDir_.string());

    try {
        state_ = std::make_unique<state::JobState>(outputDir_, config_.effectiveInitialWorkers());
    } catch (const std::exception& e) {
        throw FatalError(std::string("Failed to initialize job state: ") + e.what());
    }
    engine_ = strategy::AdaptationEngine::fromSettings(*state_, config_.adaptation, shutdown_, commandRunner_);
    LOG_DEBUG("Adaptation strategies enabled: " + std::to_string(engine_->strategyCount()));
}

JobStatus StageOrchestrator::runCrawlStages(RunMode initialMode) {
    std::string stageName = stageNameFor(initialMode);
    const std::string resumeStage = stageNameFor(RunMode::Resume);
    int attempt = 1;

    while (!shutdown_.isStopRequested()) {
        std::vector<std::string> extraArgs;
        bool prepared = true;

        if (stageName == resumeStage) {
            auto resumeConfig = RunModeSelector::locateResumeConfig(*state_, outputDir_);
            if (resumeConfig) {
                auto containerPath = ArtifactDiscovery::hostToContainerPath(*resumeConfig, outputDir_);
                if (containerPath) {
                    extraArgs = {"--config", *containerPath};
                } else {
                    LOG_ERROR("Failed to convert resume config path to container path: " + resumeConfig->string());
                    prepared = false;
                }
            } else {
                LOG_ERROR("Resume requested but no resume config YAML was found. Starting '" +
                          stageNameFor(RunMode::NewPhaseWithConsolidation) + "' instead.");
                stageName = stageNameFor(RunMode::NewPhaseWithConsolidation);
            }
        }

        lastCombinedLog_.clear();
        StageOutcome outcome = prepared ? runAttempt(stageName, attempt, extraArgs) : StageOutcome::Failed;
        state_->setStatus(stageOutcomeName(outcome));

        switch (outcome) {
            case StageOutcome::Success:
                return JobStatus::Success;

            case StageOutcome::Stopped:
                LOG_WARNING("Stage '" + stageName + "' stopped on request.");
                return JobStatus::Stopped;

            case StageOutcome::StoppedForAdaptation:
                LOG_INFO("Container stopped for adaptation. Resuming with the adapted settings.");
                stageName = resumeStage;
                if (!applyBackoff("post-adaptation")) {
                    return JobStatus::Stopped;
                }
                break;

            case StageOutcome::Failed:
                if (attempt >= config_.maxStageAttempts) {
                    LOG_ERROR("Stage '" + stageName + "' failed after reaching the maximum of " +
                              std::to_string(config_.maxStageAttempts) + " attempt(s). Last log: " +
                              (lastCombinedLog_.empty() ? std::string("-") : lastCombinedLog_.string()));
                    return JobStatus::FailedMaxAttempts;
                }
                LOG_WARNING("Stage '" + stageName + "' attempt " + std::to_string(attempt) +
                            " failed. Will retry as '" + resumeStage + "'.");
                stageName = resumeStage;
                ++attempt;
                if (!applyBackoff("stage failure")) {
                    return JobStatus::Stopped;
                }
                break;
        }
    }
    return JobStatus::Stopped;
}

StageOutcome StageOrchestrator::runAttempt(const std::string& stageName,
                                          int attempt,
                                          const std::vector<std::string>& extraArgs) {
    const std::string displayName = stageName + " - Attempt " + std::to_string(attempt);
    LOG_INFO("--- Starting Stage: '" + displayName + "' (workers: " +
             std::to_string(state_->currentWorkers()) + ") ---");

    std::vector<std::string> args = container::ContainerSupervisor::buildArgs(
        config_.passthroughArgs, {config_.seeds, config_.name}, state_->currentWorkers(), false, extraArgs);

    state_->resetForNewAttempt(displayName);
    events_.clear();

    auto started = supervisor_.start(outputDir_, args, config_.name);
    if (!started) {
        LOG_ERROR("Failed to start container for stage '" + displayName + "'.");
        return StageOutcome::Failed;
    }

    container::StageLogPaths paths =
        container::LogDrain::makePaths(outputDir_, stageName + " Attempt " + std::to_string(attempt));
    LOG_INFO("Stage logs: " + paths.combinedLog.string());
    lastCombinedLog_ = paths.combinedLog;
    container::LogDrain drain(started->process, paths, displayName, !config_.enableMonitoring);

    std::unique_ptr<monitor::ProgressMonitor> progressMonitor;
    if (!config_.enableMonitoring) {
        LOG_INFO("Monitoring disabled; waiting for the crawler to exit.");
    } else if (!started->containerId) {
        LOG_WARNING("Container id was not identified; continuing without live monitoring.");
    } else {
        progressMonitor = std::make_unique<monitor::ProgressMonitor>(
            *started->containerId, started->process, *runtime_, *state_, config_.monitor, events_, shutdown_);
        progressMonitor->start();
    }

    StageOutcome outcome = superviseAttempt(*started, progressMonitor.get(), displayName, paths.combinedLog);

    if (!drain.stop(constants::LOG_DRAIN_JOIN_GRACE)) {
        LOG_WARNING("Log drain for '" + displayName + "' did not reach end of stream.");
    }
    if (progressMonitor) {
        progressMonitor->stop();
    }

    recordAttemptTempDir(paths);
    supervisor_.clearCurrent();
    return outcome;
}

StageOutcome StageOrchestrator::superviseAttempt(container::StartResult& started,
                                                 monitor::ProgressMonitor* progressMonitor,
                                                 const std::string& displayName,
                                                 const fs::path& combinedLog) {
    auto stageStart = state::Clock::now();
    auto lastStatus = stageStart;

    while (true) {
        if (shutdown_.isStopRequested()) {
            LOG_WARNING("Stop requested; leaving the supervision loop for '" + displayName + "'.");
            return StageOutcome::Stopped;
        }

        if (auto exitCode = started.process->poll()) {
            return classifyExit(*exitCode, displayName, combinedLog);
        }

        if (progressMonitor) {
            if (auto event = events_.popFor(config_.eventPollInterval)) {
                if (auto outcome = handleEvent(*event, started)) {
                    return *outcome;
                }
            }
        } else {
            shutdown_.waitFor(config_.eventPollInterval);
        }

        auto now = state::Clock::now();
        if (progressMonitor && now - lastStatus >= config_.statusPrintInterval) {
            printStatus(displayName, stageStart);
            lastStatus = now;
        }
    }
}

std::optional<StageOutcome> StageOrchestrator::handleEvent(const monitor::MonitorEvent& event,
                                                           container::StartResult& started) {
    using Type = monitor::MonitorEvent::Type;

    if (event.type == Type::Progress) {
        LOG_TRACE("Progress event received");
        return std::nullopt;
    }
    if (event.type == Type::Error && event.reason == monitor::MONITOR_FAILED_REASON) {
        LOG_ERROR("Progress monitor failed; the crawl continues without live monitoring.");
        return std::nullopt;
    }

    LOG_WARNING("Intervention triggered. Condition: " + monitor::eventTypeName(event.type) +
                ", reason: " + event.reason);

    switch (engine_->handle(event)) {
        case strategy::AdaptationOutcome::RestartRequired:
            LOG_WARNING("Adaptation requires a container restart. Stopping the current container...");
            if (started.containerId) {
                supervisor_.stop(*started.containerId);
            } else {
                LOG_WARNING("Container id unknown; stopping the run process directly.");
            }
            supervisor_.ensureProcessExits(*started.process, "adaptation restart");
            return StageOutcome::StoppedForAdaptation;

        case strategy::AdaptationOutcome::ContinueLive:
            LOG_INFO("Adaptation applied to the running crawl.");
            state_->resetRuntimeErrors();
            return std::nullopt;

        case strategy::AdaptationOutcome::None:
            LOG_WARNING("No adaptation strategy applied.");
            if (!applyBackoff("unhandled " + monitor::eventTypeName(event.type))) {
                return StageOutcome::Stopped;
            }
            state_->resetRuntimeErrors();
            return std::nullopt;
    }
    return std::nullopt;
}

StageOutcome StageOrchestrator::classifyExit(int exitCode,
                                             const std::string& displayName,
                                             const fs::path& combinedLog) {
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(state::Clock::now() - startedAt_);
    if (exitCode == 0) {
        LOG_INFO("Stage '" + displayName + "' completed successfully (job time " + formatDuration(elapsed) + ").");
        return StageOutcome::Success;
    }
    if (isSuccessfulExitCode(exitCode)) {
        LOG_WARNING("Stage '" + displayName + "' stopped at a crawler limit (exit code " +
                    std::to_string(exitCode) + "); treating it as complete.");
        return StageOutcome::Success;
    }
    LOG_ERROR("Stage '" + displayName + "' failed with exit code " + std::to_string(exitCode) +
              ". Check logs: " + combinedLog.string());
    return StageOutcome::Failed;
}

void StageOrchestrator::recordAttemptTempDir(const container::StageLogPaths& paths) {
    auto tempDir = ArtifactDiscovery::parseTempDirFromLog(paths.combinedLog, outputDir_);
    if (!tempDir) {
        LOG_WARNING("Could not determine the temp directory used by this attempt.");
        return;
    }
    LOG_INFO("Tracking temp directory: " + tempDir->string());
    state_->addTempDir(*tempDir);
}

bool StageOrchestrator::applyBackoff(const std::string& reason) {
    if (config_.backoffDelay.count() <= 0) {
        return !shutdown_.isStopRequested();
    }
    LOG_WARNING("Applying backoff delay of " + formatDuration(config_.backoffDelay) + " (" + reason + ")...");
    if (shutdown_.waitFor(config_.backoffDelay)) {
        LOG_WARNING("Stop requested during backoff.");
        return false;
    }
    LOG_INFO("Backoff delay complete.");
    return true;
}

void StageOrchestrator::printStatus(const std::string& displayName, state::Clock::time_point stageStart) {
    state::JobStateSnapshot snapshot = state_->snapshot();
    if (snapshot.lastStats.crawled < 0) {
        return;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(state::Clock::now() - stageStart);
    const CrawlStats& stats = snapshot.lastStats;

    std::ostringstream line;
    line << "[" << displayName << " | " << formatDuration(elapsed) << "] "
         << "Crawled: " << countOrDash(stats.crawled) << "/" << countOrDash(stats.total);
    if (stats.total > 0) {
        line << " (" << std::fixed << std::setprecision(1)
             << (100.0 * static_cast<double>(stats.crawled) / static_cast<double>(stats.total)) << "%)";
    }
    line << " | Rate: " << std::fixed << std::setprecision(1) << snapshot.progressRatePpm << " ppm"
         << " | Pending: " << countOrDash(stats.pending)
         << " | Failed: " << countOrDash(stats.failed)
         << " | Workers: " << snapshot.currentWorkers
         << " | VPN: " << snapshot.vpnRotationsDone << "/" << config_.adaptation.maxVpnRotations
         << " | Reductions: " << snapshot.workerReductionsDone << "/" << config_.adaptation.maxWorkerReductions
         << " | Errors (T/H/O): " << snapshot.errorCounts.timeout << "/" << snapshot.errorCounts.http
         << "/" << snapshot.errorCounts.other;

    std::printf("%s\n", line.str().c_str());
    std::fflush(stdout);
}

void StageOrchestrator::finish(JobStatus status) {
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(state::Clock::now() - startedAt_);
    state_->setStatus(jobStatusName(status));

    if (config_.relaxPerms && status != JobStatus::Success) {
        // The final build already relaxed them on the success path
        runtime_->relaxPermissions(outputDir_);
    }

    std::vector<fs::path> tempDirs = state_->tempDirs();
    LOG_INFO("--- Job Summary ---");
    LOG_INFO("Final status: " + jobStatusName(status));
    LOG_INFO("Total time: " + formatDuration(elapsed));
    LOG_INFO("Workers: " + std::to_string(state_->currentWorkers()) + " (initial " +
             std::to_string(state_->initialWorkers()) + "), VPN rotations: " +
             std::to_string(state_->vpnRotationsDone()) + ", worker reductions: " +
             std::to_string(state_->workerReductionsDone()) + ", container restarts: " +
             std::to_string(state_->containerRestartsDone()));

    if (status == JobStatus::Success && config_.cleanup) {
        LOG_INFO("Cleanup requested; removing " + std::to_string(tempDirs.size()) + " temp dir(s) and the state file.");
        ArtifactDiscovery::cleanupTempDirs(tempDirs, state_->stateFilePath());
    } else {
        for (const auto& dir : tempDirs) {
            LOG_INFO("Kept temp dir: " + dir.string());
        }
        LOG_INFO("State file: " + state_->stateFilePath().string());
    }
    LOG_INFO("-------------------");
}

} } // namespace crawl_archiver::orchestrator
