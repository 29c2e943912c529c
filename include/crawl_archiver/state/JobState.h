#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../models/CrawlStats.h"

namespace crawl_archiver { namespace state {

using Clock = std::chrono::steady_clock;

// Point-in-time copy of every field, durable and transient
struct JobStateSnapshot {
    // Durable
    int currentWorkers = 1;
    int initialWorkers = 1;
    std::vector<std::filesystem::path> tempDirs;
    int vpnRotationsDone = 0;
    int workerReductionsDone = 0;
    int containerRestartsDone = 0;

    // Transient
    std::string status = "initializing";
    std::string currentStageName = "None";
    CrawlStats lastStats;
    std::optional<Clock::time_point> lastProgressTimestamp;
    std::optional<Clock::time_point> lastStatsTimestamp;
    double progressRatePpm = 0.0;
    ErrorCounts errorCounts;
    std::optional<ErrorCategory> lastErrorCategory;
    std::optional<Clock::time_point> lastVpnRotationTimestamp;
};

/**
 * Durable and transient state of one crawl job, keyed by its output directory.
 *
 * Every accessor locks internally. Persistence runs outside the state lock:
 * methods that mutate durable fields release the lock before calling save().
 */
class JobState {
public:
    /**
     * Load the state file under `outputDir` if present and write it back so the
     * file always exists after construction.
     * @param outputDir Host output directory of the job
     * @param initialWorkers Upper bound for the current worker count
     */
    JobState(const std::filesystem::path& outputDir, int initialWorkers);

    JobState(const JobState&) = delete;
    JobState& operator=(const JobState&) = delete;

    const std::filesystem::path& outputDir() const { return outputDir_; }
    const std::filesystem::path& stateFilePath() const { return stateFilePath_; }

    /**
     * Filter, de-duplicate and sort temp dirs, then durably replace the state file.
     * Must not be called while holding the state lock.
     * @return false if the file could not be written
     */
    bool save();

    // Record an artifact directory; no-op for non-directories and known paths
    void addTempDir(const std::filesystem::path& path);

    // Existing temp dirs, oldest first. Stale entries are dropped and persisted.
    std::vector<std::filesystem::path> tempDirs();

    // Wipe counters, worker reductions and temp-dir history
    void resetForOverwrite();

    // Zero the adaptation counters, keep temp dirs
    void resetAdaptationCounts();

    void resetRuntimeErrors();

    // Reset every transient field at the start of a stage attempt
    void resetForNewAttempt(const std::string& stageName);

    void setStatus(const std::string& status);

    /**
     * Apply one statistics record observed at `now`.
     * A strictly higher crawled count is progress: it stamps the progress time
     * and clears error counters. The pages-per-minute rate is recomputed from
     * the previous rate sample once more than a second has passed.
     */
    void updateProgress(const CrawlStats& stats, Clock::time_point now);

    void recordError(ErrorCategory category);

    /**
     * Whether the crawl has gone `stallTimeout` without progress while work is
     * (or may be) pending.
     */
    bool isStalled(Clock::time_point now, std::chrono::seconds stallTimeout) const;

    // Restart the stall clock at `now` and clear error counters
    void markStallHandled(Clock::time_point now);

    /**
     * Decrement the worker count by one, never below `minWorkers`.
     * @return true if the count changed (the change is persisted)
     */
    bool reduceWorkers(int minWorkers);

    void recordVpnRotation(Clock::time_point when);
    void recordContainerRestart();

    int currentWorkers() const;
    int initialWorkers() const;
    int vpnRotationsDone() const;
    int workerReductionsDone() const;
    int containerRestartsDone() const;
    ErrorCounts errorCounts() const;
    std::optional<Clock::time_point> lastVpnRotation() const;

    JobStateSnapshot snapshot() const;

private:
    void load();
    void resetDurableLocked();
    void resetRuntimeErrorsLocked();

    std::filesystem::path outputDir_;
    std::filesystem::path stateFilePath_;

    mutable std::mutex mutex_;
    std::mutex saveMutex_;

    JobStateSnapshot data_;

    // Rate sample
    long long previousCrawledCount_ = -1;
    std::optional<Clock::time_point> previousStatsTimestamp_;
};

} } // namespace crawl_archiver::state
