#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "../models/ArchiveConfig.h"
#include "../models/CrawlStats.h"
#include "../state/JobState.h"

namespace crawl_archiver { namespace orchestrator {

enum class RunMode {
    Fresh,
    Resume,
    NewPhaseWithConsolidation
};

// Stage name used for attempts in `mode`
std::string stageNameFor(RunMode mode);

inline const std::string FINAL_BUILD_STAGE_NAME = "Final Build from WARCs";

struct RunModeDecision {
    RunMode mode = RunMode::Fresh;
    std::optional<std::filesystem::path> resumeConfig;
    size_t tempDirCount = 0;
    size_t warcCount = 0;
    std::optional<CrawlStats> lastStats;
    bool overwriting = false;
};

/**
 * Decides once per invocation whether the job starts fresh, resumes from a
 * crawler resume configuration, or starts a new crawl phase whose output is
 * consolidated with earlier WARCs.
 */
class RunModeSelector {
public:
    /**
     * Merge on-disk temp dirs into the state, look for a resume configuration
     * (persisting it to the stable path) and prior WARCs, then pick the mode.
     * Fresh runs reset adaptation counters; overwrite resets the whole state.
     * @throws FatalError if the final artifact exists and overwrite is not allowed
     */
    static RunModeDecision select(state::JobState& state, const ArchiveConfig& config);

    /**
     * Resume configuration for the next attempt: the stable copy if present,
     * else the newest one across the state's temp dirs (copied to the stable path).
     */
    static std::optional<std::filesystem::path> locateResumeConfig(state::JobState& state,
                                                                   const std::filesystem::path& hostOutputDir);
};

} } // namespace crawl_archiver::orchestrator
