#include "../../include/crawl_archiver/orchestrator/RunMode.h"
#include "../../include/crawl_archiver/orchestrator/ArtifactDiscovery.h"
#include "../../include/crawl_archiver/common/FatalError.h"
#include "../../include/Logger.h"
#include <set>

namespace crawl_archiver { namespace orchestrator {

namespace fs = std::filesystem;

std::string stageNameFor(RunMode mode) {
    switch (mode) {
        case RunMode::Fresh: return "Initial Crawl";
        case RunMode::Resume: return "Resume Crawl";
        case RunMode::NewPhaseWithConsolidation: return "New Crawl Phase";
    }
    return "Initial Crawl";
}

std::optional<fs::path> RunModeSelector::locateResumeConfig(state::JobState& state, const fs::path& hostOutputDir) {
    if (auto stable = ArtifactDiscovery::findStableResumeConfig(hostOutputDir)) {
        LOG_INFO("Found stable resume config YAML: " + stable->string());
        return stable;
    }

    std::vector<fs::path> tempDirs = state.tempDirs();
    if (tempDirs.empty()) {
        LOG_INFO("No existing temp directories tracked, cannot resume from YAML.");
        return std::nullopt;
    }

    LOG_DEBUG("Searching for newest resume config YAML across " + std::to_string(tempDirs.size()) + " temp dir(s).");
    auto found = ArtifactDiscovery::findLatestConfigYaml(tempDirs);
    if (!found) {
        LOG_INFO("No resume config YAML found in tracked temp dirs.");
        return std::nullopt;
    }

    LOG_INFO("Found potential resume config YAML: " + found->string());
    if (auto persisted = ArtifactDiscovery::persistResumeConfig(*found, hostOutputDir)) {
        LOG_INFO("Persisted resume config YAML to stable path: " + persisted->string());
        return persisted;
    }
    return found;
}

RunModeDecision RunModeSelector::select(state::JobState& state, const ArchiveConfig& config) {
    RunModeDecision decision;
    const fs::path& outputDir = state.outputDir();

    std::vector<fs::path> known = state.tempDirs();
    std::set<fs::path> knownSet(known.begin(), known.end());
    bool merged = false;
    for (const auto& dir : ArtifactDiscovery::discoverTempDirs(outputDir)) {
        if (knownSet.count(dir) == 0) {
            LOG_INFO("Adopting untracked temp dir found on disk: " + dir.string());
            state.addTempDir(dir);
            merged = true;
        }
    }
    std::vector<fs::path> tempDirs = merged ? state.tempDirs() : known;
    decision.tempDirCount = tempDirs.size();

    decision.resumeConfig = locateResumeConfig(state, outputDir);

    if (!tempDirs.empty()) {
        decision.warcCount = ArtifactDiscovery::findAllWarcFiles(tempDirs).size();
        LOG_INFO("Found " + std::to_string(decision.warcCount) + " existing WARC file(s) in " +
                 std::to_string(tempDirs.size()) + " tracked temp dir(s).");
    }

    if (decision.resumeConfig || !tempDirs.empty()) {
        if (auto latestLog = ArtifactDiscovery::findLatestCombinedLog(outputDir)) {
            decision.lastStats = ArtifactDiscovery::parseLastStatsFromLog(*latestLog);
        }
    }

    fs::path finalArtifact = config.finalArtifactPath();
    std::error_code ec;
    bool finalArtifactExists = fs::exists(finalArtifact, ec);

    LOG_INFO("--- Initial Run Status Determination ---");
    if (decision.lastStats) {
        LOG_INFO("Last known status from logs: Crawled=" + std::to_string(decision.lastStats->crawled) + "/" +
                 std::to_string(decision.lastStats->total) + ", Failed=" +
                 std::to_string(decision.lastStats->failed));
    } else {
        LOG_INFO("No stats parsed from previous runs.");
    }

    if (finalArtifactExists) {
        if (!config.overwrite) {
            throw FatalError("Target ZIM file already exists: " + finalArtifact.string() +
                             ". Use --overwrite to allow replacing it.");
        }
        LOG_WARNING("Target ZIM file exists and --overwrite specified: " + finalArtifact.string());
        LOG_WARNING("Resetting persistent state (temp dirs, adaptation counts) for a completely fresh crawl.");
        state.resetForOverwrite();
        fs::remove(ArtifactDiscovery::stableResumeConfigPath(outputDir), ec);
        decision.mode = RunMode::Fresh;
        decision.overwriting = true;
        decision.resumeConfig.reset();
        decision.tempDirCount = 0;
        decision.warcCount = 0;
        decision.lastStats.reset();
    } else if (decision.resumeConfig) {
        LOG_INFO("Run Mode: RESUME crawl using configuration: " + decision.resumeConfig->filename().string());
        LOG_INFO("Will also use " + std::to_string(decision.warcCount) + " previously found WARC file(s) in final build.");
        decision.mode = RunMode::Resume;
    } else if (!tempDirs.empty()) {
        LOG_INFO("Run Mode: NEW crawl phase, consolidating " + std::to_string(tempDirs.size()) +
                 " previous temp dir(s).");
        LOG_INFO("No valid resume configuration (.yaml) found to continue previous queue.");
        decision.mode = RunMode::NewPhaseWithConsolidation;
    } else {
        LOG_INFO("Run Mode: FRESH crawl.");
        LOG_INFO("No existing ZIM, no resume config, and no prior temp dirs found.");
        state.resetAdaptationCounts();
        decision.mode = RunMode::Fresh;
    }

    LOG_INFO("Current State: Workers=" + std::to_string(state.currentWorkers()) +
             ", VPN Rotations=" + std::to_string(state.vpnRotationsDone()) +
             ", Worker Reductions=" + std::to_string(state.workerReductionsDone()));
    LOG_INFO("---------------------------------------");
    return decision;
}

} } // namespace crawl_archiver::orchestrator
