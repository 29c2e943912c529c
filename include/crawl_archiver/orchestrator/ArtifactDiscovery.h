#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "../models/CrawlStats.h"

namespace crawl_archiver { namespace orchestrator {

/**
 * Filesystem lookups over a job's output directory: crawler temp dirs, resume
 * configurations, WARC files, stage logs and the host/container path mapping.
 * Every lookup is best-effort; failures are logged and reported as "nothing found".
 */
class ArtifactDiscovery {
public:
    /**
     * Find the temp dir a stage wrote by scanning the head and tail of its
     * combined log for the crawler's "Output to tempdir" line.
     * Falls back to the newest temp dir on disk.
     * @return Canonical host path of an existing directory
     */
    static std::optional<std::filesystem::path> parseTempDirFromLog(const std::filesystem::path& logFile,
                                                                     const std::filesystem::path& hostOutputDir);

    // Most recently modified .tmp* directory directly under the output dir
    static std::optional<std::filesystem::path> findLatestTempDir(const std::filesystem::path& hostOutputDir);

    // Every .tmp* directory directly under the output dir, oldest first
    static std::vector<std::filesystem::path> discoverTempDirs(const std::filesystem::path& hostOutputDir);

    /**
     * Newest crawler resume configuration inside one temp dir. Known layouts
     * are probed in preference order; the first layout with a match wins.
     */
    static std::optional<std::filesystem::path> findLatestConfigYaml(const std::filesystem::path& tempDir);

    // Newest resume configuration across several temp dirs
    static std::optional<std::filesystem::path> findLatestConfigYaml(const std::vector<std::filesystem::path>& tempDirs);

    static std::filesystem::path stableResumeConfigPath(const std::filesystem::path& hostOutputDir);

    // The stable copy, if one was persisted before
    static std::optional<std::filesystem::path> findStableResumeConfig(const std::filesystem::path& hostOutputDir);

    /**
     * Durably copy a discovered resume configuration to the stable path.
     * @return The stable path, or nullopt if the copy failed
     */
    static std::optional<std::filesystem::path> persistResumeConfig(const std::filesystem::path& configYaml,
                                                                    const std::filesystem::path& hostOutputDir);

    /**
     * Non-empty *.warc.gz / *.warc files under each temp dir's collections/
     * directory (or the whole temp dir when it has none).
     * @return Unique canonical paths, sorted
     */
    static std::vector<std::filesystem::path> findAllWarcFiles(const std::vector<std::filesystem::path>& tempDirs);

    /**
     * Map a host path inside the output dir to the crawler's view of it.
     * @return nullopt if the path is outside the output dir
     */
    static std::optional<std::string> hostToContainerPath(const std::filesystem::path& hostPath,
                                                          const std::filesystem::path& hostOutputDir);

    static std::optional<std::filesystem::path> containerToHostPath(const std::string& containerPath,
                                                                    const std::filesystem::path& hostOutputDir);

    /**
     * Last "Crawl statistics" record in the final MiB of a log.
     * @return nullopt unless crawled and total are both present
     */
    static std::optional<CrawlStats> parseLastStatsFromLog(const std::filesystem::path& logFile);

    // Newest archive_*.combined.log under the output dir
    static std::optional<std::filesystem::path> findLatestCombinedLog(const std::filesystem::path& hostOutputDir);

    // Delete .tmp* directories and the state file
    static void cleanupTempDirs(const std::vector<std::filesystem::path>& tempDirs,
                                const std::filesystem::path& stateFile);
};

} } // namespace crawl_archiver::orchestrator
