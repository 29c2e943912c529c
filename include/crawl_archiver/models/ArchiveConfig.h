#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "../common/Constants.h"

namespace crawl_archiver {

// Thresholds the progress monitor works with
struct MonitorSettings {
    // How often stall/error conditions are evaluated and progress is reported
    std::chrono::seconds pollInterval{30};

    // Time without a crawled-count increase before the crawl counts as stalled
    std::chrono::minutes stallTimeout{30};

    // Classified errors that trigger an error event
    int errorThresholdTimeout = 10;
    int errorThresholdHttp = 10;

    // Delay before following the container log stream
    std::chrono::milliseconds startupDelay{2000};

    // Lines replayed from the container log when following starts
    int logTailLines = 50;
};

// Knobs for the adaptation strategies
struct AdaptationSettings {
    bool enableAdaptiveWorkers = false;
    int minWorkers = 1;
    int maxWorkerReductions = 2;

    bool enableVpnRotation = false;
    std::string vpnConnectCommand;
    std::string vpnDisconnectCommand;
    int maxVpnRotations = 3;
    std::chrono::minutes vpnRotationFrequency{60};
    std::chrono::seconds vpnSettleDelay{15};

    bool enableAdaptiveRestart = false;
    int maxContainerRestarts = 0;
};

// Container resource limits and launch options
struct ContainerSettings {
    std::string image = constants::DEFAULT_CRAWLER_IMAGE;
    std::optional<std::string> shmSize;
    std::optional<std::string> memoryLimit = std::string("4g");
    std::optional<std::string> cpuLimit = std::string("1.5");

    // Run the container as root so artifacts can be made readable afterwards
    bool runAsRoot = false;

    // Container identity lookup after launch
    int idLookupAttempts = constants::CONTAINER_ID_MAX_ATTEMPTS;
    std::chrono::milliseconds idLookupInterval{2000};
};

struct ArchiveConfig {
    // Seed URLs, passed to the crawler as one comma-separated value
    std::vector<std::string> seeds;

    // Job name; also the final artifact base name
    std::string name;

    // Host output directory (mounted at the crawler's fixed output path)
    std::filesystem::path outputDir;

    // Initial worker count; a passthrough --workers overrides it
    int initialWorkers = 1;

    // Delete temp dirs and the state file after a fully successful run
    bool cleanup = false;

    // Allow replacing an existing final artifact
    bool overwrite = false;

    // Validate and print a summary without starting any container
    bool dryRun = false;

    // Make temp-dir artifacts world-readable after the crawl
    bool relaxPerms = false;

    std::string logLevel = "INFO";

    // === MONITORING ===
    bool enableMonitoring = false;
    MonitorSettings monitor;

    // === ADAPTATION ===
    AdaptationSettings adaptation;

    // Pause applied after failures and unhandled stall/error events
    std::chrono::seconds backoffDelay{15 * 60};

    // Hard ceiling on failed stage attempts
    int maxStageAttempts = 100;

    // Bounded wait used by the control loop between checks
    std::chrono::milliseconds eventPollInterval{1000};

    // Interval between console status lines while monitoring
    std::chrono::seconds statusPrintInterval{60};

    ContainerSettings container;

    // Arguments forwarded verbatim to the crawler
    std::vector<std::string> passthroughArgs;

    /**
     * Check cross-field constraints.
     * @return Human-readable problems; empty when the configuration is usable
     */
    std::vector<std::string> validate() const;

    /**
     * Initial worker count after applying a passthrough --workers override.
     * Never below 1.
     */
    int effectiveInitialWorkers() const;

    // Final artifact location (<outputDir>/<name>.zim)
    std::filesystem::path finalArtifactPath() const;

    // Apply CRAWL_ARCHIVER_* environment overrides to container settings
    void applyEnvironment();
};

} // namespace crawl_archiver
