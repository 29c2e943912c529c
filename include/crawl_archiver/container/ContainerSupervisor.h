#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "ContainerRuntime.h"
#include "../common/ShutdownToken.h"
#include "../models/ArchiveConfig.h"

namespace crawl_archiver { namespace container {

// Values every crawler invocation carries
struct RequiredArgs {
    std::vector<std::string> seeds;
    std::string name;
};

struct StartResult {
    std::shared_ptr<ChildProcess> process;
    std::optional<std::string> containerId;
    std::string label;
};

/**
 * Launches, identifies and stops the crawler container of the current stage
 * attempt. The current process and container id are also reachable from the
 * signal thread through emergencyStop().
 */
class ContainerSupervisor {
public:
    ContainerSupervisor(std::shared_ptr<ContainerRuntime> runtime,
                        ContainerSettings settings,
                        const ShutdownToken& shutdown);

    /**
     * Build the crawler argument vector.
     * @param baseArgs Passthrough arguments; any --workers flag is dropped
     * @param required Seeds (skipped for a final build) and job name
     * @param workerCount Worker count to set (ignored for a final build)
     * @param isFinalBuild Whether this is the WARC merge stage
     * @param extraArgs Stage-specific arguments (--config, --warcs)
     * @return Arguments starting with the crawler executable, ending in --output /output
     */
    static std::vector<std::string> buildArgs(const std::vector<std::string>& baseArgs,
                                              const RequiredArgs& required,
                                              int workerCount,
                                              bool isFinalBuild,
                                              const std::vector<std::string>& extraArgs);

    // Keep only the archive metadata flags (and their values) for the final build
    static std::vector<std::string> filterArgsForFinalBuild(const std::vector<std::string>& passthroughArgs);

    // archive-<jobName>-<8 hex chars>
    static std::string makeRunLabel(const std::string& jobName);

    /**
     * Launch the crawler and poll for its container id.
     * @return nullopt when the process could not be started; a missing
     *         container id is not an error
     */
    std::optional<StartResult> start(const std::filesystem::path& hostOutputDir,
                                     const std::vector<std::string>& args,
                                     const std::string& jobName);

    // Gracefully stop a container, escalating to a kill inside the runtime
    bool stop(const std::string& containerId);

    /**
     * Wait for the run process to exit after its container was stopped, then
     * terminate and finally kill it so two crawler processes never overlap.
     */
    void ensureProcessExits(ChildProcess& process, const std::string& reason);

    // Shutdown path: stop the current container, then terminate/kill the current process
    void emergencyStop();

    // Forget the current process/container once the attempt is over
    void clearCurrent();

    ContainerRuntime& runtime() { return *runtime_; }

private:
    std::shared_ptr<ContainerRuntime> runtime_;
    ContainerSettings settings_;
    const ShutdownToken& shutdown_;

    std::mutex mutex_;
    std::shared_ptr<ChildProcess> currentProcess_;
    std::optional<std::string> currentContainerId_;
};

} } // namespace crawl_archiver::container
