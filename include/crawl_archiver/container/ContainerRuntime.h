#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "ChildProcess.h"

namespace crawl_archiver { namespace container {

// Everything needed to launch one crawler container
struct RunSpec {
    std::string image;
    std::filesystem::path hostOutputDir;

    // Command run inside the container, starting with the crawler executable
    std::vector<std::string> command;

    // Value of the per-run tracking label
    std::string label;

    std::optional<std::string> shmSize;
    std::optional<std::string> memoryLimit;
    std::optional<std::string> cpuLimit;
    bool runAsRoot = false;
};

/**
 * The container engine operations the orchestrator depends on.
 * Implementations shell out to an existing runtime.
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    // Whether the runtime CLI is installed and answers
    virtual bool isAvailable() = 0;

    /**
     * Launch a labeled container with `hostOutputDir` mounted at the fixed
     * in-container output path. The returned process stays attached to the
     * container's output until it exits.
     */
    virtual std::unique_ptr<ChildProcess> runDetached(const RunSpec& spec, std::string& error) = 0;

    // Id of the running container carrying `label`, if any
    virtual std::optional<std::string> findByLabel(const std::string& label) = 0;

    // Independent liveness probe by container id
    virtual bool isRunning(const std::string& containerId) = 0;

    // Follow the container's combined output, starting `tailLines` back
    virtual std::unique_ptr<ChildProcess> followLogs(const std::string& containerId,
                                                     int tailLines,
                                                     std::string& error) = 0;

    /**
     * Ask the container to stop, waiting up to `grace` before the engine kills it.
     * A container that no longer exists counts as stopped.
     */
    virtual bool stop(const std::string& containerId, std::chrono::seconds grace) = 0;

    virtual bool kill(const std::string& containerId) = 0;

    // Make temp-dir content under `hostOutputDir` world-readable; best effort
    virtual void relaxPermissions(const std::filesystem::path& hostOutputDir) = 0;
};

} } // namespace crawl_archiver::container
