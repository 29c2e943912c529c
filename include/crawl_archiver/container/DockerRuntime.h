#pragma once

#include <string>
#include <vector>
#include "ContainerRuntime.h"

namespace crawl_archiver { namespace container {

// ContainerRuntime backed by the `docker` command line client
class DockerRuntime : public ContainerRuntime {
public:
    explicit DockerRuntime(CommandRunner runner = runCommand, std::string executable = "docker");

    bool isAvailable() override;
    std::unique_ptr<ChildProcess> runDetached(const RunSpec& spec, std::string& error) override;
    std::optional<std::string> findByLabel(const std::string& label) override;
    bool isRunning(const std::string& containerId) override;
    std::unique_ptr<ChildProcess> followLogs(const std::string& containerId,
                                             int tailLines,
                                             std::string& error) override;
    bool stop(const std::string& containerId, std::chrono::seconds grace) override;
    bool kill(const std::string& containerId) override;
    void relaxPermissions(const std::filesystem::path& hostOutputDir) override;

    // Full `docker run` argv for `spec`
    std::vector<std::string> buildRunCommand(const RunSpec& spec) const;

private:
    std::optional<std::string> firstIdFromPs(const std::vector<std::string>& filterArgs);

    CommandRunner runner_;
    std::string executable_;
};

} } // namespace crawl_archiver::container
