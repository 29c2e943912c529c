#include "../../include/crawl_archiver/container/DockerRuntime.h"
#include "../../include/crawl_archiver/common/Constants.h"
#include "../../include/Logger.h"
#include <sstream>

namespace crawl_archiver { namespace container {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

bool mentionsMissingContainer(const CommandResult& result) {
    return result.output.find("No such container") != std::string::npos;
}

std::string mountSpec(const fs::path& hostOutputDir) {
    std::error_code ec;
    fs::path resolved = fs::canonical(hostOutputDir, ec);
    if (ec) {
        resolved = fs::absolute(hostOutputDir);
    }
    return resolved.string() + ":" + constants::CONTAINER_OUTPUT_DIR;
}

} // namespace

DockerRuntime::DockerRuntime(CommandRunner runner, std::string executable)
    : runner_(std::move(runner)), executable_(std::move(executable)) {
}

bool DockerRuntime::isAvailable() {
    CommandResult result = runner_({executable_, "--version"},
                                   constants::RUNTIME_VERSION_CHECK_TIMEOUT);
    if (!result.succeeded()) {
        LOG_ERROR("Docker command not found or failed to execute: " + trim(result.output));
        LOG_ERROR("Please ensure Docker is installed, running, and accessible.");
        return false;
    }
    LOG_INFO("Docker found: " + trim(result.output));
    return true;
}

std::vector<std::string> DockerRuntime::buildRunCommand(const RunSpec& spec) const {
    std::vector<std::string> cmd = {
        executable_, "run", "--rm",
        "-v", mountSpec(spec.hostOutputDir)
    };
    if (!spec.label.empty()) {
        cmd.push_back("--label");
        cmd.push_back(constants::RUN_LABEL_KEY + "=" + spec.label);
    }
    if (spec.shmSize && !spec.shmSize->empty()) {
        cmd.push_back("--shm-size");
        cmd.push_back(*spec.shmSize);
    }
    if (spec.runAsRoot) {
        cmd.push_back("--user");
        cmd.push_back("0:0");
    }
    if (spec.memoryLimit && !spec.memoryLimit->empty()) {
        // Swap equal to memory disables swapping
        cmd.push_back("--memory");
        cmd.push_back(*spec.memoryLimit);
        cmd.push_back("--memory-swap");
        cmd.push_back(*spec.memoryLimit);
        cmd.push_back("--memory-swappiness");
        cmd.push_back("10");
    }
    if (spec.cpuLimit && !spec.cpuLimit->empty()) {
        cmd.push_back("--cpus");
        cmd.push_back(*spec.cpuLimit);
    }
    cmd.push_back(spec.image);
    cmd.insert(cmd.end(), spec.command.begin(), spec.command.end());
    return cmd;
}

std::unique_ptr<ChildProcess> DockerRuntime::runDetached(const RunSpec& spec, std::string& error) {
    std::vector<std::string> cmd = buildRunCommand(spec);
    LOG_INFO("Executing Docker command (Job ID: " + spec.label + "):\n" + formatCommand(cmd));
    auto process = ChildProcess::spawn(cmd, error);
    if (!process) {
        LOG_ERROR("Docker command failed: " + error + ". Is Docker installed and in your PATH?");
    }
    return process;
}

std::optional<std::string> DockerRuntime::firstIdFromPs(const std::vector<std::string>& filterArgs) {
    std::vector<std::string> cmd = {executable_, "ps", "-q"};
    cmd.insert(cmd.end(), filterArgs.begin(), filterArgs.end());

    CommandResult result = runner_(cmd, constants::CONTAINER_QUERY_TIMEOUT);
    if (result.timedOut) {
        LOG_ERROR("Timed out running 'docker ps' command.");
        return std::nullopt;
    }
    if (!result.succeeded()) {
        LOG_DEBUG("Error running 'docker ps' command (may be temporary): " + trim(result.output));
        return std::nullopt;
    }

    std::istringstream lines(result.output);
    std::string line;
    while (std::getline(lines, line)) {
        std::string id = trim(line);
        if (!id.empty()) {
            return id;
        }
    }
    return std::nullopt;
}

std::optional<std::string> DockerRuntime::findByLabel(const std::string& label) {
    auto id = firstIdFromPs({"--filter", "label=" + constants::RUN_LABEL_KEY + "=" + label});
    if (id) {
        LOG_DEBUG("Found container ID " + *id + " for job " + label);
    }
    return id;
}

bool DockerRuntime::isRunning(const std::string& containerId) {
    return firstIdFromPs({"--filter", "id=" + containerId}).has_value();
}

std::unique_ptr<ChildProcess> DockerRuntime::followLogs(const std::string& containerId,
                                                        int tailLines,
                                                        std::string& error) {
    std::vector<std::string> cmd = {
        executable_, "logs", "-f", "--tail", std::to_string(tailLines), containerId
    };
    LOG_DEBUG("Following container logs: " + formatCommand(cmd));
    return ChildProcess::spawn(cmd, error);
}

bool DockerRuntime::stop(const std::string& containerId, std::chrono::seconds grace) {
    LOG_INFO("Attempting to stop Docker container " + containerId + " (will wait up to " +
             std::to_string(grace.count()) + "s)...");

    CommandResult result = runner_({executable_, "stop", "-t", std::to_string(grace.count()), containerId},
                                   grace + (constants::CONTAINER_STOP_COMMAND_TIMEOUT -
                                            constants::CONTAINER_STOP_GRACE_PERIOD));
    if (result.succeeded()) {
        LOG_INFO("Successfully stopped container " + containerId + ".");
        return true;
    }
    if (!result.started) {
        LOG_ERROR("Docker command not found: " + result.output);
        return false;
    }
    if (mentionsMissingContainer(result)) {
        LOG_WARNING("Container " + containerId + " not found. Assumed stopped.");
        return true;
    }
    if (result.timedOut) {
        LOG_ERROR("Timed out waiting for container " + containerId + " stop command to complete.");
    } else {
        LOG_ERROR("Failed to stop container " + containerId + ": " + trim(result.output));
    }
    return kill(containerId);
}

bool DockerRuntime::kill(const std::string& containerId) {
    LOG_WARNING("Attempting to force-kill container " + containerId + "...");
    CommandResult result = runner_({executable_, "kill", containerId}, constants::CONTAINER_KILL_TIMEOUT);
    if (result.succeeded()) {
        LOG_WARNING("Force-killed container " + containerId + ".");
        return true;
    }
    if (result.started && mentionsMissingContainer(result)) {
        LOG_WARNING("Container " + containerId + " not found during kill. Assumed stopped.");
        return true;
    }
    if (result.timedOut) {
        LOG_ERROR("Timed out waiting for container " + containerId + " to be killed.");
    } else {
        LOG_ERROR("Failed to kill container " + containerId + ": " + trim(result.output));
    }
    return false;
}

void DockerRuntime::relaxPermissions(const fs::path& hostOutputDir) {
    std::error_code ec;
    if (!fs::exists(hostOutputDir, ec)) {
        LOG_WARNING("relax_permissions: output dir " + hostOutputDir.string() + " does not exist; skipping.");
        return;
    }

    bool hasTemp = false;
    for (fs::directory_iterator it(hostOutputDir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().filename().string().rfind(constants::TEMP_DIR_PREFIX, 0) == 0) {
            hasTemp = true;
            break;
        }
    }
    if (ec) {
        LOG_WARNING("relax_permissions: failed scanning for temp dirs under " +
                    hostOutputDir.string() + ": " + ec.message());
        hasTemp = true;
    }
    if (!hasTemp) {
        LOG_DEBUG("relax_permissions: no " + constants::TEMP_DIR_PREFIX + "* directories found under " +
                  hostOutputDir.string() + ".");
        return;
    }

    LOG_INFO("relax_permissions: ensuring crawl artifacts are readable (chmod a+rX) ...");
    std::vector<std::string> cmd = {
        executable_, "run", "--rm", "-v", mountSpec(hostOutputDir),
        "alpine", "sh", "-c",
        "chmod -R a+rX " + constants::CONTAINER_OUTPUT_DIR + "/" + constants::TEMP_DIR_PREFIX +
            "* 2>/dev/null || true"
    };
    CommandResult result = runner_(cmd, constants::EXTERNAL_COMMAND_TIMEOUT);
    if (!result.succeeded()) {
        LOG_WARNING("relax_permissions: permission helper container failed: " + trim(result.output));
    }
}

} } // namespace crawl_archiver::container
