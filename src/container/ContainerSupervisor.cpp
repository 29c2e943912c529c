#include "../../include/crawl_archiver/container/ContainerSupervisor.h"
#include "../../include/crawl_archiver/common/Constants.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <thread>
#include <uuid/uuid.h>

namespace crawl_archiver { namespace container {

namespace {

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

// A "--flag value" pair: the flag has no inline value and the next word is not a flag
bool takesSeparateValue(const std::vector<std::string>& args, size_t i) {
    const std::string& arg = args[i];
    return startsWith(arg, "--") && arg.find('=') == std::string::npos &&
           i + 1 < args.size() && !startsWith(args[i + 1], "-");
}

std::string joinSeeds(const std::vector<std::string>& seeds) {
    std::string csv;
    for (const auto& seed : seeds) {
        if (!csv.empty()) {
            csv += ',';
        }
        csv += seed;
    }
    return csv;
}

} // namespace

ContainerSupervisor::ContainerSupervisor(std::shared_ptr<ContainerRuntime> runtime,
                                         ContainerSettings settings,
                                         const ShutdownToken& shutdown)
    : runtime_(std::move(runtime)), settings_(std::move(settings)), shutdown_(shutdown) {
}

std::vector<std::string> ContainerSupervisor::buildArgs(const std::vector<std::string>& baseArgs,
                                                        const RequiredArgs& required,
                                                        int workerCount,
                                                        bool isFinalBuild,
                                                        const std::vector<std::string>& extraArgs) {
    std::vector<std::string> args = {"zimit"};

    // The crawler honors only the last --seeds flag, so all seeds go in one value
    if (!isFinalBuild && !required.seeds.empty()) {
        args.push_back("--seeds");
        args.push_back(joinSeeds(required.seeds));
    }
    if (!required.name.empty()) {
        args.push_back("--name");
        args.push_back(required.name);
    }

    // --workers and --name are owned by the orchestrator
    std::vector<std::string> passthrough;
    for (size_t i = 0; i < baseArgs.size(); ++i) {
        const std::string& arg = baseArgs[i];
        if (arg == "--workers" || arg == "--name") {
            if (i + 1 < baseArgs.size() && !startsWith(baseArgs[i + 1], "-")) {
                ++i;
            }
            continue;
        }
        if (startsWith(arg, "--workers=") || startsWith(arg, "--name=")) {
            continue;
        }
        passthrough.push_back(arg);
    }

    if (!isFinalBuild) {
        args.push_back("--workers");
        args.push_back(std::to_string(workerCount));
    }

    args.insert(args.end(), passthrough.begin(), passthrough.end());
    args.insert(args.end(), extraArgs.begin(), extraArgs.end());

    if (std::find(args.begin(), args.end(), "--keep") == args.end()) {
        args.push_back("--keep");
    }

    std::vector<std::string> result;
    result.reserve(args.size() + 2);
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (startsWith(arg, "--output")) {
            if (arg == "--output" && i + 1 < args.size() && !startsWith(args[i + 1], "-")) {
                ++i;
            }
            continue;
        }
        result.push_back(arg);
    }
    result.push_back("--output");
    result.push_back(constants::CONTAINER_OUTPUT_DIR);
    return result;
}

std::vector<std::string> ContainerSupervisor::filterArgsForFinalBuild(const std::vector<std::string>& passthroughArgs) {
    std::vector<std::string> filtered;
    size_t i = 0;
    while (i < passthroughArgs.size()) {
        const std::string& arg = passthroughArgs[i];
        bool keep = std::any_of(constants::FINAL_BUILD_ARG_PREFIXES.begin(),
                                constants::FINAL_BUILD_ARG_PREFIXES.end(),
                                [&arg](const std::string& prefix) { return startsWith(arg, prefix); });
        bool pair = takesSeparateValue(passthroughArgs, i);
        if (keep) {
            filtered.push_back(arg);
            if (pair) {
                filtered.push_back(passthroughArgs[i + 1]);
            }
        }
        i += pair ? 2 : 1;
    }
    return filtered;
}

std::string ContainerSupervisor::makeRunLabel(const std::string& jobName) {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char uuidStr[37];
    uuid_unparse_lower(uuid, uuidStr);
    return "archive-" + jobName + "-" + std::string(uuidStr, 8);
}

std::optional<StartResult> ContainerSupervisor::start(const std::filesystem::path& hostOutputDir,
                                                      const std::vector<std::string>& args,
                                                      const std::string& jobName) {
    clearCurrent();

    RunSpec spec;
    spec.image = settings_.image;
    spec.hostOutputDir = hostOutputDir;
    spec.command = args;
    spec.label = makeRunLabel(jobName);
    spec.shmSize = settings_.shmSize;
    spec.memoryLimit = settings_.memoryLimit;
    spec.cpuLimit = settings_.cpuLimit;
    spec.runAsRoot = settings_.runAsRoot;

    std::string error;
    std::unique_ptr<ChildProcess> launched = runtime_->runDetached(spec, error);
    if (!launched) {
        LOG_ERROR("Failed to start container: " + error);
        return std::nullopt;
    }

    StartResult result;
    result.process = std::shared_ptr<ChildProcess>(std::move(launched));
    result.label = spec.label;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        currentProcess_ = result.process;
    }

    for (int attempt = 1; attempt <= settings_.idLookupAttempts; ++attempt) {
        if (shutdown_.waitFor(settings_.idLookupInterval)) {
            break;
        }
        result.containerId = runtime_->findByLabel(spec.label);
        if (result.containerId) {
            break;
        }
        LOG_DEBUG("Attempt " + std::to_string(attempt) + ": Container ID not found yet for job " + spec.label + ".");
        if (result.process->poll()) {
            break;
        }
    }

    if (result.containerId) {
        std::lock_guard<std::mutex> lock(mutex_);
        currentContainerId_ = result.containerId;
        LOG_INFO("Identified running container ID: " + *result.containerId);
    } else {
        LOG_WARNING("Could not identify running container ID using label " + spec.label +
                    " after multiple attempts.");
        if (auto code = result.process->poll()) {
            LOG_ERROR("Docker process exited prematurely with code " + std::to_string(*code) +
                      ". Check Docker setup or image.");
        }
    }
    return result;
}

bool ContainerSupervisor::stop(const std::string& containerId) {
    bool stopped = runtime_->stop(containerId, constants::CONTAINER_STOP_GRACE_PERIOD);
    std::lock_guard<std::mutex> lock(mutex_);
    if (currentContainerId_ && *currentContainerId_ == containerId) {
        currentContainerId_.reset();
    }
    return stopped;
}

void ContainerSupervisor::ensureProcessExits(ChildProcess& process, const std::string& reason) {
    if (process.poll()) {
        return;
    }

    LOG_INFO("Waiting up to " + std::to_string(constants::ADAPTATION_EXIT_WAIT.count()) +
             "s for docker process to exit (" + reason + ")...");
    if (process.wait(constants::ADAPTATION_EXIT_WAIT)) {
        LOG_INFO("Docker process exited.");
        return;
    }

    LOG_WARNING("Docker process did not exit within " +
                std::to_string(constants::ADAPTATION_EXIT_WAIT.count()) + "s (" + reason + "); terminating...");
    process.terminate();
    if (process.wait(constants::PROCESS_TERMINATE_WAIT)) {
        LOG_INFO("Docker process terminated.");
        return;
    }

    LOG_WARNING("Docker process did not terminate gracefully; attempting kill...");
    process.kill();
    if (process.wait(constants::PROCESS_KILL_WAIT)) {
        LOG_INFO("Docker process killed.");
    } else {
        LOG_ERROR("Failed to kill Docker process " + std::to_string(process.pid()));
    }
}

void ContainerSupervisor::emergencyStop() {
    std::shared_ptr<ChildProcess> process;
    std::optional<std::string> containerId;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        process = currentProcess_;
        containerId = currentContainerId_;
    }

    if (containerId) {
        LOG_INFO("Attempting graceful stop of container " + *containerId + "...");
        stop(*containerId);
    } else {
        LOG_INFO("No active container ID known to stop gracefully.");
    }

    if (!process || process->poll()) {
        LOG_INFO("Main Docker process was not running or already terminated.");
        return;
    }

    LOG_INFO("Terminating main Docker process (PID: " + std::to_string(process->pid()) + ")...");
    process->terminate();
    if (process->wait(constants::PROCESS_TERMINATE_WAIT)) {
        LOG_INFO("Docker process terminated.");
        return;
    }
    LOG_WARNING("Docker process did not terminate gracefully, attempting kill...");
    process->kill();
    if (process->wait(constants::PROCESS_KILL_WAIT)) {
        LOG_INFO("Docker process killed.");
    } else {
        LOG_ERROR("Failed to kill Docker process " + std::to_string(process->pid()));
    }
}

void ContainerSupervisor::clearCurrent() {
    std::lock_guard<std::mutex> lock(mutex_);
    currentProcess_.reset();
    currentContainerId_.reset();
}

} } // namespace crawl_archiver::container
