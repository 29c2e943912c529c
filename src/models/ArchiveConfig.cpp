#include "../../include/crawl_archiver/models/ArchiveConfig.h"
#include "../../include/Logger.h"
#include <cctype>
#include <cstdlib>

namespace crawl_archiver {

namespace {

std::optional<int> parsePositiveInt(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    try {
        return std::stoi(text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::string> envValue(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace

std::vector<std::string> ArchiveConfig::validate() const {
    std::vector<std::string> problems;

    if (seeds.empty()) {
        problems.push_back("at least one seed URL is required");
    }
    if (name.empty()) {
        problems.push_back("--name is required");
    }
    if (outputDir.empty()) {
        problems.push_back("--output-dir is required");
    }
    if ((adaptation.enableAdaptiveWorkers || adaptation.enableVpnRotation ||
         adaptation.enableAdaptiveRestart) && !enableMonitoring) {
        problems.push_back("--enable-adaptive-workers, --enable-vpn-rotation and "
                           "--enable-adaptive-restart require --enable-monitoring");
    }
    if (adaptation.enableVpnRotation && adaptation.vpnConnectCommand.empty()) {
        problems.push_back("--enable-vpn-rotation requires --vpn-connect-command");
    }
    if (adaptation.minWorkers < 1) {
        problems.push_back("--min-workers must be 1 or greater");
    }
    if (adaptation.vpnRotationFrequency.count() < 0) {
        problems.push_back("--vpn-rotation-frequency-minutes cannot be negative");
    }
    if (adaptation.maxWorkerReductions < 0 || adaptation.maxVpnRotations < 0 ||
        adaptation.maxContainerRestarts < 0) {
        problems.push_back("adaptation caps cannot be negative");
    }
    if (monitor.pollInterval.count() < 1) {
        problems.push_back("--monitor-interval-seconds must be 1 or greater");
    }
    if (monitor.stallTimeout.count() < 1) {
        problems.push_back("--stall-timeout-minutes must be 1 or greater");
    }
    if (monitor.errorThresholdTimeout < 1 || monitor.errorThresholdHttp < 1) {
        problems.push_back("error thresholds must be 1 or greater");
    }
    if (backoffDelay.count() < 0) {
        problems.push_back("--backoff-delay-minutes cannot be negative");
    }
    if (maxStageAttempts < 1) {
        problems.push_back("--max-stage-attempts must be 1 or greater");
    }

    return problems;
}

int ArchiveConfig::effectiveInitialWorkers() const {
    int workers = initialWorkers;

    for (size_t i = 0; i < passthroughArgs.size(); ++i) {
        const std::string& arg = passthroughArgs[i];
        if (arg == "--workers") {
            if (i + 1 < passthroughArgs.size()) {
                auto parsed = parsePositiveInt(passthroughArgs[i + 1]);
                if (parsed) {
                    LOG_INFO("Found passthrough '--workers " + passthroughArgs[i + 1] +
                             "', overriding initial workers setting");
                    workers = *parsed;
                    break;
                }
                LOG_WARNING("Found '--workers' but value '" + passthroughArgs[i + 1] +
                            "' is not an integer. Ignoring.");
            }
        } else if (arg.rfind("--workers=", 0) == 0) {
            auto parsed = parsePositiveInt(arg.substr(10));
            if (parsed) {
                LOG_INFO("Found passthrough '" + arg + "', overriding initial workers setting");
                workers = *parsed;
                break;
            }
            LOG_WARNING("Found '" + arg + "' but could not parse integer value. Ignoring.");
        }
    }

    return workers < 1 ? 1 : workers;
}

std::filesystem::path ArchiveConfig::finalArtifactPath() const {
    return outputDir / (name + constants::FINAL_ARTIFACT_EXTENSION);
}

void ArchiveConfig::applyEnvironment() {
    if (auto memory = envValue("CRAWL_ARCHIVER_DOCKER_MEMORY_LIMIT")) {
        if (memory->empty()) {
            container.memoryLimit.reset();
        } else {
            container.memoryLimit = *memory;
        }
    }
    if (auto cpu = envValue("CRAWL_ARCHIVER_DOCKER_CPU_LIMIT")) {
        if (cpu->empty()) {
            container.cpuLimit.reset();
        } else {
            container.cpuLimit = *cpu;
        }
    }
    if (auto shm = envValue("CRAWL_ARCHIVER_DOCKER_SHM_SIZE")) {
        if (!shm->empty()) {
            container.shmSize = *shm;
        }
    }
}

} // namespace crawl_archiver
