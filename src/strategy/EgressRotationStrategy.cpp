#include "../../include/crawl_archiver/strategy/EgressRotationStrategy.h"
#include "../../include/crawl_archiver/common/Constants.h"
#include "../../include/Logger.h"
#include <cstdlib>
#include <sstream>
#include <unistd.h>

namespace crawl_archiver { namespace strategy {

namespace {

constexpr size_t COMMAND_OUTPUT_LOG_LIMIT = 2000;

std::string trimmedOutput(const std::string& output) {
    std::string text = output;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    if (text.size() > COMMAND_OUTPUT_LOG_LIMIT) {
        text = "..." + text.substr(text.size() - COMMAND_OUTPUT_LOG_LIMIT);
    }
    return text;
}

} // namespace

EgressRotationStrategy::EgressRotationStrategy(state::JobState& state,
                                               const AdaptationSettings& settings,
                                               const ShutdownToken& shutdown,
                                               container::CommandRunner runner)
    : state_(state), settings_(settings), shutdown_(shutdown), runner_(std::move(runner)) {
}

bool EgressRotationStrategy::isExecutableAvailable(const std::string& program) {
    if (program.empty()) {
        return false;
    }
    if (program.find('/') != std::string::npos) {
        return ::access(program.c_str(), X_OK) == 0;
    }

    const char* pathEnv = std::getenv("PATH");
    if (pathEnv == nullptr) {
        return false;
    }
    std::stringstream dirs(pathEnv);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + program;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

bool EgressRotationStrategy::attempt(const monitor::MonitorEvent&) {
    if (!settings_.enableVpnRotation) {
        LOG_DEBUG("VPN rotation strategy disabled.");
        return false;
    }
    if (state_.vpnRotationsDone() >= settings_.maxVpnRotations) {
        LOG_WARNING("VPN rotation: max rotations (" + std::to_string(settings_.maxVpnRotations) +
                    ") already performed.");
        return false;
    }
    if (settings_.vpnConnectCommand.empty()) {
        LOG_ERROR("VPN rotation strategy enabled, but no connect command is configured.");
        return false;
    }
    if (!settings_.vpnDisconnectCommand.empty()) {
        LOG_WARNING("Ignoring the VPN disconnect command; rotation relies on the connect command alone.");
    }

    auto argv = container::splitCommandLine(settings_.vpnConnectCommand);
    if (!argv || argv->empty()) {
        LOG_ERROR("Could not parse VPN connect command: " + settings_.vpnConnectCommand);
        return false;
    }
    if (!isExecutableAvailable(argv->front())) {
        LOG_ERROR("VPN connect command '" + argv->front() + "' not found in PATH. Cannot rotate VPN.");
        return false;
    }

    auto now = state::Clock::now();
    auto minInterval = std::chrono::duration_cast<state::Clock::duration>(settings_.vpnRotationFrequency);
    auto lastRotation = state_.lastVpnRotation();
    if (lastRotation && minInterval.count() > 0) {
        auto sinceLast = now - *lastRotation;
        if (sinceLast < minInterval) {
            auto waitMore = std::chrono::duration_cast<std::chrono::seconds>(minInterval - sinceLast);
            LOG_INFO("VPN rotation frequency limit not met. Last rotation was " +
                     std::to_string(std::chrono::duration_cast<std::chrono::seconds>(sinceLast).count()) +
                     "s ago. Need to wait " + std::to_string(waitMore.count()) + " more seconds.");
            return false;
        }
    }

    LOG_WARNING("Attempting VPN rotation while the container keeps running...");
    LOG_INFO("Executing VPN connect command: " + container::formatCommand(*argv));
    container::CommandResult result = runner_(*argv, constants::EXTERNAL_COMMAND_TIMEOUT);

    if (!result.output.empty()) {
        LOG_DEBUG("VPN connect output:\n" + trimmedOutput(result.output));
    }
    if (!result.succeeded()) {
        if (!result.started) {
            LOG_ERROR("VPN connect command could not be started: " + trimmedOutput(result.output));
        } else if (result.timedOut) {
            LOG_ERROR("VPN connect command timed out after " +
                      std::to_string(constants::EXTERNAL_COMMAND_TIMEOUT.count()) + "s.");
        } else {
            LOG_ERROR("VPN connect command failed with exit code " + std::to_string(result.exitCode) + ".");
        }
        return false;
    }

    LOG_INFO("VPN connect command succeeded. Waiting " + std::to_string(settings_.vpnSettleDelay.count()) +
             "s for the network to settle...");
    if (shutdown_.waitFor(settings_.vpnSettleDelay)) {
        LOG_WARNING("Shutdown requested during post-VPN delay. Rotation not recorded.");
        return false;
    }

    state_.recordVpnRotation(now);
    LOG_INFO("VPN rotation finished (count: " + std::to_string(state_.vpnRotationsDone()) + "/" +
             std::to_string(settings_.maxVpnRotations) + "). Container continues running.");
    return true;
}

} } // namespace crawl_archiver::strategy
