#include "../../include/crawl_archiver/monitor/ProgressMonitor.h"
#include "../../include/crawl_archiver/monitor/LogLineClassifier.h"
#include "../../include/Logger.h"
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <poll.h>
#include <unistd.h>

namespace crawl_archiver { namespace monitor {

namespace {

constexpr int LOG_READ_POLL_MS = 500;
constexpr std::chrono::seconds LIVENESS_PROBE_INTERVAL{5};
constexpr std::chrono::seconds LOG_PROCESS_EXIT_WAIT{5};
constexpr size_t LOG_EXCERPT_LENGTH = 200;

std::string excerpt(const std::string& line) {
    if (line.size() <= LOG_EXCERPT_LENGTH) {
        return line;
    }
    return line.substr(0, LOG_EXCERPT_LENGTH) + "...";
}

} // namespace

ProgressMonitor::ProgressMonitor(std::string containerId,
                                 std::shared_ptr<container::ChildProcess> runProcess,
                                 container::ContainerRuntime& runtime,
                                 state::JobState& state,
                                 MonitorSettings settings,
                                 EventChannel& events,
                                 const ShutdownToken& shutdown)
    : containerId_(std::move(containerId))
    , runProcess_(std::move(runProcess))
    , runtime_(runtime)
    , state_(state)
    , settings_(settings)
    , events_(events)
    , shutdown_(shutdown) {
}

ProgressMonitor::~ProgressMonitor() {
    stop();
}

void ProgressMonitor::start() {
    if (thread_.joinable()) {
        return;
    }
    shouldStop_ = false;
    running_ = true;
    thread_ = std::thread(&ProgressMonitor::run, this);
}

void ProgressMonitor::stop() {
    shouldStop_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

void ProgressMonitor::run() {
    Logger::setThreadName("monitor");
    LOG_INFO("Starting monitoring for container " + containerId_ + "...");

    try {
        followLogs();
    } catch (const std::exception& e) {
        if (!shutdown_.isStopRequested() && !shouldStop_.load()) {
            LOG_ERROR(std::string("Error in monitoring thread: ") + e.what());
            events_.push(MonitorEvent::error(MONITOR_FAILED_REASON));
        }
    }

    running_ = false;
    LOG_INFO("Monitoring thread stopped.");
}

void ProgressMonitor::followLogs() {
    auto delayEnd = state::Clock::now() + settings_.startupDelay;
    while (state::Clock::now() < delayEnd) {
        if (shouldStop_.load() || shutdown_.isStopRequested()) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    std::string error;
    std::unique_ptr<container::ChildProcess> logProcess =
        runtime_.followLogs(containerId_, settings_.logTailLines, error);
    if (!logProcess) {
        LOG_ERROR("Failed to start log monitoring: " + error);
        events_.push(MonitorEvent::error(MONITOR_FAILED_REASON));
        return;
    }

    auto interval = std::chrono::duration_cast<state::Clock::duration>(settings_.pollInterval);
    auto lastCheck = state::Clock::now();
    auto lastReport = lastCheck;
    auto lastProbe = state::Clock::time_point{};
    std::string partial;
    char buffer[8192];

    while (!shouldStop_.load() && !shutdown_.isStopRequested()) {
        auto now = state::Clock::now();

        if (runProcess_->poll() && now - lastProbe >= LIVENESS_PROBE_INTERVAL) {
            lastProbe = now;
            if (containerGone()) {
                LOG_INFO("Main Docker process appears to have exited. Stopping monitor.");
                break;
            }
        }

        struct pollfd pfd{logProcess->outputFd(), POLLIN, 0};
        int ready = ::poll(&pfd, 1, LOG_READ_POLL_MS);
        if (ready < 0 && errno != EINTR) {
            LOG_WARNING(std::string("Error reading log stream: ") + std::strerror(errno) +
                        ". Assuming logs ended.");
            break;
        }

        bool streamEnded = false;
        if (ready > 0) {
            ssize_t n = ::read(logProcess->outputFd(), buffer, sizeof(buffer));
            if (n > 0) {
                partial.append(buffer, static_cast<size_t>(n));
                size_t newline;
                while ((newline = partial.find('\n')) != std::string::npos) {
                    std::string line = partial.substr(0, newline);
                    partial.erase(0, newline + 1);
                    handleLine(line, state::Clock::now());
                }
            } else if (n == 0) {
                streamEnded = true;
            } else if (errno != EINTR && errno != EAGAIN) {
                LOG_WARNING(std::string("Error reading log stream: ") + std::strerror(errno) +
                            ". Assuming logs ended.");
                streamEnded = true;
            }
        }

        if (streamEnded) {
            if (!partial.empty()) {
                handleLine(partial, state::Clock::now());
            }
            LOG_INFO("Docker logs stream ended.");
            break;
        }

        now = state::Clock::now();
        if (now - lastCheck >= interval) {
            if (checkConditions(now)) {
                lastReport = now;
            }
            lastCheck = now;
        }
        if (now - lastReport >= interval) {
            events_.push(MonitorEvent::progress());
            lastReport = now;
        }
    }

    if (!logProcess->poll()) {
        LOG_DEBUG("Terminating docker logs process...");
        logProcess->terminate();
        if (!logProcess->wait(LOG_PROCESS_EXIT_WAIT)) {
            LOG_WARNING("Could not cleanly terminate docker logs process, killing it");
            logProcess->kill();
            logProcess->wait(LOG_PROCESS_EXIT_WAIT);
        }
    }
}

bool ProgressMonitor::containerGone() {
    if (runtime_.isRunning(containerId_)) {
        LOG_DEBUG("Container " + containerId_ + " is still running despite the run process reporting exit.");
        return false;
    }
    LOG_INFO("Confirmed: container " + containerId_ + " is not running.");
    return true;
}

void ProgressMonitor::handleLine(const std::string& rawLine, state::Clock::time_point now) {
    std::string line = rawLine;
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
        line.pop_back();
    }

    LineClassification result = LogLineClassifier::classify(line);
    switch (result.kind) {
        case LineClassification::Kind::Stats:
            state_.updateProgress(result.stats, now);
            break;
        case LineClassification::Kind::Error:
            state_.recordError(result.category);
            if (result.category == ErrorCategory::Other) {
                LOG_ERROR("Generic error detected in logs: " + excerpt(line));
            } else {
                LOG_WARNING(errorCategoryName(result.category) + " error detected in logs: " + excerpt(line));
            }
            break;
        case LineClassification::Kind::Ignored:
            break;
    }
}

bool ProgressMonitor::checkConditions(state::Clock::time_point now) {
    auto stallTimeout = std::chrono::duration_cast<std::chrono::seconds>(settings_.stallTimeout);
    if (state_.isStalled(now, stallTimeout)) {
        auto snapshot = state_.snapshot();
        double idleSeconds = std::chrono::duration<double>(now - snapshot.lastProgressTimestamp.value_or(now)).count();
        LOG_WARNING_STREAM("Stall Condition Met: No progress for " << std::fixed << std::setprecision(1)
                           << idleSeconds << " seconds.");
        events_.push(MonitorEvent::stalled("timeout"));
        state_.markStallHandled(now);
        return true;
    }

    ErrorCounts counts = state_.errorCounts();
    if (counts.timeout >= settings_.errorThresholdTimeout) {
        LOG_WARNING("Error Condition Met: " + std::to_string(counts.timeout) + " timeouts.");
        events_.push(MonitorEvent::error("timeout_threshold"));
        state_.resetRuntimeErrors();
        return true;
    }
    if (counts.http >= settings_.errorThresholdHttp) {
        LOG_WARNING("Error Condition Met: " + std::to_string(counts.http) + " HTTP/network errors.");
        events_.push(MonitorEvent::error("http_threshold"));
        state_.resetRuntimeErrors();
        return true;
    }
    return false;
}

} } // namespace crawl_archiver::monitor
