#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include "EventChannel.h"
#include "../common/ShutdownToken.h"
#include "../container/ContainerRuntime.h"
#include "../models/ArchiveConfig.h"
#include "../state/JobState.h"

namespace crawl_archiver { namespace monitor {

/**
 * Follows one container's log stream on a background thread, feeds progress
 * and error signals into the JobState, and raises stalled/error/progress
 * events on the channel.
 */
class ProgressMonitor {
public:
    ProgressMonitor(std::string containerId,
                    std::shared_ptr<container::ChildProcess> runProcess,
                    container::ContainerRuntime& runtime,
                    state::JobState& state,
                    MonitorSettings settings,
                    EventChannel& events,
                    const ShutdownToken& shutdown);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void start();

    // Ask the thread to finish and join it
    void stop();

    bool isRunning() const { return running_.load(); }

    // Apply one log line to the job state
    void handleLine(const std::string& line, state::Clock::time_point now);

    /**
     * Evaluate the stall condition, then the error thresholds. At most one
     * event is raised; the matching counters are reset when it is.
     * @return true if an event was raised
     */
    bool checkConditions(state::Clock::time_point now);

private:
    void run();
    void followLogs();
    bool containerGone();

    std::string containerId_;
    std::shared_ptr<container::ChildProcess> runProcess_;
    container::ContainerRuntime& runtime_;
    state::JobState& state_;
    MonitorSettings settings_;
    EventChannel& events_;
    const ShutdownToken& shutdown_;

    std::thread thread_;
    std::atomic<bool> shouldStop_{false};
    std::atomic<bool> running_{false};
};

} } // namespace crawl_archiver::monitor
