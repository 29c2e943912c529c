#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include "ChildProcess.h"

namespace crawl_archiver { namespace container {

// Paths of the two per-attempt log files
struct StageLogPaths {
    std::filesystem::path stdoutLog;
    std::filesystem::path combinedLog;
};

/**
 * Drains a stage process's merged output on its own thread so the child can
 * never block on a full pipe. Every chunk is appended to both log files and,
 * optionally, mirrored to this process's stdout.
 */
class LogDrain {
public:
    /**
     * @param process Process whose output pipe is drained
     * @param paths Destination log files (created/appended)
     * @param stageLabel Name used for the drain thread's log records
     * @param teeToStdout Mirror output to the console
     */
    LogDrain(std::shared_ptr<ChildProcess> process,
             StageLogPaths paths,
             std::string stageLabel,
             bool teeToStdout);
    ~LogDrain();

    LogDrain(const LogDrain&) = delete;
    LogDrain& operator=(const LogDrain&) = delete;

    /**
     * Wait up to `grace` for end-of-stream, then stop reading and join.
     * @return true if the stream ended on its own
     */
    bool stop(std::chrono::milliseconds grace);

    const StageLogPaths& paths() const { return paths_; }

    // <output>/archive_<slug>_<timestamp>.{stdout,combined}.log
    static StageLogPaths makePaths(const std::filesystem::path& outputDir,
                                   const std::string& stageNameWithAttempt);

private:
    void run();

    std::shared_ptr<ChildProcess> process_;
    StageLogPaths paths_;
    std::string stageLabel_;
    bool teeToStdout_;

    std::atomic<bool> shouldStop_{false};
    std::atomic<bool> finished_{false};
    std::thread thread_;
};

// Lower-case `name` and replace spaces with underscores
std::string slugify(const std::string& name);

} } // namespace crawl_archiver::container
