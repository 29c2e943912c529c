#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace crawl_archiver { namespace container {

/**
 * A spawned child with stdin bound to /dev/null and stdout+stderr merged into
 * one pipe. The child runs in its own process group so terminal signals reach
 * only this process, which decides how to stop it.
 *
 * Exit codes follow the shell convention: a child killed by signal N reports 128+N.
 */
class ChildProcess {
public:
    /**
     * Start `argv[0]` (resolved on PATH) with the given arguments.
     * @param argv Program and arguments
     * @param error Receives the reason when the process could not be started
     * @return The running child, or nullptr
     */
    static std::unique_ptr<ChildProcess> spawn(const std::vector<std::string>& argv,
                                               std::string& error);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }

    // Read end of the merged output pipe, -1 once closed
    int outputFd() const { return outputFd_; }
    void closeOutput();

    // Non-blocking reap; the exit code once the child has exited
    std::optional<int> poll();

    // Wait up to `timeout` for the child to exit
    std::optional<int> wait(std::chrono::milliseconds timeout);

    bool isRunning() { return !poll().has_value(); }

    // Send SIGTERM / SIGKILL; false if the child is already gone
    bool terminate();
    bool kill();

private:
    ChildProcess(pid_t pid, int outputFd);
    bool sendSignal(int sig);

    pid_t pid_;
    int outputFd_;
    std::mutex mutex_;
    std::optional<int> exitCode_;
};

struct CommandResult {
    bool started = false;
    bool timedOut = false;
    int exitCode = -1;
    std::string output;

    bool succeeded() const { return started && !timedOut && exitCode == 0; }
};

// Runs a short-lived command to completion, collecting its merged output
using CommandRunner = std::function<CommandResult(const std::vector<std::string>&,
                                                  std::chrono::milliseconds)>;

/**
 * Run `argv` and capture its output, killing it when `timeout` expires.
 */
CommandResult runCommand(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout);

/**
 * Split a command line into words using POSIX shell quoting rules
 * (single quotes, double quotes, backslash escapes). No expansion is done.
 * @return nullopt if a quote is left unterminated
 */
std::optional<std::vector<std::string>> splitCommandLine(const std::string& commandLine);

// Render argv for logs, quoting words that contain whitespace
std::string formatCommand(const std::vector<std::string>& argv);

} } // namespace crawl_archiver::container
