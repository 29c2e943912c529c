#pragma once

#include "../../include/crawl_archiver/container/ContainerRuntime.h"
#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <sys/types.h>
#include <vector>

// Runs /bin/sh scripts in place of crawler containers
class FakeContainerRuntime : public crawl_archiver::container::ContainerRuntime {
public:
    using RunSpec = crawl_archiver::container::RunSpec;
    using ChildProcess = crawl_archiver::container::ChildProcess;

    // Script executed for each launched "container"; defaults to a clean exit
    std::function<std::string(const RunSpec&)> scriptFor = [](const RunSpec&) { return "exit 0"; };

    // Script whose output stands in for the followed container logs
    std::string logScript = "exit 0";

    bool available = true;
    bool logsUnavailable = false;
    bool reportContainerId = true;
    std::atomic<bool> containerAlive{false};

    bool isAvailable() override { return available; }

    std::unique_ptr<ChildProcess> runDetached(const RunSpec& spec, std::string& error) override {
        std::string script = scriptFor(spec);
        auto process = ChildProcess::spawn({"/bin/sh", "-c", script}, error);
        std::lock_guard<std::mutex> lock(mutex_);
        runs.push_back(spec);
        if (process) {
            pids_.push_back(process->pid());
        }
        return process;
    }

    std::optional<std::string> findByLabel(const std::string& label) override {
        if (!reportContainerId) {
            return std::nullopt;
        }
        return "fake-" + label;
    }

    bool isRunning(const std::string&) override {
        ++livenessProbes;
        return containerAlive.load();
    }

    std::unique_ptr<ChildProcess> followLogs(const std::string&, int, std::string& error) override {
        if (logsUnavailable) {
            error = "log stream unavailable";
            return nullptr;
        }
        return ChildProcess::spawn({"/bin/sh", "-c", logScript}, error);
    }

    bool stop(const std::string& containerId, std::chrono::seconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped.push_back(containerId);
        signalAll(SIGTERM);
        return true;
    }

    bool kill(const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        signalAll(SIGKILL);
        return true;
    }

    void relaxPermissions(const std::filesystem::path&) override {
        ++relaxCalls;
    }

    std::vector<RunSpec> runsSnapshot() {
        std::lock_guard<std::mutex> lock(mutex_);
        return runs;
    }

    std::vector<RunSpec> runs;
    std::vector<std::string> stopped;
    std::atomic<int> livenessProbes{0};
    std::atomic<int> relaxCalls{0};

private:
    void signalAll(int sig) {
        for (pid_t pid : pids_) {
            ::kill(pid, sig);
        }
    }

    std::mutex mutex_;
    std::vector<pid_t> pids_;
};
