#pragma once

#include <atomic>
#include <functional>
#include <thread>
#include "../common/ShutdownToken.h"

namespace crawl_archiver { namespace orchestrator {

/**
 * Turns SIGINT/SIGTERM/SIGHUP into a cooperative stop. The signals are
 * blocked process-wide and consumed synchronously on a dedicated thread, so
 * the stop callback may take locks and spawn commands.
 */
class SignalWatcher {
public:
    using StopCallback = std::function<void(int signalNumber)>;

    SignalWatcher(ShutdownToken& shutdown, StopCallback onStop);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // Must run on the main thread before any other thread is created
    static bool blockTerminationSignals();

    void start();
    void stop();

    // Signal that triggered the stop, or 0
    int receivedSignal() const { return receivedSignal_.load(); }

private:
    void run();

    ShutdownToken& shutdown_;
    StopCallback onStop_;
    std::atomic<bool> shouldStop_{false};
    std::atomic<int> receivedSignal_{0};
    std::thread thread_;
};

} } // namespace crawl_archiver::orchestrator
