#include "../../include/crawl_archiver/orchestrator/SignalWatcher.h"
#include "../../include/Logger.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <pthread.h>
#include <string>

namespace crawl_archiver { namespace orchestrator {

namespace {

sigset_t terminationSignals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    return set;
}

} // namespace

SignalWatcher::SignalWatcher(ShutdownToken& shutdown, StopCallback onStop)
    : shutdown_(shutdown)
    , onStop_(std::move(onStop)) {
}

SignalWatcher::~SignalWatcher() {
    stop();
}

bool SignalWatcher::blockTerminationSignals() {
    sigset_t set = terminationSignals();
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        LOG_ERROR("Failed to block termination signals: " + std::string(std::strerror(rc)));
        return false;
    }
    return true;
}

void SignalWatcher::start() {
    if (thread_.joinable()) {
        return;
    }
    shouldStop_ = false;
    thread_ = std::thread(&SignalWatcher::run, this);
}

void SignalWatcher::stop() {
    shouldStop_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void SignalWatcher::run() {
    Logger::setThreadName("signals");
    sigset_t set = terminationSignals();
    timespec timeout{0, 200 * 1000 * 1000};

    while (!shouldStop_.load()) {
        siginfo_t info;
        int sig = sigtimedwait(&set, &info, &timeout);
        if (sig < 0) {
            if (errno != EAGAIN && errno != EINTR) {
                LOG_ERROR("sigtimedwait failed: " + std::string(std::strerror(errno)));
                return;
            }
            continue;
        }

        if (shutdown_.isStopRequested()) {
            LOG_WARNING("Signal " + std::to_string(sig) + " received again; shutdown already in progress.");
            continue;
        }

        LOG_WARNING("Signal " + std::to_string(sig) + " (" + strsignal(sig) + ") received. Initiating graceful shutdown...");
        receivedSignal_ = sig;
        shutdown_.requestStop();
        if (onStop_) {
            try {
                onStop_(sig);
            } catch (const std::exception& e) {
                LOG_ERROR("Emergency stop failed: " + std::string(e.what()));
            }
        }
        LOG_INFO("Signal handling complete. Waiting for the main loop to finish...");
    }
}

} } // namespace crawl_archiver::orchestrator
