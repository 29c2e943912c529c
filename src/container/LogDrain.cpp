#include "../../include/crawl_archiver/container/LogDrain.h"
#include "../../include/crawl_archiver/common/Constants.h"
#include "../../include/Logger.h"
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <poll.h>
#include <sstream>
#include <unistd.h>

namespace crawl_archiver { namespace container {

std::string slugify(const std::string& name) {
    std::string slug;
    slug.reserve(name.size());
    for (char c : name) {
        if (c == ' ') {
            slug += '_';
        } else {
            slug += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return slug;
}

StageLogPaths LogDrain::makePaths(const std::filesystem::path& outputDir,
                                  const std::string& stageNameWithAttempt) {
    std::time_t now = std::time(nullptr);
    std::tm localTm{};
    localtime_r(&now, &localTm);
    std::ostringstream ts;
    ts << std::put_time(&localTm, constants::TIMESTAMP_FORMAT.c_str());

    std::string base = constants::LOG_FILE_PREFIX + slugify(stageNameWithAttempt) + "_" + ts.str();
    return StageLogPaths{outputDir / (base + ".stdout.log"), outputDir / (base + ".combined.log")};
}

LogDrain::LogDrain(std::shared_ptr<ChildProcess> process,
                   StageLogPaths paths,
                   std::string stageLabel,
                   bool teeToStdout)
    : process_(std::move(process))
    , paths_(std::move(paths))
    , stageLabel_(std::move(stageLabel))
    , teeToStdout_(teeToStdout) {
    thread_ = std::thread(&LogDrain::run, this);
}

LogDrain::~LogDrain() {
    stop(std::chrono::milliseconds(0));
}

bool LogDrain::stop(std::chrono::milliseconds grace) {
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (!finished_.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    bool endedOnItsOwn = finished_.load();
    shouldStop_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
    return endedOnItsOwn;
}

void LogDrain::run() {
    Logger::setThreadName("log-drain[" + slugify(stageLabel_) + "]");

    std::error_code ec;
    std::filesystem::create_directories(paths_.stdoutLog.parent_path(), ec);

    std::ofstream stdoutFile(paths_.stdoutLog, std::ios::out | std::ios::app | std::ios::binary);
    std::ofstream combinedFile(paths_.combinedLog, std::ios::out | std::ios::app | std::ios::binary);
    if (!stdoutFile.is_open() || !combinedFile.is_open()) {
        LOG_ERROR("Could not open stage log files under " + paths_.stdoutLog.parent_path().string() +
                  "; output will only be drained");
    }

    int fd = process_->outputFd();
    char buffer[8192];

    while (!shouldStop_.load() && fd >= 0) {
        struct pollfd pfd{fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 200);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("Polling stage output failed: " + std::string(std::strerror(errno)));
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            LOG_ERROR("Reading stage output failed: " + std::string(std::strerror(errno)));
            break;
        }

        if (teeToStdout_) {
            std::cout.write(buffer, n);
            std::cout.flush();
        }
        if (stdoutFile.is_open()) {
            stdoutFile.write(buffer, n);
            stdoutFile.flush();
        }
        if (combinedFile.is_open()) {
            combinedFile.write(buffer, n);
            combinedFile.flush();
        }
    }

    finished_ = true;
    LOG_DEBUG("Stage log drain finished");
}

} } // namespace crawl_archiver::container
