#include "../../include/crawl_archiver/state/JobState.h"
#include "../../include/crawl_archiver/common/Constants.h"
#include "../../include/Logger.h"
#include "../common/DurableFile.h"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <set>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace crawl_archiver { namespace state {

namespace fs = std::filesystem;

namespace {

// Directory check that treats an unreadable path (stale mount) as still present
bool isDirectoryOrUnknown(const fs::path& path) {
    std::error_code ec;
    fs::file_status status = fs::status(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
            return false;
        }
        LOG_WARNING("Could not stat temp dir " + path.string() + ": " + ec.message());
        return true;
    }
    return fs::is_directory(status);
}

bool isDirectory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

fs::path canonicalOrSelf(const fs::path& path) {
    std::error_code ec;
    fs::path canonical = fs::canonical(path, ec);
    return ec ? path : canonical;
}

std::vector<fs::path> normalizeTempDirs(const std::vector<fs::path>& paths) {
    std::vector<std::pair<fs::file_time_type, fs::path>> entries;
    std::set<std::string> seen;

    for (const auto& raw : paths) {
        if (!isDirectoryOrUnknown(raw)) {
            continue;
        }
        fs::path canonical = canonicalOrSelf(raw);
        if (!seen.insert(canonical.string()).second) {
            continue;
        }
        std::error_code ec;
        fs::file_time_type mtime = fs::last_write_time(canonical, ec);
        if (ec) {
            mtime = fs::file_time_type::min();
        }
        entries.emplace_back(mtime, canonical);
    }

    std::stable_sort(entries.begin(), entries.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<fs::path> result;
    result.reserve(entries.size());
    for (auto& entry : entries) {
        result.push_back(std::move(entry.second));
    }
    return result;
}

template <typename T>
std::optional<T> readInt(const json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        LOG_WARNING(std::string("State field '") + key + "' has invalid type, using default");
        return std::nullopt;
    }
    return it->get<T>();
}

} // namespace

JobState::JobState(const fs::path& outputDir, int initialWorkers)
    : outputDir_(canonicalOrSelf(outputDir))
    , stateFilePath_(outputDir_ / constants::STATE_FILE_NAME) {
    int initial = std::max(1, initialWorkers);
    data_.initialWorkers = initial;
    data_.currentWorkers = initial;

    load();
    save();
}

void JobState::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (!fs::exists(stateFilePath_, ec)) {
        LOG_INFO("No previous state file found. Initializing fresh state.");
        resetDurableLocked();
        return;
    }

    json data;
    try {
        std::ifstream in(stateFilePath_);
        data = json::parse(in);
    } catch (const std::exception& e) {
        LOG_WARNING("Could not load or parse state file " + stateFilePath_.string() +
                    ": " + e.what() + ". Resetting state.");
        resetDurableLocked();
        return;
    }

    if (!data.is_object()) {
        LOG_WARNING("State file " + stateFilePath_.string() + " is not a JSON object. Resetting state.");
        resetDurableLocked();
        return;
    }

    resetDurableLocked();

    if (auto workers = readInt<int>(data, "current_workers")) {
        data_.currentWorkers = std::clamp(*workers, 1, data_.initialWorkers);
        if (*workers != data_.currentWorkers) {
            LOG_WARNING("Clamped persisted worker count " + std::to_string(*workers) +
                        " to " + std::to_string(data_.currentWorkers));
        }
    }
    if (auto persistedInitial = readInt<int>(data, "initial_workers")) {
        if (*persistedInitial != data_.initialWorkers) {
            LOG_INFO("Initial workers changed from " + std::to_string(*persistedInitial) +
                     " to " + std::to_string(data_.initialWorkers));
        }
    }
    if (auto value = readInt<int>(data, "vpn_rotations_done")) {
        data_.vpnRotationsDone = std::max(0, *value);
    }
    if (auto value = readInt<int>(data, "worker_reductions_done")) {
        data_.workerReductionsDone = std::max(0, *value);
    }
    if (auto value = readInt<int>(data, "container_restarts_done")) {
        data_.containerRestartsDone = std::max(0, *value);
    }

    auto dirsIt = data.find("temp_dirs_host_paths");
    if (dirsIt != data.end()) {
        if (dirsIt->is_array()) {
            for (const auto& entry : *dirsIt) {
                if (!entry.is_string()) {
                    LOG_WARNING("Ignoring non-string temp dir entry in state file");
                    continue;
                }
                fs::path path(entry.get<std::string>());
                if (isDirectory(path)) {
                    data_.tempDirs.push_back(path);
                }
            }
        } else {
            LOG_WARNING("State field 'temp_dirs_host_paths' has invalid type, using default");
        }
    }

    LOG_INFO("Loaded persistent state from " + stateFilePath_.string() +
             ": Workers=" + std::to_string(data_.currentWorkers) +
             ", Rotations=" + std::to_string(data_.vpnRotationsDone) +
             ", Reductions=" + std::to_string(data_.workerReductionsDone) +
             ", Restarts=" + std::to_string(data_.containerRestartsDone) +
             ", TempDirs=" + std::to_string(data_.tempDirs.size()));
}

bool JobState::save() {
    std::lock_guard<std::mutex> saveLock(saveMutex_);

    std::vector<fs::path> original;
    json data;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        original = data_.tempDirs;
        data["current_workers"] = data_.currentWorkers;
        data["initial_workers"] = data_.initialWorkers;
        data["vpn_rotations_done"] = data_.vpnRotationsDone;
        data["worker_reductions_done"] = data_.workerReductionsDone;
        data["container_restarts_done"] = data_.containerRestartsDone;
        data["last_error_counts"] = {
            {"timeout", data_.errorCounts.timeout},
            {"http", data_.errorCounts.http},
            {"other", data_.errorCounts.other}
        };
    }

    std::vector<fs::path> normalized = normalizeTempDirs(original);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Keep entries added by another thread while the filesystem was being checked
        for (const auto& path : data_.tempDirs) {
            if (std::find(original.begin(), original.end(), path) == original.end()) {
                normalized.push_back(path);
            }
        }
        data_.tempDirs = normalized;
    }

    json dirs = json::array();
    for (const auto& path : normalized) {
        dirs.push_back(path.string());
    }
    data["temp_dirs_host_paths"] = dirs;

    std::string error;
    if (!writeFileDurably(stateFilePath_, data.dump(2), error)) {
        LOG_ERROR("Could not save state file " + stateFilePath_.string() + ": " + error);
        return false;
    }
    LOG_DEBUG("Saved persistent state to " + stateFilePath_.string());
    return true;
}

void JobState::addTempDir(const fs::path& path) {
    if (path.empty()) {
        return;
    }
    if (!isDirectory(path)) {
        LOG_WARNING("Attempted to add non-directory temp path: " + path.string());
        return;
    }

    fs::path canonical = canonicalOrSelf(path);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& known : data_.tempDirs) {
            if (canonicalOrSelf(known) == canonical) {
                return;
            }
        }
        LOG_DEBUG("Adding temp dir to state: " + canonical.string());
        data_.tempDirs.push_back(canonical);
    }
    save();
}

std::vector<fs::path> JobState::tempDirs() {
    std::vector<fs::path> existing;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<fs::path> kept;
        for (const auto& path : data_.tempDirs) {
            if (isDirectory(path)) {
                existing.push_back(path);
                kept.push_back(path);
            } else {
                LOG_WARNING("Temp dir path from state does not exist or is not a directory: " +
                            path.string() + ". Removing from state.");
                changed = true;
            }
        }
        data_.tempDirs = std::move(kept);
    }
    if (changed) {
        save();
    }
    return existing;
}

void JobState::resetForOverwrite() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        resetDurableLocked();
    }
    LOG_INFO("State reset for overwrite: counters and temp dir history cleared");
    save();
}

void JobState::resetAdaptationCounts() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.vpnRotationsDone = 0;
        data_.workerReductionsDone = 0;
        data_.containerRestartsDone = 0;
        data_.lastVpnRotationTimestamp.reset();
    }
    save();
}

void JobState::resetRuntimeErrors() {
    std::lock_guard<std::mutex> lock(mutex_);
    resetRuntimeErrorsLocked();
}

void JobState::resetForNewAttempt(const std::string& stageName) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.status = "running";
    data_.currentStageName = stageName;
    data_.lastStats = CrawlStats{};
    data_.lastProgressTimestamp.reset();
    data_.lastStatsTimestamp.reset();
    data_.progressRatePpm = 0.0;
    previousCrawledCount_ = -1;
    previousStatsTimestamp_.reset();
    resetRuntimeErrorsLocked();
}

void JobState::setStatus(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.status = status;
}

void JobState::updateProgress(const CrawlStats& stats, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    const CrawlStats& last = data_.lastStats;
    CrawlStats incoming = stats;
    if (incoming.crawled < 0) incoming.crawled = last.crawled;
    if (incoming.total < 0) incoming.total = last.total;
    if (incoming.pending < 0) incoming.pending = last.pending;
    if (incoming.failed < 0) incoming.failed = last.failed;

    if (previousCrawledCount_ < 0 && incoming.crawled >= 0) {
        previousCrawledCount_ = incoming.crawled;
        previousStatsTimestamp_ = now;
    }

    bool progressMade = incoming.crawled > last.crawled;
    bool statsChanged = incoming.crawled != last.crawled || incoming.total != last.total ||
                        incoming.pending != last.pending || incoming.failed != last.failed;

    if (previousStatsTimestamp_ && now > *previousStatsTimestamp_ &&
        incoming.crawled >= previousCrawledCount_) {
        double seconds = std::chrono::duration<double>(now - *previousStatsTimestamp_).count();
        long long delta = incoming.crawled - previousCrawledCount_;
        if (seconds > 1.0) {
            data_.progressRatePpm = static_cast<double>(delta) * 60.0 / seconds;
            previousStatsTimestamp_ = now;
            previousCrawledCount_ = incoming.crawled;
        }
    }

    if (progressMade) {
        data_.lastProgressTimestamp = now;
        if (data_.errorCounts.any()) {
            LOG_INFO("Progress detected, resetting error counts.");
            resetRuntimeErrorsLocked();
        }
    }

    data_.lastStats = incoming;
    data_.lastStatsTimestamp = now;

    if (statsChanged) {
        LOG_DEBUG_STREAM("Stats Update: Crawled=" << incoming.crawled
                         << ", Total=" << incoming.total
                         << ", Pending=" << incoming.pending
                         << ", Failed=" << incoming.failed
                         << ", Rate=" << std::fixed << std::setprecision(1)
                         << data_.progressRatePpm << " ppm");
    }
}

void JobState::recordError(ErrorCategory category) {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (category) {
        case ErrorCategory::Timeout: ++data_.errorCounts.timeout; break;
        case ErrorCategory::Http: ++data_.errorCounts.http; break;
        case ErrorCategory::Other: ++data_.errorCounts.other; break;
    }
    data_.lastErrorCategory = category;
}

bool JobState::isStalled(Clock::time_point now, std::chrono::seconds stallTimeout) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!data_.lastProgressTimestamp || data_.lastStats.crawled < 0) {
        return false;
    }
    long long pending = data_.lastStats.pending;
    if (pending == 0) {
        return false;
    }
    return now - *data_.lastProgressTimestamp > stallTimeout;
}

void JobState::markStallHandled(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.lastProgressTimestamp = now;
    resetRuntimeErrorsLocked();
}

bool JobState::reduceWorkers(int minWorkers) {
    int before;
    int after;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int floor = std::max(1, minWorkers);
        before = data_.currentWorkers;
        if (before <= floor) {
            return false;
        }
        after = before - 1;
        data_.currentWorkers = after;
        ++data_.workerReductionsDone;
        resetRuntimeErrorsLocked();
    }
    LOG_INFO("Reduced workers from " + std::to_string(before) + " to " + std::to_string(after));
    save();
    return true;
}

void JobState::recordVpnRotation(Clock::time_point when) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++data_.vpnRotationsDone;
        data_.lastVpnRotationTimestamp = when;
        resetRuntimeErrorsLocked();
    }
    save();
}

void JobState::recordContainerRestart() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++data_.containerRestartsDone;
        resetRuntimeErrorsLocked();
    }
    save();
}

int JobState::currentWorkers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.currentWorkers;
}

int JobState::initialWorkers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.initialWorkers;
}

int JobState::vpnRotationsDone() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.vpnRotationsDone;
}

int JobState::workerReductionsDone() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.workerReductionsDone;
}

int JobState::containerRestartsDone() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.containerRestartsDone;
}

ErrorCounts JobState::errorCounts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.errorCounts;
}

std::optional<Clock::time_point> JobState::lastVpnRotation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.lastVpnRotationTimestamp;
}

JobStateSnapshot JobState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

void JobState::resetDurableLocked() {
    data_.currentWorkers = data_.initialWorkers;
    data_.tempDirs.clear();
    data_.vpnRotationsDone = 0;
    data_.workerReductionsDone = 0;
    data_.containerRestartsDone = 0;
    data_.lastVpnRotationTimestamp.reset();
}

void JobState::resetRuntimeErrorsLocked() {
    data_.errorCounts = ErrorCounts{};
    data_.lastErrorCategory.reset();
}

} } // namespace crawl_archiver::state
