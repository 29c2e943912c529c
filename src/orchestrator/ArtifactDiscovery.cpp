#include "../../include/crawl_archiver/orchestrator/ArtifactDiscovery.h"
#include "../../include/crawl_archiver/common/Constants.h"
#include "../../include/crawl_archiver/monitor/LogLineClassifier.h"
#include "../../include/Logger.h"
#include "../common/DurableFile.h"
#include <algorithm>
#include <fstream>
#include <regex>
#include <set>

namespace crawl_archiver { namespace orchestrator {

namespace fs = std::filesystem;

namespace {

constexpr std::streamoff TEMP_DIR_SCAN_BYTES = 15 * 1024;
constexpr std::streamoff STATS_SCAN_BYTES = 1024 * 1024;

const std::string COMBINED_LOG_SUFFIX = ".combined.log";

// One known location of the crawler's resume configuration
struct ConfigLayout {
    bool underCrawlsDir;
    std::string namePrefix;
    std::string extension;
};

const std::vector<ConfigLayout>& configLayouts() {
    static const std::vector<ConfigLayout> layouts = {
        {true, "crawl-", ".yaml"},
        {true, "crawl-", ".yml"},
        {true, "", ".yaml"},
        {true, "", ".yml"},
        {false, "crawl-", ".yaml"},
        {false, "crawl-", ".yml"},
    };
    return layouts;
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool matchesName(const std::string& name, const std::string& prefix, const std::string& extension) {
    if (name.empty() || name[0] == '.') {
        return false;
    }
    return name.size() >= prefix.size() + extension.size() &&
           startsWith(name, prefix) && endsWith(name, extension);
}

fs::path canonicalOrSelf(const fs::path& path) {
    std::error_code ec;
    fs::path canonical = fs::canonical(path, ec);
    return ec ? path : canonical;
}

std::optional<fs::file_time_type> modificationTime(const fs::path& path) {
    std::error_code ec;
    fs::file_time_type mtime = fs::last_write_time(path, ec);
    if (ec) {
        LOG_WARNING("Could not stat " + path.string() + ": " + ec.message());
        return std::nullopt;
    }
    return mtime;
}

// Directories directly under `dir` whose name starts with `prefix`
std::vector<fs::path> subdirectoriesWithPrefix(const fs::path& dir, const std::string& prefix) {
    std::vector<fs::path> found;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return found;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            LOG_WARNING("Error scanning " + dir.string() + ": " + ec.message());
            break;
        }
        std::error_code statEc;
        if (startsWith(it->path().filename().string(), prefix) && it->is_directory(statEc)) {
            found.push_back(it->path());
        }
    }
    return found;
}

std::optional<fs::path> newestFileIn(const fs::path& dir, const std::string& prefix, const std::string& extension) {
    std::optional<fs::path> newest;
    std::optional<fs::file_time_type> newestTime;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return std::nullopt;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code statEc;
        if (!matchesName(it->path().filename().string(), prefix, extension) || !it->is_regular_file(statEc)) {
            continue;
        }
        auto mtime = modificationTime(it->path());
        if (mtime && (!newestTime || *mtime > *newestTime)) {
            newest = it->path();
            newestTime = mtime;
        }
    }
    return newest;
}

// Head and tail of a file, joined by a newline
std::optional<std::string> readHeadAndTail(const fs::path& file, std::streamoff bytes) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    in.seekg(0, std::ios::end);
    std::streamoff size = in.tellg();
    if (size < 0) {
        return std::nullopt;
    }
    in.seekg(0, std::ios::beg);

    std::string head(static_cast<size_t>(std::min(size, bytes)), '\0');
    in.read(head.data(), static_cast<std::streamsize>(head.size()));

    std::streamoff tailStart = std::max<std::streamoff>(0, size - bytes);
    in.clear();
    in.seekg(tailStart, std::ios::beg);
    std::string tail(static_cast<size_t>(size - tailStart), '\0');
    in.read(tail.data(), static_cast<std::streamsize>(tail.size()));

    return head + "\n" + tail;
}

std::optional<CrawlStats> statsFromLine(const std::string& line) {
    auto stats = monitor::LogLineClassifier::parseStatsLine(line);
    if (stats) {
        return stats;
    }
    // Lines may carry a prefix before the JSON record
    size_t brace = line.find('{');
    if (brace != std::string::npos && brace > 0) {
        return monitor::LogLineClassifier::parseStatsLine(line.substr(brace));
    }
    return std::nullopt;
}

} // namespace

std::optional<fs::path> ArtifactDiscovery::parseTempDirFromLog(const fs::path& logFile, const fs::path& hostOutputDir) {
    static const std::regex tempDirPattern(R"re(Output to tempdir:\s*"?([/\\]?output[/\\]\.tmp\w+)"?)re",
                                           std::regex::ECMAScript | std::regex::icase);

    std::error_code ec;
    if (logFile.empty() || !fs::is_regular_file(logFile, ec)) {
        LOG_WARNING("Log file not found or invalid for parsing temp dir: " + logFile.string());
        return findLatestTempDir(hostOutputDir);
    }

    auto content = readHeadAndTail(logFile, TEMP_DIR_SCAN_BYTES);
    if (!content) {
        LOG_ERROR("Error reading log file " + logFile.string());
    } else {
        std::smatch match;
        if (std::regex_search(*content, match, tempDirPattern)) {
            std::string containerPath = match[1].str();
            std::replace(containerPath.begin(), containerPath.end(), '\\', '/');
            LOG_INFO("Found potential temp dir in log: " + containerPath);

            auto hostPath = containerToHostPath(containerPath, hostOutputDir);
            if (hostPath && fs::is_directory(*hostPath, ec)) {
                return canonicalOrSelf(*hostPath);
            }
            if (hostPath) {
                LOG_WARNING("Parsed host temp dir is not a directory: " + hostPath->string());
            } else {
                LOG_WARNING("Could not convert parsed path '" + containerPath + "'");
            }
        } else {
            LOG_WARNING("Could not parse temp dir pattern from " + logFile.string() + ".");
        }
    }

    LOG_WARNING("Attempting fallback directory scan for temp dir.");
    return findLatestTempDir(hostOutputDir);
}

std::optional<fs::path> ArtifactDiscovery::findLatestTempDir(const fs::path& hostOutputDir) {
    std::optional<fs::path> latest;
    std::optional<fs::file_time_type> latestTime;

    for (const auto& dir : subdirectoriesWithPrefix(hostOutputDir, constants::TEMP_DIR_PREFIX)) {
        auto mtime = modificationTime(dir);
        if (mtime && (!latestTime || *mtime > *latestTime)) {
            latest = dir;
            latestTime = mtime;
        }
    }

    if (!latest) {
        LOG_INFO("Fallback did not find any '" + constants::TEMP_DIR_PREFIX + "*' directories.");
        return std::nullopt;
    }
    fs::path resolved = canonicalOrSelf(*latest);
    LOG_INFO("Fallback found latest temp dir: " + resolved.string());
    return resolved;
}

std::vector<fs::path> ArtifactDiscovery::discoverTempDirs(const fs::path& hostOutputDir) {
    std::vector<std::pair<fs::file_time_type, fs::path>> entries;
    for (const auto& dir : subdirectoriesWithPrefix(hostOutputDir, constants::TEMP_DIR_PREFIX)) {
        auto mtime = modificationTime(dir);
        entries.emplace_back(mtime.value_or(fs::file_time_type::min()), canonicalOrSelf(dir));
    }
    std::stable_sort(entries.begin(), entries.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<fs::path> result;
    for (auto& entry : entries) {
        result.push_back(std::move(entry.second));
    }
    return result;
}

std::optional<fs::path> ArtifactDiscovery::findLatestConfigYaml(const fs::path& tempDir) {
    std::error_code ec;
    if (tempDir.empty() || !fs::is_directory(tempDir, ec)) {
        LOG_WARNING("Cannot search for YAML, invalid temp dir: " + tempDir.string());
        return std::nullopt;
    }

    std::vector<fs::path> collections = subdirectoriesWithPrefix(tempDir / "collections", "crawl-");

    for (const auto& layout : configLayouts()) {
        std::optional<fs::path> best;
        std::optional<fs::file_time_type> bestTime;

        for (const auto& collection : collections) {
            fs::path searchDir = layout.underCrawlsDir ? collection / "crawls" : collection;
            auto candidate = newestFileIn(searchDir, layout.namePrefix, layout.extension);
            if (!candidate) {
                continue;
            }
            auto mtime = modificationTime(*candidate);
            if (mtime && (!bestTime || *mtime > *bestTime)) {
                best = candidate;
                bestTime = mtime;
            }
        }

        if (best) {
            fs::path resolved = canonicalOrSelf(*best);
            LOG_INFO("Found latest config YAML: " + resolved.string());
            return resolved;
        }
    }

    LOG_INFO("No config YAML files found in subdirs of " + tempDir.string() + ".");
    return std::nullopt;
}

std::optional<fs::path> ArtifactDiscovery::findLatestConfigYaml(const std::vector<fs::path>& tempDirs) {
    std::optional<fs::path> best;
    std::optional<fs::file_time_type> bestTime;
    for (const auto& tempDir : tempDirs) {
        auto candidate = findLatestConfigYaml(tempDir);
        if (!candidate) {
            continue;
        }
        auto mtime = modificationTime(*candidate);
        if (!best || (mtime && (!bestTime || *mtime > *bestTime))) {
            best = candidate;
            bestTime = mtime;
        }
    }
    return best;
}

fs::path ArtifactDiscovery::stableResumeConfigPath(const fs::path& hostOutputDir) {
    return hostOutputDir / constants::RESUME_CONFIG_FILE_NAME;
}

std::optional<fs::path> ArtifactDiscovery::findStableResumeConfig(const fs::path& hostOutputDir) {
    fs::path path = stableResumeConfigPath(hostOutputDir);
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        return canonicalOrSelf(path);
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
        LOG_WARNING("Stable resume config unreadable: " + path.string() + " (" + ec.message() + ")");
    }
    return std::nullopt;
}

std::optional<fs::path> ArtifactDiscovery::persistResumeConfig(const fs::path& configYaml, const fs::path& hostOutputDir) {
    fs::path destination = stableResumeConfigPath(hostOutputDir);
    std::string error;
    if (!copyFileDurably(configYaml, destination, error)) {
        LOG_WARNING("Could not persist resume config YAML to " + destination.string() + ": " + error);
        return std::nullopt;
    }
    return canonicalOrSelf(destination);
}

std::vector<fs::path> ArtifactDiscovery::findAllWarcFiles(const std::vector<fs::path>& tempDirs) {
    std::set<fs::path> warcs;
    if (tempDirs.empty()) {
        return {};
    }

    LOG_INFO("Searching for WARC files in " + std::to_string(tempDirs.size()) + " temp dir path(s)...");
    for (const auto& tempDir : tempDirs) {
        std::error_code ec;
        if (!fs::is_directory(tempDir, ec)) {
            LOG_WARNING("Skipping WARC search in non-existent dir: " + tempDir.string());
            continue;
        }

        fs::path searchRoot = tempDir / "collections";
        if (!fs::is_directory(searchRoot, ec)) {
            LOG_INFO("  No collections/ directory found in " + tempDir.string() +
                     "; falling back to scanning temp dir.");
            searchRoot = tempDir;
        }

        size_t found = 0;
        fs::recursive_directory_iterator it(searchRoot, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            LOG_ERROR("Error searching WARCs in " + tempDir.string() + ": " + ec.message());
            continue;
        }
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                LOG_ERROR("Error searching WARCs in " + tempDir.string() + ": " + ec.message());
                break;
            }
            std::string name = it->path().filename().string();
            if (!endsWith(name, ".warc.gz") && !endsWith(name, ".warc")) {
                continue;
            }
            std::error_code statEc;
            if (!it->is_regular_file(statEc)) {
                continue;
            }
            auto size = it->file_size(statEc);
            if (statEc) {
                LOG_WARNING("Could not stat WARC file " + it->path().string() + ": " + statEc.message());
                continue;
            }
            if (size > 0) {
                warcs.insert(canonicalOrSelf(it->path()));
                ++found;
            }
        }
        LOG_INFO("  Found " + std::to_string(found) + " WARC file(s) under " + searchRoot.string());
    }

    LOG_INFO("Total unique WARC files found: " + std::to_string(warcs.size()));
    return std::vector<fs::path>(warcs.begin(), warcs.end());
}

std::optional<std::string> ArtifactDiscovery::hostToContainerPath(const fs::path& hostPath, const fs::path& hostOutputDir) {
    std::error_code ec;
    fs::path resolvedPath = fs::weakly_canonical(hostPath, ec);
    if (ec) {
        LOG_ERROR("Path error for '" + hostPath.string() + "': " + ec.message());
        return std::nullopt;
    }
    fs::path resolvedRoot = fs::weakly_canonical(hostOutputDir, ec);
    if (ec) {
        LOG_ERROR("Path error for '" + hostOutputDir.string() + "': " + ec.message());
        return std::nullopt;
    }

    fs::path relative = resolvedPath.lexically_relative(resolvedRoot);
    if (relative.empty() || *relative.begin() == "..") {
        LOG_ERROR("Path error for '" + hostPath.string() + "' within '" + hostOutputDir.string() +
                  "': not inside the output directory.");
        return std::nullopt;
    }
    if (relative == ".") {
        return constants::CONTAINER_OUTPUT_DIR;
    }
    return constants::CONTAINER_OUTPUT_DIR + "/" + relative.generic_string();
}

std::optional<fs::path> ArtifactDiscovery::containerToHostPath(const std::string& containerPath, const fs::path& hostOutputDir) {
    std::string path = containerPath;
    std::replace(path.begin(), path.end(), '\\', '/');

    const std::string& root = constants::CONTAINER_OUTPUT_DIR;
    if (!startsWith(path, "/")) {
        if (startsWith(path, root.substr(1))) {
            path = "/" + path;
        } else {
            LOG_WARNING("Cannot convert relative container path: " + containerPath);
            return std::nullopt;
        }
    }

    fs::path hostRoot = canonicalOrSelf(hostOutputDir);
    if (path == root) {
        return hostRoot;
    }
    if (startsWith(path, root + "/")) {
        fs::path relative = fs::path(path.substr(root.size() + 1)).lexically_normal();
        if (!relative.empty() && *relative.begin() == "..") {
            LOG_WARNING("Container path escapes the output directory: " + containerPath);
            return std::nullopt;
        }
        return hostRoot / relative;
    }

    LOG_WARNING("Path '" + path + "' doesn't start with '" + root + "'. Attempting name-based lookup.");
    fs::path byName = hostRoot / fs::path(path).filename();
    std::error_code ec;
    if (fs::is_directory(byName, ec)) {
        return byName;
    }
    return std::nullopt;
}

std::optional<CrawlStats> ArtifactDiscovery::parseLastStatsFromLog(const fs::path& logFile) {
    std::error_code ec;
    if (logFile.empty() || !fs::is_regular_file(logFile, ec)) {
        LOG_WARNING("Cannot parse stats, invalid log file path: " + logFile.string());
        return std::nullopt;
    }

    std::ifstream in(logFile, std::ios::binary);
    if (!in) {
        LOG_ERROR("Error opening stats log " + logFile.string());
        return std::nullopt;
    }
    in.seekg(0, std::ios::end);
    std::streamoff size = in.tellg();
    if (size < 0) {
        LOG_ERROR("Error reading stats log " + logFile.string());
        return std::nullopt;
    }
    std::streamoff offset = std::max<std::streamoff>(0, size - STATS_SCAN_BYTES);
    in.seekg(offset, std::ios::beg);
    std::string content(static_cast<size_t>(size - offset), '\0');
    in.read(content.data(), static_cast<std::streamsize>(content.size()));

    size_t end = content.size();
    while (end > 0) {
        size_t start = content.rfind('\n', end - 1);
        size_t lineStart = (start == std::string::npos) ? 0 : start + 1;
        std::string line = content.substr(lineStart, end - lineStart);
        end = (start == std::string::npos) ? 0 : start;

        if (line.find("Crawl statistics") == std::string::npos) {
            continue;
        }
        auto stats = statsFromLine(line);
        if (!stats) {
            continue;
        }
        if (stats->crawled < 0 || stats->total < 0) {
            LOG_WARNING("Last stats message missing data in " + logFile.filename().string());
            return std::nullopt;
        }
        LOG_INFO("Parsed last stats from " + logFile.filename().string() + ": crawled=" +
                 std::to_string(stats->crawled) + " total=" + std::to_string(stats->total) +
                 " pending=" + std::to_string(stats->pending) + " failed=" + std::to_string(stats->failed));
        return stats;
    }

    LOG_INFO("No 'Crawl statistics' message found in the end of " + logFile.filename().string() + ".");
    return std::nullopt;
}

std::optional<fs::path> ArtifactDiscovery::findLatestCombinedLog(const fs::path& hostOutputDir) {
    return newestFileIn(hostOutputDir, constants::LOG_FILE_PREFIX, COMBINED_LOG_SUFFIX);
}

void ArtifactDiscovery::cleanupTempDirs(const std::vector<fs::path>& tempDirs, const fs::path& stateFile) {
    LOG_INFO("--- Starting Cleanup ---");
    int deleted = 0;
    for (const auto& tempDir : tempDirs) {
        std::error_code ec;
        if (!fs::is_directory(tempDir, ec) || !startsWith(tempDir.filename().string(), constants::TEMP_DIR_PREFIX)) {
            LOG_WARNING("Skipping cleanup: " + tempDir.string());
            continue;
        }
        fs::remove_all(tempDir, ec);
        if (ec) {
            LOG_ERROR("Failed to delete " + tempDir.string() + ": " + ec.message());
        } else {
            LOG_INFO("Deleted: " + tempDir.string());
            ++deleted;
        }
    }

    std::error_code ec;
    if (fs::exists(stateFile, ec)) {
        if (fs::remove(stateFile, ec)) {
            LOG_INFO("Deleted state file: " + stateFile.string());
        } else {
            LOG_ERROR("Failed to delete state file " + stateFile.string() + ": " + ec.message());
        }
    }
    LOG_INFO("Cleanup finished. Deleted " + std::to_string(deleted) + " director(y/ies).");
}

} } // namespace crawl_archiver::orchestrator
