#pragma once

#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace crawl_archiver {
namespace constants {

inline const std::string DEFAULT_CRAWLER_IMAGE = "ghcr.io/openzim/zimit";
inline const std::string CONTAINER_OUTPUT_DIR = "/output";
inline const std::string TEMP_DIR_PREFIX = ".tmp";
inline const std::string STATE_FILE_NAME = ".archive_state.json";
inline const std::string RESUME_CONFIG_FILE_NAME = ".zimit_resume.yaml";
inline const std::string LOG_FILE_PREFIX = "archive_";
inline const std::string TIMESTAMP_FORMAT = "%Y%m%d_%H%M%S";
inline const std::string RUN_LABEL_KEY = "archive_job";
inline const std::string FINAL_ARTIFACT_EXTENSION = ".zim";

// Crawler exit codes meaning a soft limit stopped the crawl, not a failure
inline const std::set<int> SOFT_LIMIT_EXIT_CODES = {
    16, // Disk utilization quota reached
    32, // Crawl size limit hit
    33  // Crawl time limit hit
};

// Passthrough flags the final build still needs (archive metadata only)
inline const std::vector<std::string> FINAL_BUILD_ARG_PREFIXES = {
    "--title",
    "--description",
    "--long-description",
    "--zim-lang",
    "--custom-css",
    "--adminEmail",
    "--favicon",
    "--warcPrefix",
    "--lang"
};

constexpr int CONTAINER_ID_MAX_ATTEMPTS = 5;
constexpr std::chrono::seconds CONTAINER_STOP_GRACE_PERIOD{90};
constexpr std::chrono::seconds CONTAINER_STOP_COMMAND_TIMEOUT{120};
constexpr std::chrono::seconds CONTAINER_KILL_TIMEOUT{30};
constexpr std::chrono::seconds CONTAINER_QUERY_TIMEOUT{15};
constexpr std::chrono::seconds RUNTIME_VERSION_CHECK_TIMEOUT{10};
constexpr std::chrono::seconds EXTERNAL_COMMAND_TIMEOUT{120};
constexpr std::chrono::seconds PROCESS_TERMINATE_WAIT{10};
constexpr std::chrono::seconds PROCESS_KILL_WAIT{5};
constexpr std::chrono::seconds ADAPTATION_EXIT_WAIT{15};
constexpr std::chrono::seconds LOG_DRAIN_JOIN_GRACE{5};

} // namespace constants
} // namespace crawl_archiver
