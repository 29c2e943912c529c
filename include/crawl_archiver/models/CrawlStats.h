#pragma once

#include <string>

namespace crawl_archiver {

// Crawler counters as reported by one "Crawl statistics" record.
// -1 means the crawler did not report the value.
struct CrawlStats {
    long long crawled = -1;
    long long total = -1;
    long long pending = -1;
    long long failed = -1;
};

enum class ErrorCategory {
    Timeout,
    Http,
    Other
};

inline std::string errorCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Timeout: return "timeout";
        case ErrorCategory::Http: return "http";
        case ErrorCategory::Other: return "other";
    }
    return "other";
}

struct ErrorCounts {
    int timeout = 0;
    int http = 0;
    int other = 0;

    int total() const { return timeout + http + other; }
    bool any() const { return total() > 0; }
};

} // namespace crawl_archiver
