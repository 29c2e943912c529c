#pragma once

#include <optional>
#include <string>
#include "../models/CrawlStats.h"

namespace crawl_archiver { namespace monitor {

struct LineClassification {
    enum class Kind {
        Ignored,
        Stats,
        Error
    };

    Kind kind = Kind::Ignored;
    CrawlStats stats;
    ErrorCategory category = ErrorCategory::Other;
};

class LogLineClassifier {
public:
    /**
     * Classify one crawler log line.
     *
     * Structured lines: "Crawl statistics" records yield Stats; "will retry"
     * page failures yield an Error whose category comes from details.msg
     * (timeout, then HTTP/network, else other); generic warn/error records are
     * matched against the message and the raw line, and only error-level ones
     * fall back to other. Unstructured lines only count timeout or HTTP matches.
     * @param line Log line without trailing newline
     * @return Classification, Ignored when the line carries no signal
     */
    static LineClassification classify(const std::string& line);

    /**
     * Extract counters from a "Crawl statistics" line.
     * @return nullopt if the line is not a statistics record
     */
    static std::optional<CrawlStats> parseStatsLine(const std::string& line);

    // "Navigation timeout" or "net::ERR_TIMED_OUT", case-insensitive
    static bool matchesTimeout(const std::string& text);

    // Any net::ERR_ code or a 4xx/5xx "status" field
    static bool matchesHttpError(const std::string& text);
};

} } // namespace crawl_archiver::monitor
