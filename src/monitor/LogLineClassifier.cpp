#include "../../include/crawl_archiver/monitor/LogLineClassifier.h"
#include <regex>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace crawl_archiver { namespace monitor {

namespace {

const std::regex& timeoutPattern() {
    static const std::regex pattern("Navigation timeout|net::ERR_TIMED_OUT",
                                    std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

const std::regex& httpErrorPattern() {
    static const std::regex pattern(R"(net::ERR_|status":([45]\d{2}))");
    return pattern;
}

std::string stringField(const json& data, const char* key) {
    auto it = data.find(key);
    if (it != data.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

long long counterField(const json& details, const char* key) {
    auto it = details.find(key);
    if (it != details.end() && it->is_number()) {
        return it->get<long long>();
    }
    return -1;
}

bool isStatsRecord(const json& data) {
    auto details = data.find("details");
    return stringField(data, "context") == "crawlStatus" &&
           stringField(data, "message") == "Crawl statistics" &&
           details != data.end() && details->is_object();
}

CrawlStats statsFromDetails(const json& details) {
    CrawlStats stats;
    stats.crawled = counterField(details, "crawled");
    stats.total = counterField(details, "total");
    stats.pending = counterField(details, "pending");
    stats.failed = counterField(details, "failed");
    return stats;
}

LineClassification errorOf(ErrorCategory category) {
    LineClassification result;
    result.kind = LineClassification::Kind::Error;
    result.category = category;
    return result;
}

LineClassification classifyRaw(const std::string& line) {
    if (LogLineClassifier::matchesTimeout(line)) {
        return errorOf(ErrorCategory::Timeout);
    }
    if (LogLineClassifier::matchesHttpError(line)) {
        return errorOf(ErrorCategory::Http);
    }
    return LineClassification{};
}

} // namespace

bool LogLineClassifier::matchesTimeout(const std::string& text) {
    return std::regex_search(text, timeoutPattern());
}

bool LogLineClassifier::matchesHttpError(const std::string& text) {
    return std::regex_search(text, httpErrorPattern());
}

std::optional<CrawlStats> LogLineClassifier::parseStatsLine(const std::string& line) {
    json data = json::parse(line, nullptr, false);
    if (data.is_discarded() || !data.is_object() || !isStatsRecord(data)) {
        return std::nullopt;
    }
    return statsFromDetails(data["details"]);
}

LineClassification LogLineClassifier::classify(const std::string& line) {
    if (line.empty()) {
        return LineClassification{};
    }

    json data = json::parse(line, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return classifyRaw(line);
    }

    if (isStatsRecord(data)) {
        LineClassification result;
        result.kind = LineClassification::Kind::Stats;
        result.stats = statsFromDetails(data["details"]);
        return result;
    }

    std::string context = stringField(data, "context");
    std::string message = stringField(data, "message");

    if (context == "pageStatus" && message == "Page Load Failed: will retry") {
        std::string errorMessage;
        auto details = data.find("details");
        if (details != data.end() && details->is_object()) {
            errorMessage = stringField(*details, "msg");
        }
        if (matchesTimeout(errorMessage)) {
            return errorOf(ErrorCategory::Timeout);
        }
        if (matchesHttpError(errorMessage)) {
            return errorOf(ErrorCategory::Http);
        }
        return errorOf(ErrorCategory::Other);
    }

    std::string level = stringField(data, "logLevel");
    if (level == "error" || level == "warn") {
        if (matchesTimeout(message) || matchesTimeout(line)) {
            return errorOf(ErrorCategory::Timeout);
        }
        if (matchesHttpError(message) || matchesHttpError(line)) {
            return errorOf(ErrorCategory::Http);
        }
        if (level == "error") {
            return errorOf(ErrorCategory::Other);
        }
    }

    return LineClassification{};
}

} } // namespace crawl_archiver::monitor
