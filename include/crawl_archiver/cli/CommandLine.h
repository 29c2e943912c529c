#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "../models/ArchiveConfig.h"

namespace crawl_archiver { namespace cli {

constexpr const char* VERSION = "1.0.0";

enum class CommandAction {
    Run,
    Help,
    Version,
    Invalid
};

struct CommandLineResult {
    CommandAction action = CommandAction::Run;
    ArchiveConfig config;

    // Parse errors and validation problems; non-empty only for Invalid
    std::vector<std::string> errors;
};

/**
 * Command line front end. Known options fill an ArchiveConfig; anything
 * unrecognised, and everything after "--", is forwarded to the crawler.
 */
class CommandLine {
public:
    /**
     * @param args Arguments without the program name
     * @return Parsed configuration, already validated when the action is Run
     */
    static CommandLineResult parse(const std::vector<std::string>& args);

    static void printUsage(std::ostream& out, const std::string& progName);

    // Human-readable summary printed by --dry-run
    static void printSummary(std::ostream& out, const ArchiveConfig& config);
};

} } // namespace crawl_archiver::cli
