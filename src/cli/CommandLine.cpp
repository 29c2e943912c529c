#include "../../include/crawl_archiver/cli/CommandLine.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cctype>
#include <optional>

namespace crawl_archiver { namespace cli {

namespace {

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

std::optional<int> parseInt(const std::string& text) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void appendSeeds(std::vector<std::string>& seeds, const std::string& value) {
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        std::string seed = value.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        seed.erase(seed.begin(), std::find_if(seed.begin(), seed.end(), [](unsigned char c) { return !std::isspace(c); }));
        seed.erase(std::find_if(seed.rbegin(), seed.rend(), [](unsigned char c) { return !std::isspace(c); }).base(),
                   seed.end());
        if (!seed.empty()) {
            seeds.push_back(seed);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
}

std::string yesNo(bool value) {
    return value ? "yes" : "no";
}

} // namespace

CommandLineResult CommandLine::parse(const std::vector<std::string>& args) {
    CommandLineResult result;
    ArchiveConfig& config = result.config;
    std::vector<std::string>& errors = result.errors;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--") {
            config.passthroughArgs.insert(config.passthroughArgs.end(), args.begin() + static_cast<long>(i) + 1, args.end());
            break;
        }

        std::string name = arg;
        std::optional<std::string> inlineValue;
        if (startsWith(arg, "--")) {
            size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                name = arg.substr(0, eq);
                inlineValue = arg.substr(eq + 1);
            }
        }

        auto value = [&]() -> std::optional<std::string> {
            if (inlineValue) {
                return inlineValue;
            }
            if (i + 1 < args.size()) {
                return args[++i];
            }
            errors.push_back(name + " requires a value");
            return std::nullopt;
        };
        auto intValue = [&]() -> std::optional<int> {
            auto text = value();
            if (!text) {
                return std::nullopt;
            }
            auto parsed = parseInt(*text);
            if (!parsed) {
                errors.push_back("invalid integer for " + name + ": '" + *text + "'");
            }
            return parsed;
        };

        if (name == "-h" || name == "--help") {
            result.action = CommandAction::Help;
            return result;
        } else if (name == "-v" || name == "--version") {
            result.action = CommandAction::Version;
            return result;
        } else if (name == "--seeds") {
            if (inlineValue) {
                appendSeeds(config.seeds, *inlineValue);
            } else {
                size_t before = config.seeds.size();
                while (i + 1 < args.size() && !startsWith(args[i + 1], "-")) {
                    appendSeeds(config.seeds, args[++i]);
                }
                if (config.seeds.size() == before) {
                    errors.push_back("--seeds requires at least one URL");
                }
            }
        } else if (name == "--name") {
            if (auto v = value()) config.name = *v;
        } else if (name == "--output-dir") {
            if (auto v = value()) config.outputDir = *v;
        } else if (name == "--initial-workers") {
            if (auto v = intValue()) config.initialWorkers = *v;
        } else if (name == "--cleanup") {
            config.cleanup = true;
        } else if (name == "--overwrite") {
            config.overwrite = true;
        } else if (name == "--docker-image") {
            if (auto v = value()) config.container.image = *v;
        } else if (name == "--log-level") {
            if (auto v = value()) {
                if (Logger::parseLevel(*v)) {
                    config.logLevel = *v;
                } else {
                    errors.push_back("unknown log level '" + *v + "' (DEBUG, INFO, WARNING, ERROR)");
                }
            }
        } else if (name == "--dry-run") {
            config.dryRun = true;
        } else if (name == "--relax-perms") {
            config.relaxPerms = true;
        } else if (name == "--enable-monitoring") {
            config.enableMonitoring = true;
        } else if (name == "--monitor-interval-seconds") {
            if (auto v = intValue()) config.monitor.pollInterval = std::chrono::seconds(*v);
        } else if (name == "--stall-timeout-minutes") {
            if (auto v = intValue()) config.monitor.stallTimeout = std::chrono::minutes(*v);
        } else if (name == "--error-threshold-timeout") {
            if (auto v = intValue()) config.monitor.errorThresholdTimeout = *v;
        } else if (name == "--error-threshold-http") {
            if (auto v = intValue()) config.monitor.errorThresholdHttp = *v;
        } else if (name == "--enable-adaptive-workers") {
            config.adaptation.enableAdaptiveWorkers = true;
        } else if (name == "--min-workers") {
            if (auto v = intValue()) config.adaptation.minWorkers = *v;
        } else if (name == "--max-worker-reductions") {
            if (auto v = intValue()) config.adaptation.maxWorkerReductions = *v;
        } else if (name == "--enable-vpn-rotation") {
            config.adaptation.enableVpnRotation = true;
        } else if (name == "--vpn-connect-command") {
            if (auto v = value()) config.adaptation.vpnConnectCommand = *v;
        } else if (name == "--vpn-disconnect-command") {
            if (auto v = value()) config.adaptation.vpnDisconnectCommand = *v;
        } else if (name == "--max-vpn-rotations") {
            if (auto v = intValue()) config.adaptation.maxVpnRotations = *v;
        } else if (name == "--vpn-rotation-frequency-minutes") {
            if (auto v = intValue()) config.adaptation.vpnRotationFrequency = std::chrono::minutes(*v);
        } else if (name == "--enable-adaptive-restart") {
            config.adaptation.enableAdaptiveRestart = true;
        } else if (name == "--max-container-restarts") {
            if (auto v = intValue()) config.adaptation.maxContainerRestarts = *v;
        } else if (name == "--backoff-delay-minutes") {
            if (auto v = intValue()) config.backoffDelay = std::chrono::minutes(*v);
        } else if (name == "--max-stage-attempts") {
            if (auto v = intValue()) config.maxStageAttempts = *v;
        } else {
            // Crawler option
            config.passthroughArgs.push_back(arg);
        }
    }

    if (errors.empty()) {
        errors = config.validate();
    }
    result.action = errors.empty() ? CommandAction::Run : CommandAction::Invalid;
    return result;
}

void CommandLine::printUsage(std::ostream& out, const std::string& progName) {
    out << "crawl-archiver v" << VERSION << " - supervised website archiving\n\n";
    out << "Usage: " << progName << " --seeds URL [URL...] --name NAME --output-dir DIR [options] [-- crawler args...]\n";
    out << "       " << progName << " --help | --version\n\n";
    out << "Required:\n";
    out << "  --seeds URL [URL...]                Seed URLs (space or comma separated)\n";
    out << "  --name NAME                         Job name, also the archive file name\n";
    out << "  --output-dir DIR                    Host directory mounted as /output\n\n";
    out << "Options:\n";
    out << "  --initial-workers N                 Starting worker count (default 1)\n";
    out << "  --docker-image IMAGE                Crawler image (default " << constants::DEFAULT_CRAWLER_IMAGE << ")\n";
    out << "  --cleanup                           Delete temp dirs and the state file after success\n";
    out << "  --overwrite                         Replace an existing archive and start fresh\n";
    out << "  --relax-perms                       Make crawler output world-readable\n";
    out << "  --backoff-delay-minutes M           Pause after failures (default 15)\n";
    out << "  --max-stage-attempts N              Failed attempts before giving up (default 100)\n";
    out << "  --log-level LEVEL                   DEBUG, INFO, WARNING or ERROR (default INFO)\n";
    out << "  --dry-run                           Validate and print the plan, start nothing\n\n";
    out << "Monitoring:\n";
    out << "  --enable-monitoring                 Follow container logs for progress and errors\n";
    out << "  --monitor-interval-seconds S        Condition check interval (default 30)\n";
    out << "  --stall-timeout-minutes M           Minutes without progress before a stall (default 30)\n";
    out << "  --error-threshold-timeout N         Timeout errors before intervention (default 10)\n";
    out << "  --error-threshold-http N            HTTP errors before intervention (default 10)\n\n";
    out << "Adaptation (requires --enable-monitoring):\n";
    out << "  --enable-adaptive-workers           Reduce workers on stalls and errors\n";
    out << "  --min-workers N                     Worker floor (default 1)\n";
    out << "  --max-worker-reductions N           Reduction cap (default 2)\n";
    out << "  --enable-vpn-rotation               Rotate egress on stalls and errors\n";
    out << "  --vpn-connect-command CMD           Command that switches egress\n";
    out << "  --vpn-disconnect-command CMD        Accepted but not used\n";
    out << "  --max-vpn-rotations N               Rotation cap (default 3)\n";
    out << "  --vpn-rotation-frequency-minutes M  Minimum minutes between rotations (default 60)\n";
    out << "  --enable-adaptive-restart           Restart the container on stalls\n";
    out << "  --max-container-restarts N          Restart cap (default 0)\n\n";
    out << "Environment Variables:\n";
    out << "  CRAWL_ARCHIVER_LOG_LEVEL            Overrides --log-level\n";
    out << "  CRAWL_ARCHIVER_DOCKER_MEMORY_LIMIT  Container memory limit (default 4g, empty for none)\n";
    out << "  CRAWL_ARCHIVER_DOCKER_CPU_LIMIT     Container CPU limit (default 1.5, empty for none)\n";
    out << "  CRAWL_ARCHIVER_DOCKER_SHM_SIZE      Container shared memory size\n\n";
    out << "Unrecognised options are passed to the crawler unchanged.\n";
}

void CommandLine::printSummary(std::ostream& out, const ArchiveConfig& config) {
    out << "--- Dry Run ---\n";
    out << "Job name:        " << config.name << "\n";
    out << "Seeds:           ";
    for (size_t i = 0; i < config.seeds.size(); ++i) {
        out << (i ? ", " : "") << config.seeds[i];
    }
    out << "\n";
    out << "Output dir:      " << config.outputDir.string() << "\n";
    out << "Final artifact:  " << config.finalArtifactPath().string() << "\n";
    out << "Image:           " << config.container.image << "\n";
    out << "Memory/CPU/SHM:  " << config.container.memoryLimit.value_or("-") << " / "
        << config.container.cpuLimit.value_or("-") << " / " << config.container.shmSize.value_or("-") << "\n";
    out << "Workers:         " << config.effectiveInitialWorkers() << "\n";
    out << "Monitoring:      " << yesNo(config.enableMonitoring);
    if (config.enableMonitoring) {
        out << " (every " << config.monitor.pollInterval.count() << "s, stall after "
            << config.monitor.stallTimeout.count() << "m, thresholds T/H "
            << config.monitor.errorThresholdTimeout << "/" << config.monitor.errorThresholdHttp << ")";
    }
    out << "\n";
    out << "Adaptive workers: " << yesNo(config.adaptation.enableAdaptiveWorkers)
        << ", VPN rotation: " << yesNo(config.adaptation.enableVpnRotation)
        << ", adaptive restart: " << yesNo(config.adaptation.enableAdaptiveRestart) << "\n";
    out << "Backoff:         " << std::chrono::duration_cast<std::chrono::minutes>(config.backoffDelay).count() << "m, "
        << config.maxStageAttempts << " attempt(s) max\n";
    out << "Cleanup: " << yesNo(config.cleanup) << ", overwrite: " << yesNo(config.overwrite)
        << ", relax perms: " << yesNo(config.relaxPerms) << "\n";
    out << "Crawler args:    ";
    for (const auto& arg : config.passthroughArgs) {
        out << arg << " ";
    }
    out << "\n";
}

} } // namespace crawl_archiver::cli
