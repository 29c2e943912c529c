#include "../include/Logger.h"
#include "../include/crawl_archiver/cli/CommandLine.h"
#include "../include/crawl_archiver/common/FatalError.h"
#include "../include/crawl_archiver/container/DockerRuntime.h"
#include "../include/crawl_archiver/orchestrator/SignalWatcher.h"
#include "../include/crawl_archiver/orchestrator/StageOrchestrator.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>

using namespace crawl_archiver;

namespace {

LogLevel resolveLogLevel(const std::string& configured) {
    if (const char* env = std::getenv("CRAWL_ARCHIVER_LOG_LEVEL")) {
        if (auto level = Logger::parseLevel(env)) {
            return *level;
        }
        std::cerr << "Ignoring invalid CRAWL_ARCHIVER_LOG_LEVEL '" << env << "'" << std::endl;
    }
    return Logger::parseLevel(configured).value_or(LogLevel::INFO);
}

} // namespace

int main(int argc, char* argv[]) {
    // Before any thread exists so every thread inherits the mask
    orchestrator::SignalWatcher::blockTerminationSignals();

    std::vector<std::string> args(argv + 1, argv + argc);
    cli::CommandLineResult parsed = cli::CommandLine::parse(args);

    switch (parsed.action) {
        case cli::CommandAction::Help:
            cli::CommandLine::printUsage(std::cout, argv[0]);
            return 0;
        case cli::CommandAction::Version:
            std::cout << cli::VERSION << std::endl;
            return 0;
        case cli::CommandAction::Invalid:
            for (const auto& error : parsed.errors) {
                std::cerr << "Error: " << error << "\n";
            }
            std::cerr << "\n";
            cli::CommandLine::printUsage(std::cerr, argv[0]);
            return 1;
        case cli::CommandAction::Run:
            break;
    }

    ArchiveConfig config = std::move(parsed.config);
    config.applyEnvironment();

    Logger::getInstance().init(resolveLogLevel(config.logLevel), true);
    Logger::setThreadName("main");

    if (config.dryRun) {
        cli::CommandLine::printSummary(std::cout, config);
        LOG_INFO("Dry run complete; no container was started.");
        return 0;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.outputDir, ec);
    if (ec) {
        LOG_ERROR("Cannot create output directory " + config.outputDir.string() + ": " + ec.message());
        return 1;
    }
    if (!Logger::getInstance().openLogFile((config.outputDir / "crawl_archiver.log").string())) {
        LOG_WARNING("Could not open the log file in " + config.outputDir.string() + "; logging to console only.");
    }

    ShutdownToken shutdown;
    auto runtime = std::make_shared<container::DockerRuntime>();
    orchestrator::StageOrchestrator stageOrchestrator(config, runtime, shutdown);

    orchestrator::SignalWatcher signalWatcher(shutdown, [&stageOrchestrator](int) {
        stageOrchestrator.supervisor().emergencyStop();
    });
    signalWatcher.start();

    int exitCode = 1;
    try {
        orchestrator::JobStatus status = stageOrchestrator.run();
        LOG_INFO("Job finished with status: " + orchestrator::jobStatusName(status));
        exitCode = status == orchestrator::JobStatus::Success ? 0 : 1;
    } catch (const FatalError& e) {
        LOG_ERROR(std::string("Fatal: ") + e.what());
        exitCode = 1;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Unexpected error: ") + e.what());
        exitCode = 2;
    }

    signalWatcher.stop();
    if (signalWatcher.receivedSignal() != 0) {
        LOG_INFO("Exiting after signal " + std::to_string(signalWatcher.receivedSignal()) + ".");
    }
    Logger::getInstance().close();
    return exitCode;
}
