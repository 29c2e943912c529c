#include <catch2/catch.hpp>
#include "../../include/crawl_archiver/orchestrator/StageOrchestrator.h"
#include "../../include/crawl_archiver/common/FatalError.h"
#include "../support/FakeContainerRuntime.h"
#include "../support/LogCapture.h"
#include "../support/TempDirectory.h"
#include <algorithm>
#include <future>
#include <thread>

using namespace crawl_archiver;
using namespace crawl_archiver::orchestrator;
using namespace std::chrono_literals;
using container::RunSpec;

namespace {

bool hasArg(const std::vector<std::string>& args, const std::string& flag) {
    return std::find(args.begin(), args.end(), flag) != args.end();
}

std::string valueOf(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || it + 1 == args.end()) {
        return "";
    }
    return *(it + 1);
}

// Shell snippet writing one WARC into a temp dir and announcing it like the crawler does
std::string crawlScript(const RunSpec& spec, const std::string& tempName, const std::string& ending) {
    std::string archive = (spec.hostOutputDir / tempName / "collections" / "crawl-1" / "archive").string();
    return "mkdir -p '" + archive + "' && printf 'WARC/1.1' > '" + archive + "/rec-0.warc.gz' && " +
           "echo 'Output to tempdir: \"/output/" + tempName + "\"'; " + ending;
}

std::string crawlScript(const RunSpec& spec, const std::string& tempName, int exitCode) {
    return crawlScript(spec, tempName, "exit " + std::to_string(exitCode));
}

const std::string TIMEOUT_LINE = "Navigation timeout of 90000 ms exceeded";

std::string finalBuildScript(const RunSpec& spec, const std::string& name) {
    return "printf 'zim' > '" + (spec.hostOutputDir / (name + ".zim")).string() + "'; exit 0";
}

struct OrchestratorFixture {
    TempDirectory dir;
    std::shared_ptr<FakeContainerRuntime> runtime = std::make_shared<FakeContainerRuntime>();
    ShutdownToken shutdown;
    ArchiveConfig config;

    OrchestratorFixture() {
        config.seeds = {"https://example.org"};
        config.name = "testjob";
        config.outputDir = dir.path() / "out";
        config.initialWorkers = 2;
        config.backoffDelay = 0s;
        config.eventPollInterval = 50ms;
        config.container.idLookupAttempts = 1;
        config.container.idLookupInterval = 10ms;
    }

    // Crawl runs exit with the given codes in order; final builds write the .zim
    void scriptCrawlExits(std::vector<int> exitCodes) {
        auto counter = std::make_shared<size_t>(0);
        std::string name = config.name;
        runtime->scriptFor = [counter, exitCodes, name](const RunSpec& spec) {
            if (hasArg(spec.command, "--warcs")) {
                return finalBuildScript(spec, name);
            }
            size_t index = (*counter)++;
            int code = index < exitCodes.size() ? exitCodes[index] : 0;
            return crawlScript(spec, ".tmpcrawl" + std::to_string(index), code);
        };
    }

    std::filesystem::path outputDir() const {
        return std::filesystem::canonical(config.outputDir);
    }

    // Monitoring on a fast cadence; two timeouts in the followed log trip the threshold
    void enableFastMonitoring() {
        config.enableMonitoring = true;
        config.monitor.pollInterval = 1s;
        config.monitor.startupDelay = 0ms;
        config.monitor.errorThresholdTimeout = 2;
        runtime->logScript = "echo '" + TIMEOUT_LINE + "'; echo '" + TIMEOUT_LINE + "'; exec sleep 30";
    }

    std::filesystem::path combinedLog(const std::string& prefix) const {
        for (const auto& entry : std::filesystem::directory_iterator(outputDir())) {
            std::string file = entry.path().filename().string();
            if (file.rfind(prefix, 0) == 0 && file.find(".combined.log") != std::string::npos) {
                return entry.path();
            }
        }
        return {};
    }
};

} // namespace

TEST_CASE("A clean crawl is followed by the final build", "[StageOrchestrator]") {
    OrchestratorFixture fixture;
    fixture.scriptCrawlExits({0});

    StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
    REQUIRE(orchestrator.run() == JobStatus::Success);

    auto runs = fixture.runtime->runsSnapshot();
    REQUIRE(runs.size() == 2);
    REQUIRE(valueOf(runs[0].command, "--seeds") == "https://example.org");
    REQUIRE(valueOf(runs[0].command, "--workers") == "2");
    REQUIRE_FALSE(hasArg(runs[1].command, "--seeds"));
    REQUIRE(valueOf(runs[1].command, "--warcs") == "/output/.tmpcrawl0/collections/crawl-1/archive/rec-0.warc.gz");

    REQUIRE(std::filesystem::exists(fixture.outputDir() / "testjob.zim"));
    auto tempDirs = orchestrator.state()->tempDirs();
    REQUIRE(std::find(tempDirs.begin(), tempDirs.end(), fixture.outputDir() / ".tmpcrawl0") != tempDirs.end());

    // Per-attempt logs were written
    REQUIRE_FALSE(fixture.combinedLog("archive_initial_crawl_attempt_1_").empty());
}

TEST_CASE("Soft-limit exit codes count as a completed crawl", "[StageOrchestrator]") {
    REQUIRE(isSuccessfulExitCode(0));
    REQUIRE(isSuccessfulExitCode(16));
    REQUIRE(isSuccessfulExitCode(32));
    REQUIRE(isSuccessfulExitCode(33));
    REQUIRE_FALSE(isSuccessfulExitCode(1));
    REQUIRE_FALSE(isSuccessfulExitCode(137));

    OrchestratorFixture fixture;
    fixture.scriptCrawlExits({32});
    StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
    REQUIRE(orchestrator.run() == JobStatus::Success);
    REQUIRE(fixture.runtime->runsSnapshot().size() == 2);
}

TEST_CASE("Failed attempts stop at the attempt ceiling", "[StageOrchestrator]") {
    OrchestratorFixture fixture;
    fixture.config.maxStageAttempts = 1;
    fixture.scriptCrawlExits({1});

    StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
    REQUIRE(orchestrator.run() == JobStatus::FailedMaxAttempts);
    REQUIRE(fixture.runtime->runsSnapshot().size() == 1);
    REQUIRE_FALSE(std::filesystem::exists(fixture.outputDir() / "testjob.zim"));
}

TEST_CASE("Stage failures name the combined log", "[StageOrchestrator]") {
    OrchestratorFixture fixture;
    LogCapture capture(fixture.dir.path() / "capture.log");
    fixture.config.maxStageAttempts = 1;
    fixture.scriptCrawlExits({3});

    StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
    REQUIRE(orchestrator.run() == JobStatus::FailedMaxAttempts);

    std::filesystem::path log = fixture.combinedLog("archive_initial_crawl_attempt_1_");
    REQUIRE_FALSE(log.empty());
    REQUIRE(capture.contains("failed with exit code 3. Check logs: " + log.string()));
    REQUIRE(capture.contains("Last log: " + log.string()));
}

TEST_CASE("A failed attempt is retried and consolidated", "[StageOrchestrator]") {
    OrchestratorFixture fixture;
    fixture.config.maxStageAttempts = 3;
    fixture.scriptCrawlExits({1, 0});

    StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
    REQUIRE(orchestrator.run() == JobStatus::Success);

    auto runs = fixture.runtime->runsSnapshot();
    REQUIRE(runs.size() == 3);
    // No resume config was written by the fake crawler, so the retry starts a new phase
    REQUIRE_FALSE(hasArg(runs[1].command, "--config"));
    REQUIRE(hasArg(runs[1].command, "--seeds"));

    std::string warcs = valueOf(runs[2].command, "--warcs");
    REQUIRE(warcs.find("/output/.tmpcrawl0/") != std::string::npos);
    REQUIRE(warcs.find("/output/.tmpcrawl1/") != std::string::npos);
}

TEST_CASE("Retries resume from a crawler resume config", "[StageOrchestrator]") {
    OrchestratorFixture fixture;
    fixture.config.maxStageAttempts = 2;
    auto counter = std::make_shared<int>(0);
    fixture.runtime->scriptFor = [counter](const RunSpec& spec) {
        if (hasArg(spec.command, "--warcs")) {
            return finalBuildScript(spec, "testjob");
        }
        if ((*counter)++ == 0) {
            std::string crawls = (spec.hostOutputDir / ".tmpfirst" / "collections" / "crawl-1" / "crawls").string();
            return "mkdir -p '" + crawls + "' && printf 'seeds: []' > '" + crawls + "/crawl-20240101.yaml' && " +
                   crawlScript(spec, ".tmpfirst", 1);
        }
        return crawlScript(spec, ".tmpsecond", 0);
    };

    StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
    REQUIRE(orchestrator.run() == JobStatus::Success);

    auto runs = fixture.runtime->runsSnapshot();
    REQUIRE(runs.size() == 3);
    REQUIRE(valueOf(runs[1].command, "--config") == "/output/.zimit_resume.yaml");
    REQUIRE(std::filesystem::exists(fixture.outputDir() / ".zimit_resume.yaml"));
}

TEST_CASE("No WARC files means no final build", "[StageOrchestrator]") {
    OrchestratorFixture fixture;
    fixture.runtime->scriptFor = [](const RunSpec&) { return std::string("exit 0"); };

    StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
    REQUIRE(orchestrator.run() == JobStatus::FailedNoArtifacts);
    REQUIRE(fixture.runtime->runsSnapshot().size() == 1);
}

TEST_CASE("Startup refuses unusable environments", "[StageOrchestrator]") {
    OrchestratorFixture fixture;
    fixture.scriptCrawlExits({0});

    SECTION("Runtime unavailable") {
        fixture.runtime->available = false;
        StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
        REQUIRE_THROWS_AS(orchestrator.run(), FatalError);
    }

    SECTION("Existing artifact without --overwrite") {
        fixture.dir.writeFile("out/testjob.zim", "old");
        StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
        REQUIRE_THROWS_AS(orchestrator.run(), FatalError);
        REQUIRE(fixture.runtime->runsSnapshot().empty());
    }

    SECTION("Existing artifact with --overwrite starts fresh") {
        fixture.dir.writeFile("out/testjob.zim", "old");
        fixture.dir.makeDir("out/.tmpstale");
        fixture.config.overwrite = true;
        StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
        REQUIRE(orchestrator.run() == JobStatus::Success);

        auto runs = fixture.runtime->runsSnapshot();
        REQUIRE(runs.size() == 2);
        REQUIRE(valueOf(runs[1].command, "--warcs").find(".tmpstale") == std::string::npos);
    }
}

TEST_CASE("A stop request before the first attempt starts nothing", "[StageOrchestrator]") {
    OrchestratorFixture fixture;
    fixture.scriptCrawlExits({0});
    fixture.shutdown.requestStop();

    StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
    REQUIRE(orchestrator.run() == JobStatus::Stopped);
    REQUIRE(fixture.runtime->runsSnapshot().empty());
}

TEST_CASE("Cleanup removes temp dirs and the state file after success", "[StageOrchestrator]") {
    OrchestratorFixture fixture;
    fixture.config.cleanup = true;
    fixture.config.relaxPerms = true;
    fixture.scriptCrawlExits({0});

    StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
    REQUIRE(orchestrator.run() == JobStatus::Success);

    REQUIRE(std::filesystem::exists(fixture.outputDir() / "testjob.zim"));
    REQUIRE_FALSE(std::filesystem::exists(fixture.outputDir() / ".tmpcrawl0"));
    REQUIRE_FALSE(std::filesystem::exists(fixture.outputDir() / ".archive_state.json"));
    REQUIRE(fixture.runtime->relaxCalls >= 1);
}

TEST_CASE("Error threshold triggers a worker reduction and a restart", "[StageOrchestrator]") {
    OrchestratorFixture fixture;
    fixture.enableFastMonitoring();
    fixture.config.adaptation.enableAdaptiveWorkers = true;
    fixture.config.adaptation.minWorkers = 1;
    fixture.config.adaptation.maxWorkerReductions = 1;

    auto counter = std::make_shared<int>(0);
    fixture.runtime->scriptFor = [counter](const RunSpec& spec) {
        if (hasArg(spec.command, "--warcs")) {
            return finalBuildScript(spec, "testjob");
        }
        if ((*counter)++ == 0) {
            // Keeps running until the orchestrator stops it
            return crawlScript(spec, ".tmpslow", "exec sleep 30");
        }
        return crawlScript(spec, ".tmpfast", 0);
    };

    StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
    REQUIRE(orchestrator.run() == JobStatus::Success);

    auto runs = fixture.runtime->runsSnapshot();
    REQUIRE(runs.size() == 3);
    REQUIRE(valueOf(runs[0].command, "--workers") == "2");
    REQUIRE(valueOf(runs[1].command, "--workers") == "1");
    REQUIRE(fixture.runtime->stopped.size() >= 1);
    REQUIRE(orchestrator.state()->workerReductionsDone() == 1);
    REQUIRE(orchestrator.state()->currentWorkers() == 1);
}

TEST_CASE("Egress rotation keeps the running crawl", "[StageOrchestrator]") {
    OrchestratorFixture fixture;
    fixture.enableFastMonitoring();
    fixture.config.adaptation.enableVpnRotation = true;
    fixture.config.adaptation.vpnConnectCommand = "/bin/true";
    fixture.config.adaptation.vpnSettleDelay = 0s;
    fixture.config.adaptation.maxVpnRotations = 1;
    fixture.runtime->scriptFor = [](const RunSpec& spec) {
        if (hasArg(spec.command, "--warcs")) {
            return finalBuildScript(spec, "testjob");
        }
        return crawlScript(spec, ".tmplive", "sleep 5; exit 0");
    };

    StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
    REQUIRE(orchestrator.run() == JobStatus::Success);

    // One crawl run plus the final build; the container was never stopped
    auto runs = fixture.runtime->runsSnapshot();
    REQUIRE(runs.size() == 2);
    REQUIRE(hasArg(runs[1].command, "--warcs"));
    REQUIRE(fixture.runtime->stopped.empty());
    REQUIRE(orchestrator.state()->vpnRotationsDone() == 1);
    REQUIRE(orchestrator.state()->workerReductionsDone() == 0);
}

TEST_CASE("A stall restarts the container and the crawl carries on", "[StageOrchestrator]") {
    OrchestratorFixture fixture;
    fixture.config.enableMonitoring = true;
    fixture.config.monitor.pollInterval = 1s;
    fixture.config.monitor.startupDelay = 0ms;
    fixture.config.monitor.stallTimeout = 0min;
    fixture.config.adaptation.enableAdaptiveRestart = true;
    fixture.config.adaptation.maxContainerRestarts = 1;
    // One stats record with pending pages, then silence
    fixture.runtime->logScript =
        R"(echo '{"logLevel":"info","context":"crawlStatus","message":"Crawl statistics",)"
        R"("details":{"crawled":5,"total":10,"pending":5,"failed":0}}'; exec sleep 30)";

    auto counter = std::make_shared<int>(0);
    fixture.runtime->scriptFor = [counter](const RunSpec& spec) {
        if (hasArg(spec.command, "--warcs")) {
            return finalBuildScript(spec, "testjob");
        }
        if ((*counter)++ == 0) {
            return crawlScript(spec, ".tmpstalled", "exec sleep 30");
        }
        return crawlScript(spec, ".tmpafter", 0);
    };

    StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
    REQUIRE(orchestrator.run() == JobStatus::Success);

    auto runs = fixture.runtime->runsSnapshot();
    REQUIRE(runs.size() == 3);
    REQUIRE(fixture.runtime->stopped.size() == 1);
    REQUIRE(orchestrator.state()->containerRestartsDone() == 1);
    // No resume config was left behind, so the rerun is a new phase with the same workers
    REQUIRE(hasArg(runs[1].command, "--seeds"));
    REQUIRE(valueOf(runs[1].command, "--workers") == "2");

    std::string warcs = valueOf(runs[2].command, "--warcs");
    REQUIRE(warcs.find("/output/.tmpstalled/") != std::string::npos);
    REQUIRE(warcs.find("/output/.tmpafter/") != std::string::npos);
}

TEST_CASE("Unhandled events back off and the crawl continues", "[StageOrchestrator]") {
    OrchestratorFixture fixture;
    LogCapture capture(fixture.dir.path() / "capture.log");
    fixture.enableFastMonitoring();
    fixture.config.backoffDelay = 1s;
    fixture.runtime->scriptFor = [](const RunSpec& spec) {
        if (hasArg(spec.command, "--warcs")) {
            return finalBuildScript(spec, "testjob");
        }
        return crawlScript(spec, ".tmpsteady", "sleep 5; exit 0");
    };

    StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
    REQUIRE(orchestrator.run() == JobStatus::Success);

    auto runs = fixture.runtime->runsSnapshot();
    REQUIRE(runs.size() == 2);
    REQUIRE(fixture.runtime->stopped.empty());
    REQUIRE(capture.contains("No adaptation strategy applied."));
    REQUIRE(capture.contains("Applying backoff delay of 0:01 (unhandled error)"));
}

TEST_CASE("Emergency stop escalates to a kill", "[StageOrchestrator]") {
    OrchestratorFixture fixture;
    LogCapture capture(fixture.dir.path() / "capture.log");
    // The crawler ignores SIGTERM, so only a kill ends it
    fixture.runtime->scriptFor = [](const RunSpec& spec) {
        return crawlScript(spec, ".tmpstubborn", "trap '' TERM; exec sleep 60");
    };

    StageOrchestrator orchestrator(fixture.config, fixture.runtime, fixture.shutdown);
    auto result = std::async(std::launch::async, [&orchestrator] { return orchestrator.run(); });

    auto deadline = std::chrono::steady_clock::now() + 10s;
    while (fixture.runtime->runsSnapshot().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
    REQUIRE(fixture.runtime->runsSnapshot().size() == 1);
    std::this_thread::sleep_for(300ms);

    // Same order as the signal thread
    fixture.shutdown.requestStop();
    orchestrator.supervisor().emergencyStop();

    REQUIRE(result.wait_for(30s) == std::future_status::ready);
    REQUIRE(result.get() == JobStatus::Stopped);
    REQUIRE(fixture.runtime->stopped.size() == 1);
    REQUIRE(capture.contains("attempting kill"));
    REQUIRE(capture.contains("Docker process killed."));
    REQUIRE(fixture.runtime->runsSnapshot().size() == 1);
}
