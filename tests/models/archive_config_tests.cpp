#include <catch2/catch.hpp>
#include "../../include/crawl_archiver/models/ArchiveConfig.h"
#include <cstdlib>

using namespace crawl_archiver;
using namespace std::chrono_literals;

namespace {

ArchiveConfig validConfig() {
    ArchiveConfig config;
    config.seeds = {"https://example.org"};
    config.name = "site";
    config.outputDir = "/tmp/site";
    return config;
}

} // namespace

TEST_CASE("A minimal configuration is valid", "[ArchiveConfig]") {
    ArchiveConfig config = validConfig();
    REQUIRE(config.validate().empty());
    REQUIRE(config.finalArtifactPath() == std::filesystem::path("/tmp/site/site.zim"));
    REQUIRE(config.backoffDelay == 15min);
    REQUIRE(config.maxStageAttempts == 100);
}

TEST_CASE("Cross-field constraints are reported", "[ArchiveConfig]") {
    ArchiveConfig config = validConfig();

    SECTION("Adaptation requires monitoring") {
        config.adaptation.enableAdaptiveRestart = true;
        REQUIRE(config.validate().size() == 1);
        config.enableMonitoring = true;
        REQUIRE(config.validate().empty());
    }

    SECTION("Rotation requires a connect command") {
        config.enableMonitoring = true;
        config.adaptation.enableVpnRotation = true;
        REQUIRE(config.validate().size() == 1);
        config.adaptation.vpnConnectCommand = "vpn connect";
        REQUIRE(config.validate().empty());
    }

    SECTION("Numeric floors") {
        config.adaptation.minWorkers = 0;
        config.monitor.errorThresholdHttp = 0;
        config.maxStageAttempts = 0;
        config.adaptation.vpnRotationFrequency = std::chrono::minutes(-1);
        REQUIRE(config.validate().size() == 4);
    }
}

TEST_CASE("Passthrough --workers overrides the initial worker count", "[ArchiveConfig]") {
    ArchiveConfig config = validConfig();
    config.initialWorkers = 3;
    REQUIRE(config.effectiveInitialWorkers() == 3);

    config.passthroughArgs = {"--workers", "5"};
    REQUIRE(config.effectiveInitialWorkers() == 5);

    config.passthroughArgs = {"--workers=7"};
    REQUIRE(config.effectiveInitialWorkers() == 7);

    config.passthroughArgs = {"--workers", "lots"};
    REQUIRE(config.effectiveInitialWorkers() == 3);

    config.passthroughArgs.clear();
    config.initialWorkers = 0;
    REQUIRE(config.effectiveInitialWorkers() == 1);
}

TEST_CASE("Container limits come from the environment", "[ArchiveConfig]") {
    ArchiveConfig config = validConfig();
    REQUIRE(config.container.memoryLimit == std::optional<std::string>("4g"));
    REQUIRE(config.container.cpuLimit == std::optional<std::string>("1.5"));
    REQUIRE_FALSE(config.container.shmSize.has_value());

    ::setenv("CRAWL_ARCHIVER_DOCKER_MEMORY_LIMIT", "", 1);
    ::setenv("CRAWL_ARCHIVER_DOCKER_CPU_LIMIT", "2", 1);
    ::setenv("CRAWL_ARCHIVER_DOCKER_SHM_SIZE", "1g", 1);
    config.applyEnvironment();
    ::unsetenv("CRAWL_ARCHIVER_DOCKER_MEMORY_LIMIT");
    ::unsetenv("CRAWL_ARCHIVER_DOCKER_CPU_LIMIT");
    ::unsetenv("CRAWL_ARCHIVER_DOCKER_SHM_SIZE");

    REQUIRE_FALSE(config.container.memoryLimit.has_value());
    REQUIRE(config.container.cpuLimit == std::optional<std::string>("2"));
    REQUIRE(config.container.shmSize == std::optional<std::string>("1g"));
}
