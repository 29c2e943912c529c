#include <catch2/catch.hpp>
#include "../../include/crawl_archiver/container/ContainerSupervisor.h"
#include "../../include/crawl_archiver/container/DockerRuntime.h"
#include "../support/TempDirectory.h"
#include <algorithm>

using namespace crawl_archiver;
using namespace crawl_archiver::container;

namespace {

std::vector<std::string> tail(const std::vector<std::string>& args, size_t n) {
    return std::vector<std::string>(args.end() - static_cast<long>(n), args.end());
}

size_t countOf(const std::vector<std::string>& args, const std::string& value) {
    return static_cast<size_t>(std::count(args.begin(), args.end(), value));
}

} // namespace

TEST_CASE("ContainerSupervisor builds crawl arguments", "[ContainerSupervisor]") {
    RequiredArgs required{{"https://a.example", "https://b.example"}, "job"};

    SECTION("Seeds are joined and workers re-derived") {
        auto args = ContainerSupervisor::buildArgs({"--workers", "8", "--scopeType", "host"},
                                                   required, 3, false, {});
        std::vector<std::string> expected = {
            "zimit", "--seeds", "https://a.example,https://b.example", "--name", "job",
            "--workers", "3", "--scopeType", "host", "--keep", "--output", "/output"
        };
        REQUIRE(args == expected);
    }

    SECTION("Inline worker flags are dropped too") {
        auto args = ContainerSupervisor::buildArgs({"--workers=6"}, required, 2, false, {});
        REQUIRE(countOf(args, "--workers") == 1);
        REQUIRE(countOf(args, "--workers=6") == 0);
    }

    SECTION("Output flags are replaced by the fixed path at the end") {
        auto args = ContainerSupervisor::buildArgs({"--output", "/elsewhere", "--output=/x", "--keep"},
                                                   required, 1, false, {"--config", "/output/.zimit_resume.yaml"});
        REQUIRE(tail(args, 2) == std::vector<std::string>{"--output", "/output"});
        REQUIRE(countOf(args, "/elsewhere") == 0);
        REQUIRE(countOf(args, "--output=/x") == 0);
        REQUIRE(countOf(args, "--keep") == 1);
        REQUIRE(countOf(args, "--config") == 1);
    }

    SECTION("Final build has no seeds and no worker count") {
        auto args = ContainerSupervisor::buildArgs({"--title", "T", "--workers", "4"}, required, 4, true,
                                                   {"--warcs", "/output/.tmp1/a.warc.gz"});
        REQUIRE(countOf(args, "--seeds") == 0);
        REQUIRE(countOf(args, "--workers") == 0);
        REQUIRE(countOf(args, "--name") == 1);
        REQUIRE(countOf(args, "--warcs") == 1);
        REQUIRE(args.front() == "zimit");
    }

    SECTION("A passthrough --name never duplicates the job name") {
        auto crawl = ContainerSupervisor::buildArgs({"--name", "other", "--name=third", "--lang", "en"},
                                                    required, 2, false, {});
        REQUIRE(countOf(crawl, "--name") == 1);
        REQUIRE(countOf(crawl, "other") == 0);
        REQUIRE(countOf(crawl, "--name=third") == 0);
        REQUIRE(countOf(crawl, "--lang") == 1);

        std::vector<std::string> passthrough = {"--name", "other", "--title", "T"};
        auto finalBuild = ContainerSupervisor::buildArgs(
            ContainerSupervisor::filterArgsForFinalBuild(passthrough), required, 2, true, {});
        REQUIRE(countOf(finalBuild, "--name") == 1);
        REQUIRE(countOf(finalBuild, "job") == 1);
        REQUIRE(countOf(finalBuild, "other") == 0);
    }
}

TEST_CASE("ContainerSupervisor filters final build arguments", "[ContainerSupervisor]") {
    std::vector<std::string> passthrough = {
        "--title", "Health Site", "--scopeType", "prefix", "--lang=en",
        "--description", "Archived", "--exclude", "foo", "--favicon", "--verbose", "--name", "dup"
    };
    auto filtered = ContainerSupervisor::filterArgsForFinalBuild(passthrough);
    std::vector<std::string> expected = {
        "--title", "Health Site", "--lang=en", "--description", "Archived", "--favicon"
    };
    REQUIRE(filtered == expected);
}

TEST_CASE("ContainerSupervisor run labels are unique per run", "[ContainerSupervisor]") {
    std::string first = ContainerSupervisor::makeRunLabel("hc");
    std::string second = ContainerSupervisor::makeRunLabel("hc");
    REQUIRE(first.rfind("archive-hc-", 0) == 0);
    REQUIRE(first.size() == std::string("archive-hc-").size() + 8);
    REQUIRE(first != second);
}

TEST_CASE("DockerRuntime command construction", "[DockerRuntime]") {
    std::vector<std::vector<std::string>> calls;
    CommandResult next;
    DockerRuntime runtime([&](const std::vector<std::string>& argv, std::chrono::milliseconds) {
        calls.push_back(argv);
        return next;
    });

    SECTION("Run command carries label, limits and mount") {
        TempDirectory dir;
        RunSpec spec;
        spec.image = "ghcr.io/openzim/zimit";
        spec.hostOutputDir = dir.path();
        spec.command = {"zimit", "--name", "job"};
        spec.label = "archive-job-abcd1234";
        spec.shmSize = "1g";
        spec.memoryLimit = "4g";
        spec.cpuLimit = "1.5";
        spec.runAsRoot = true;

        auto cmd = runtime.buildRunCommand(spec);
        std::vector<std::string> expected = {
            "docker", "run", "--rm", "-v", std::filesystem::canonical(dir.path()).string() + ":/output",
            "--label", "archive_job=archive-job-abcd1234", "--shm-size", "1g", "--user", "0:0",
            "--memory", "4g", "--memory-swap", "4g", "--memory-swappiness", "10", "--cpus", "1.5",
            "ghcr.io/openzim/zimit", "zimit", "--name", "job"
        };
        REQUIRE(cmd == expected);
    }

    SECTION("Label lookup returns the first id") {
        next.started = true;
        next.exitCode = 0;
        next.output = "abc123\ndef456\n";
        auto id = runtime.findByLabel("archive-x-1");
        REQUIRE(id == std::optional<std::string>("abc123"));
        REQUIRE(calls.back() == std::vector<std::string>{"docker", "ps", "-q", "--filter", "label=archive_job=archive-x-1"});
    }

    SECTION("Liveness probe is empty when the container is gone") {
        next.started = true;
        next.exitCode = 0;
        next.output = "\n";
        REQUIRE_FALSE(runtime.isRunning("abc123"));
    }

    SECTION("Missing container counts as stopped") {
        next.started = true;
        next.exitCode = 1;
        next.output = "Error response from daemon: No such container: abc123";
        REQUIRE(runtime.stop("abc123", std::chrono::seconds(90)));
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0] == std::vector<std::string>{"docker", "stop", "-t", "90", "abc123"});
    }

    SECTION("Failed stop escalates to kill") {
        next.started = true;
        next.exitCode = 1;
        next.output = "permission denied";
        REQUIRE_FALSE(runtime.stop("abc123", std::chrono::seconds(90)));
        REQUIRE(calls.size() == 2);
        REQUIRE(calls[1] == std::vector<std::string>{"docker", "kill", "abc123"});
    }
}
