#include <catch2/catch.hpp>
#include "../../include/crawl_archiver/container/ChildProcess.h"
#include "../../include/crawl_archiver/container/LogDrain.h"
#include "../support/TempDirectory.h"

using namespace crawl_archiver::container;

TEST_CASE("ChildProcess reports exit codes", "[ChildProcess]") {
    std::string error;

    SECTION("Normal exit") {
        auto child = ChildProcess::spawn({"/bin/sh", "-c", "exit 16"}, error);
        REQUIRE(child != nullptr);
        REQUIRE(child->wait(std::chrono::seconds(10)) == std::optional<int>(16));
        REQUIRE_FALSE(child->isRunning());
    }

    SECTION("Killed by signal") {
        auto child = ChildProcess::spawn({"/bin/sh", "-c", "sleep 30"}, error);
        REQUIRE(child != nullptr);
        REQUIRE(child->isRunning());
        REQUIRE(child->terminate());
        REQUIRE(child->wait(std::chrono::seconds(10)) == std::optional<int>(128 + 15));
    }

    SECTION("Missing executable fails to spawn") {
        auto child = ChildProcess::spawn({"/nonexistent/crawler-binary"}, error);
        REQUIRE(child == nullptr);
        REQUIRE(error.find("cannot execute") != std::string::npos);
    }
}

TEST_CASE("runCommand captures merged output", "[ChildProcess]") {
    SECTION("Output and exit code") {
        auto result = runCommand({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"}, std::chrono::seconds(10));
        REQUIRE(result.started);
        REQUIRE_FALSE(result.timedOut);
        REQUIRE(result.exitCode == 3);
        REQUIRE(result.output.find("out") != std::string::npos);
        REQUIRE(result.output.find("err") != std::string::npos);
        REQUIRE_FALSE(result.succeeded());
    }

    SECTION("Timeout kills the command") {
        auto start = std::chrono::steady_clock::now();
        auto result = runCommand({"/bin/sh", "-c", "sleep 30"}, std::chrono::milliseconds(300));
        REQUIRE(result.timedOut);
        REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
    }

    SECTION("Unknown program is reported as not started") {
        auto result = runCommand({"definitely-not-a-real-command-xyz"}, std::chrono::seconds(5));
        REQUIRE_FALSE(result.started);
    }
}

TEST_CASE("splitCommandLine follows shell quoting", "[ChildProcess]") {
    using Words = std::vector<std::string>;

    auto plain = splitCommandLine("nordvpn connect ca");
    REQUIRE(plain.has_value());
    REQUIRE(*plain == Words{"nordvpn", "connect", "ca"});

    auto singleQuoted = splitCommandLine("sh -c 'echo hello world'");
    REQUIRE(singleQuoted.has_value());
    REQUIRE(*singleQuoted == Words{"sh", "-c", "echo hello world"});

    auto escaped = splitCommandLine(R"(cmd "a \"b\"" c\ d)");
    REQUIRE(escaped.has_value());
    REQUIRE(*escaped == Words{"cmd", "a \"b\"", "c d"});

    auto blank = splitCommandLine("   ");
    REQUIRE(blank.has_value());
    REQUIRE(blank->empty());

    REQUIRE_FALSE(splitCommandLine("echo 'unterminated").has_value());
}

TEST_CASE("LogDrain writes both stage logs", "[LogDrain]") {
    TempDirectory dir;
    std::string error;
    std::shared_ptr<ChildProcess> child =
        ChildProcess::spawn({"/bin/sh", "-c", "echo first; echo second 1>&2"}, error);
    REQUIRE(child != nullptr);

    StageLogPaths paths = LogDrain::makePaths(dir.path(), "Initial Crawl Attempt 1");
    REQUIRE(paths.combinedLog.filename().string().rfind("archive_initial_crawl_attempt_1_", 0) == 0);
    REQUIRE(paths.combinedLog.string().find(".combined.log") != std::string::npos);

    LogDrain drain(child, paths, "Initial Crawl Attempt 1", false);
    child->wait(std::chrono::seconds(10));
    REQUIRE(drain.stop(std::chrono::seconds(10)));

    std::ifstream combined(paths.combinedLog);
    std::string content((std::istreambuf_iterator<char>(combined)), std::istreambuf_iterator<char>());
    REQUIRE(content.find("first") != std::string::npos);
    REQUIRE(content.find("second") != std::string::npos);
    REQUIRE(std::filesystem::file_size(paths.stdoutLog) == std::filesystem::file_size(paths.combinedLog));
}
