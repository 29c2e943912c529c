#include <catch2/catch.hpp>
#include "../../include/crawl_archiver/strategy/AdaptationEngine.h"
#include "../../include/crawl_archiver/strategy/ContainerRestartStrategy.h"
#include "../../include/crawl_archiver/strategy/EgressRotationStrategy.h"
#include "../../include/crawl_archiver/strategy/WorkerReductionStrategy.h"
#include "../support/TempDirectory.h"
#include <stdexcept>

using namespace crawl_archiver;
using namespace crawl_archiver::strategy;
using monitor::MonitorEvent;
using namespace std::chrono_literals;

namespace {

// Records every command instead of running it
struct RecordingRunner {
    std::shared_ptr<std::vector<std::vector<std::string>>> calls =
        std::make_shared<std::vector<std::vector<std::string>>>();
    int exitCode = 0;

    container::CommandRunner asRunner() {
        auto sink = calls;
        int code = exitCode;
        return [sink, code](const std::vector<std::string>& argv, std::chrono::milliseconds) {
            sink->push_back(argv);
            container::CommandResult result;
            result.started = true;
            result.exitCode = code;
            return result;
        };
    }
};

class ThrowingStrategy : public AdaptationStrategy {
public:
    std::string name() const override { return "Throwing"; }
    bool attempt(const MonitorEvent&) override { throw std::runtime_error("boom"); }
    bool requiresRestart() const override { return true; }
};

AdaptationSettings rotationSettings() {
    AdaptationSettings settings;
    settings.enableVpnRotation = true;
    settings.vpnConnectCommand = "/bin/true connect 'us east'";
    settings.maxVpnRotations = 2;
    settings.vpnRotationFrequency = 60min;
    settings.vpnSettleDelay = 0s;
    return settings;
}

} // namespace

TEST_CASE("Worker reduction respects the floor and the cap", "[WorkerReductionStrategy]") {
    TempDirectory dir;
    state::JobState state(dir.path(), 4);

    AdaptationSettings settings;
    settings.enableAdaptiveWorkers = true;
    settings.minWorkers = 2;
    settings.maxWorkerReductions = 5;
    WorkerReductionStrategy strategy(state, settings);

    REQUIRE(strategy.attempt(MonitorEvent::error("timeout_threshold")));
    REQUIRE(state.currentWorkers() == 3);
    REQUIRE(strategy.attempt(MonitorEvent::stalled("timeout")));
    REQUIRE(state.currentWorkers() == 2);
    REQUIRE_FALSE(strategy.attempt(MonitorEvent::stalled("timeout")));
    REQUIRE(state.currentWorkers() == 2);
    REQUIRE(state.workerReductionsDone() == 2);

    SECTION("Cap reached") {
        settings.minWorkers = 1;
        settings.maxWorkerReductions = 2;
        WorkerReductionStrategy capped(state, settings);
        REQUIRE_FALSE(capped.attempt(MonitorEvent::stalled("timeout")));
        REQUIRE(state.currentWorkers() == 2);
    }
}

TEST_CASE("Worker reduction is a no-op when disabled", "[WorkerReductionStrategy]") {
    TempDirectory dir;
    state::JobState state(dir.path(), 4);
    WorkerReductionStrategy strategy(state, AdaptationSettings{});

    REQUIRE_FALSE(strategy.attempt(MonitorEvent::stalled("timeout")));
    REQUIRE(state.currentWorkers() == 4);
}

TEST_CASE("Container restart only answers stalls", "[ContainerRestartStrategy]") {
    TempDirectory dir;
    state::JobState state(dir.path(), 1);

    AdaptationSettings settings;
    settings.enableAdaptiveRestart = true;
    settings.maxContainerRestarts = 1;
    ContainerRestartStrategy strategy(state, settings);

    REQUIRE_FALSE(strategy.attempt(MonitorEvent::error("http_threshold")));
    REQUIRE(strategy.attempt(MonitorEvent::stalled("timeout")));
    REQUIRE(state.containerRestartsDone() == 1);
    REQUIRE_FALSE(strategy.attempt(MonitorEvent::stalled("timeout")));

    SECTION("A zero cap disables restarts") {
        settings.maxContainerRestarts = 0;
        ContainerRestartStrategy disabled(state, settings);
        REQUIRE_FALSE(disabled.attempt(MonitorEvent::stalled("timeout")));
    }
}

TEST_CASE("Egress rotation runs the connect command and rate-limits itself", "[EgressRotationStrategy]") {
    TempDirectory dir;
    state::JobState state(dir.path(), 1);
    ShutdownToken shutdown;
    RecordingRunner runner;

    EgressRotationStrategy strategy(state, rotationSettings(), shutdown, runner.asRunner());

    REQUIRE(strategy.attempt(MonitorEvent::error("http_threshold")));
    REQUIRE(state.vpnRotationsDone() == 1);
    REQUIRE(state.lastVpnRotation().has_value());
    REQUIRE(runner.calls->size() == 1);
    std::vector<std::string> expected = {"/bin/true", "connect", "us east"};
    REQUIRE(runner.calls->front() == expected);

    // Second rotation inside the frequency window
    REQUIRE_FALSE(strategy.attempt(MonitorEvent::error("http_threshold")));
    REQUIRE(runner.calls->size() == 1);
    REQUIRE(state.vpnRotationsDone() == 1);
}

TEST_CASE("Egress rotation failure paths leave the counters alone", "[EgressRotationStrategy]") {
    TempDirectory dir;
    state::JobState state(dir.path(), 1);
    ShutdownToken shutdown;
    AdaptationSettings settings = rotationSettings();

    SECTION("Command exits non-zero") {
        RecordingRunner runner;
        runner.exitCode = 1;
        EgressRotationStrategy strategy(state, settings, shutdown, runner.asRunner());
        REQUIRE_FALSE(strategy.attempt(MonitorEvent::error("timeout_threshold")));
        REQUIRE(runner.calls->size() == 1);
    }

    SECTION("Executable missing") {
        RecordingRunner runner;
        settings.vpnConnectCommand = "definitely-not-a-vpn-client-xyz connect";
        EgressRotationStrategy strategy(state, settings, shutdown, runner.asRunner());
        REQUIRE_FALSE(strategy.attempt(MonitorEvent::error("timeout_threshold")));
        REQUIRE(runner.calls->empty());
    }

    SECTION("Unterminated quote") {
        RecordingRunner runner;
        settings.vpnConnectCommand = "/bin/true 'oops";
        EgressRotationStrategy strategy(state, settings, shutdown, runner.asRunner());
        REQUIRE_FALSE(strategy.attempt(MonitorEvent::error("timeout_threshold")));
        REQUIRE(runner.calls->empty());
    }

    SECTION("Shutdown during the settle delay") {
        RecordingRunner runner;
        settings.vpnSettleDelay = 5s;
        shutdown.requestStop();
        EgressRotationStrategy strategy(state, settings, shutdown, runner.asRunner());
        REQUIRE_FALSE(strategy.attempt(MonitorEvent::error("timeout_threshold")));
        REQUIRE(runner.calls->size() == 1);
    }

    REQUIRE(state.vpnRotationsDone() == 0);
}

TEST_CASE("Executable lookup", "[EgressRotationStrategy]") {
    REQUIRE(EgressRotationStrategy::isExecutableAvailable("/bin/sh"));
    REQUIRE(EgressRotationStrategy::isExecutableAvailable("sh"));
    REQUIRE_FALSE(EgressRotationStrategy::isExecutableAvailable("/nonexistent/bin/tool"));
    REQUIRE_FALSE(EgressRotationStrategy::isExecutableAvailable(""));
}

TEST_CASE("Engine tries strategies in priority order", "[AdaptationEngine]") {
    TempDirectory dir;
    state::JobState state(dir.path(), 2);
    ShutdownToken shutdown;
    RecordingRunner runner;

    AdaptationSettings settings = rotationSettings();
    settings.enableAdaptiveWorkers = true;
    settings.minWorkers = 1;
    settings.maxWorkerReductions = 1;
    settings.enableAdaptiveRestart = true;
    settings.maxContainerRestarts = 1;

    auto engine = AdaptationEngine::fromSettings(state, settings, shutdown, runner.asRunner());
    REQUIRE(engine->strategyCount() == 3);

    // Worker reduction first
    REQUIRE(engine->handle(MonitorEvent::stalled("timeout")) == AdaptationOutcome::RestartRequired);
    REQUIRE(state.currentWorkers() == 1);

    // Then live rotation
    REQUIRE(engine->handle(MonitorEvent::stalled("timeout")) == AdaptationOutcome::ContinueLive);
    REQUIRE(state.vpnRotationsDone() == 1);

    // Rotation is rate-limited, so an error event has nothing left
    REQUIRE(engine->handle(MonitorEvent::error("http_threshold")) == AdaptationOutcome::None);

    // A stall still gets the restart
    REQUIRE(engine->handle(MonitorEvent::stalled("timeout")) == AdaptationOutcome::RestartRequired);
    REQUIRE(state.containerRestartsDone() == 1);

    REQUIRE(engine->handle(MonitorEvent::stalled("timeout")) == AdaptationOutcome::None);
}

TEST_CASE("Engine ignores progress events and survives throwing strategies", "[AdaptationEngine]") {
    TempDirectory dir;
    state::JobState state(dir.path(), 3);

    AdaptationSettings settings;
    settings.enableAdaptiveWorkers = true;

    AdaptationEngine engine;
    engine.addStrategy(std::make_unique<ThrowingStrategy>());
    engine.addStrategy(std::make_unique<WorkerReductionStrategy>(state, settings));

    REQUIRE(engine.handle(MonitorEvent::progress()) == AdaptationOutcome::None);
    REQUIRE(state.currentWorkers() == 3);

    REQUIRE(engine.handle(MonitorEvent::error("timeout_threshold")) == AdaptationOutcome::RestartRequired);
    REQUIRE(state.currentWorkers() == 2);
}

TEST_CASE("Engine without strategies does nothing", "[AdaptationEngine]") {
    TempDirectory dir;
    state::JobState state(dir.path(), 1);
    ShutdownToken shutdown;

    auto engine = AdaptationEngine::fromSettings(state, AdaptationSettings{}, shutdown);
    REQUIRE(engine->strategyCount() == 0);
    REQUIRE(engine->handle(MonitorEvent::stalled("timeout")) == AdaptationOutcome::None);
    REQUIRE(adaptationOutcomeName(AdaptationOutcome::None) == "none");
}
