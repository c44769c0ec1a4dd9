#include "EngineRig.hpp"

#include "photon/devices/InterlockDropTimer.hpp"
#include "photon/engine/ExecutionRecord.hpp"
#include "photon/log/Log.hpp"

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

using namespace photon;
using namespace photon::test;
using engine::ExecutionState;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { photon::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { photon::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", _va, " != ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static std::size_t countAfter(const std::vector<devices::DeviceCommand>& commands,
                              exec::Clock::time_point since) {
    std::size_t n = 0;
    for (const auto& command : commands) {
        if (command.at >= since) ++n;
    }
    return n;
}

static void testPreflightRefusesRun() {
    EngineRig rig(fastConfig(), /*withInterlock=*/true, /*permitted=*/false);
    const auto result = rig.engine->execute(makeProtocol({powerLine(1, 0.5, 0.02)}));

    ASSERT_TRUE(!result.success, "run refused");
    ASSERT_EQ(result.message, std::string("Safety check failed: Laser enable not permitted (door open)"),
              "status text reported");
    ASSERT_TRUE(result.code == core::ErrorCode::SafetyGateDenied, "refusal code");
    ASSERT_TRUE(rig.engine->state() == ExecutionState::Idle, "no state change");
    ASSERT_TRUE(rig.laser->commands().empty(), "laser untouched");
    ASSERT_TRUE(!rig.engine->isRunActive(), "engine free again");

    rig.interlock->setEnablePermitted(true, "door closed");
    ASSERT_TRUE(rig.engine->execute(makeProtocol({dwellLine(1, 0.02)})).success,
                "runs once enable is permitted");
}

static void testNoSafetySourceSkipsPreflight() {
    EngineRig rig(fastConfig(), /*withInterlock=*/false);
    ASSERT_TRUE(rig.engine->execute(makeProtocol({dwellLine(1, 0.02)})).success,
                "bench mode runs without a safety source");
}

static void testInterlockPreemptsLongDwell() {
    std::mutex criticalMtx;
    std::vector<std::string> critical;
    photon::log::setLogHandler(photon::log::Level::Critical, [&](std::string_view message) {
        std::lock_guard lock(criticalMtx);
        critical.emplace_back(message);
    });

    EngineRig rig(engine::EngineConfig{});
    auto line = powerLine(1, 1.0, 10.0);
    line.movement = protocol::MoveAction{protocol::AbsoluteMove{10.0, 1.0}};
    auto p = makeProtocol({line});

    auto run = rig.executeAsync(p);
    ASSERT_TRUE(rig.waitForState(ExecutionState::Running), "run starts");
    std::this_thread::sleep_for(500ms);

    const auto dropped = exec::Clock::now();
    rig.interlock->setEnablePermitted(false, "door opened");
    const auto result = run.get();
    const double latency = secondsSince(dropped);

    ASSERT_TRUE(latency <= 0.2, "execute returns within 200 ms of interlock loss");
    ASSERT_TRUE(!result.success, "run did not succeed");
    ASSERT_EQ(result.message, std::string("Execution stopped by safety interlock"), "stop message");
    ASSERT_TRUE(result.code == core::ErrorCode::SafetyStopped, "safety stop code");
    ASSERT_TRUE(rig.engine->state() == ExecutionState::Stopped, "state stopped");

    const auto laserCommands = rig.laser->commands();
    ASSERT_TRUE(laserCommands.size() >= 2, "shutdown issued");
    if (laserCommands.size() >= 2) {
        const auto& off = laserCommands[laserCommands.size() - 2];
        const auto& zero = laserCommands.back();
        ASSERT_EQ(off.name, std::string("setOutput"), "output disabled first");
        ASSERT_EQ(off.value, 0.0, "output off");
        ASSERT_EQ(zero.name, std::string("setCurrent"), "then current");
        ASSERT_EQ(zero.value, 0.0, "current zero");
    }
    ASSERT_EQ(countAfter(rig.actuator->commands(), dropped), std::size_t(0),
              "actuator never commanded by a stop");
    ASSERT_TRUE(!rig.laser->outputEnabled() && rig.laser->current() == 0.0, "laser is off");

    const auto summary = rig.engine->lastSummary();
    ASSERT_TRUE(summary.stopReason && *summary.stopReason == engine::StopReason::Safety,
                "stop reason recorded");
    ASSERT_TRUE(!summary.executionLog.empty() &&
                    summary.executionLog.back().event == engine::LineEvent::Error,
                "interrupted line logged as error");
    ASSERT_EQ(engine::toJson(summary).at("stop_reason").get<std::string>(), std::string("safety"),
              "record carries the stop reason");

    photon::log::resetLogHandlers();
    std::lock_guard lock(criticalMtx);
    ASSERT_TRUE(!critical.empty() && critical.front().find("SAFETY INTERLOCK LOST") != std::string::npos,
                "preemption logged at critical level");
}

static void testInterlockCutsRampShort() {
    EngineRig rig;
    auto line = emptyLine(1);
    line.laser = protocol::LaserAction{protocol::PowerRamp{0.0, 1.0, 2.0}};
    auto p = makeProtocol({line});

    auto run = rig.executeAsync(p);
    ASSERT_TRUE(rig.waitForState(ExecutionState::Running), "run starts");
    std::this_thread::sleep_for(500ms);
    rig.interlock->setEnablePermitted(false, "door opened");
    const auto result = run.get();
    std::this_thread::sleep_for(300ms);

    ASSERT_EQ(result.message, std::string("Execution stopped by safety interlock"), "stop message");
    const auto commands = rig.laser->commands();
    ASSERT_TRUE(commands.size() >= 3, "ramp steps then shutdown");
    if (commands.size() >= 3) {
        const auto& off = commands[commands.size() - 2];
        const auto& zero = commands.back();
        ASSERT_EQ(off.name, std::string("setOutput"), "output off first");
        ASSERT_EQ(off.value, 0.0, "output disabled");
        ASSERT_EQ(zero.name, std::string("setCurrent"), "then current");
        ASSERT_EQ(zero.value, 0.0, "current zero");
        for (std::size_t i = 0; i + 2 < commands.size(); ++i) {
            ASSERT_TRUE(commands[i].at <= off.at, "no ramp step after the interlock loss");
        }
    }
    ASSERT_TRUE(rig.laser->count("setCurrent") < 21, "ramp did not run to the end");
    ASSERT_TRUE(!rig.laser->outputEnabled() && rig.laser->current() == 0.0, "laser is off");
}

static void testStopIsIdempotent() {
    EngineRig rig;
    auto p = makeProtocol({powerLine(1, 1.0, 5.0)});

    auto run = rig.executeAsync(p);
    ASSERT_TRUE(rig.waitForState(ExecutionState::Running), "run starts");
    std::this_thread::sleep_for(100ms);

    rig.engine->stop();
    rig.engine->stop();
    rig.interlock->setEnablePermitted(false, "door opened");
    const auto result = run.get();
    rig.engine->stop();
    rig.flush();

    ASSERT_EQ(result.message, std::string("Execution stopped by user"), "first stop wins");
    ASSERT_EQ(rig.laser->count("setOutput"), std::size_t(1), "one output-off command");
    const auto currents = rig.laser->commands("setCurrent");
    ASSERT_EQ(currents.size(), std::size_t(2), "line power plus one zero");
    if (currents.size() == 2) {
        ASSERT_EQ(currents[1].value, 0.0, "shutdown zeroes current");
    }
    const auto summary = rig.engine->lastSummary();
    ASSERT_TRUE(summary.stopReason && *summary.stopReason == engine::StopReason::User,
                "user stop recorded");

    std::size_t stoppedTransitions = 0;
    for (auto state : rig.states()) {
        if (state == ExecutionState::Stopped) ++stoppedTransitions;
    }
    ASSERT_EQ(stoppedTransitions, std::size_t(1), "one transition to Stopped");
}

static void testStopWhilePaused() {
    EngineRig rig;
    auto p = makeProtocol({dwellLine(1, 5.0)});

    auto run = rig.executeAsync(p);
    ASSERT_TRUE(rig.waitForState(ExecutionState::Running), "run starts");
    rig.engine->pause();
    ASSERT_TRUE(rig.waitForState(ExecutionState::Paused), "paused");

    const auto stoppedAt = exec::Clock::now();
    rig.engine->stop();
    const auto result = run.get();
    ASSERT_TRUE(secondsSince(stoppedAt) < 0.2, "stop wakes a paused run");
    ASSERT_EQ(result.message, std::string("Execution stopped by user"), "stop message");
    ASSERT_TRUE(rig.engine->state() == ExecutionState::Stopped, "state stopped");
}

static void testInterlockLossWhilePaused() {
    EngineRig rig;
    auto p = makeProtocol({powerLine(1, 0.5, 5.0)});

    auto run = rig.executeAsync(p);
    ASSERT_TRUE(rig.waitForState(ExecutionState::Running), "run starts");
    rig.engine->pause();
    ASSERT_TRUE(rig.waitForState(ExecutionState::Paused), "paused");

    rig.interlock->setEnablePermitted(false, "door opened");
    const auto result = run.get();
    ASSERT_EQ(result.message, std::string("Execution stopped by safety interlock"),
              "paused run is still preempted");
    ASSERT_TRUE(!rig.laser->outputEnabled() && rig.laser->current() == 0.0, "laser is off");
}

static void testSignalsIgnoredWhenIdle() {
    EngineRig rig;
    rig.interlock->setEnablePermitted(false, "door opened");
    rig.flush();
    ASSERT_TRUE(rig.engine->state() == ExecutionState::Idle, "idle engine ignores interlock loss");
    rig.interlock->setEnablePermitted(true, "door closed");
    rig.flush();
    ASSERT_TRUE(rig.engine->state() == ExecutionState::Idle, "true transition ignored");
    ASSERT_TRUE(rig.laser->commands().empty(), "no laser command");
}

static void testSignalsIgnoredWhenTerminal() {
    EngineRig rig;
    ASSERT_TRUE(rig.engine->execute(makeProtocol({dwellLine(1, 0.02)})).success, "run completes");
    rig.interlock->setEnablePermitted(false, "door opened");
    rig.flush();
    ASSERT_TRUE(rig.engine->state() == ExecutionState::Completed, "completed stays completed");
    ASSERT_TRUE(rig.laser->commands().empty(), "no shutdown after completion");
}

static void testStopFromIdle() {
    EngineRig rig;
    rig.engine->stop();
    rig.flush();
    ASSERT_TRUE(rig.engine->state() == ExecutionState::Stopped, "idle -> stopped");
    ASSERT_EQ(rig.laser->count("setOutput"), std::size_t(1), "shutdown performed");
    ASSERT_EQ(rig.laser->count("setCurrent"), std::size_t(1), "current zeroed");
    rig.engine->stop();
    rig.flush();
    ASSERT_EQ(rig.laser->commands().size(), std::size_t(2), "second stop is a no-op");
}

static void testShutdownFailureIsNotRetried() {
    EngineRig rig;
    rig.laser->failCommand("setOutput");
    rig.engine->stop();
    rig.flush();
    ASSERT_EQ(rig.laser->count("setOutput"), std::size_t(1), "one attempt only");
    ASSERT_EQ(rig.laser->count("setCurrent"), std::size_t(1), "current still zeroed");
    ASSERT_TRUE(rig.engine->state() == ExecutionState::Stopped, "still stopped");
}

static void testSubscriptionLifetime() {
    auto interlock = std::make_shared<safety::InterlockSignal>(true);
    {
        exec::ExecService service;
        engine::ExecutionEngine engine(std::make_shared<devices::SimulatedActuator>(),
                                       std::make_shared<devices::SimulatedLaser>(), interlock,
                                       fastConfig(), {}, service.io());
        ASSERT_EQ(interlock->subscriberCount(), std::size_t(1), "single subscription");
    }
    ASSERT_EQ(interlock->subscriberCount(), std::size_t(0), "released with the engine");
}

static void testInterlockSignalNotifiesTransitionsOnly() {
    safety::InterlockSignal signal(true);
    std::vector<bool> seen;
    auto subscription = signal.subscribe([&seen](bool enabled) { seen.push_back(enabled); });

    signal.setEnablePermitted(true);
    signal.setEnablePermitted(false, "door opened");
    signal.setEnablePermitted(false, "still open");
    signal.setEnablePermitted(true);
    ASSERT_TRUE((seen == std::vector<bool>{false, true}), "only transitions are delivered");
    ASSERT_EQ(signal.statusText(), std::string("Laser enable permitted"), "status text");

    subscription.reset();
    signal.setEnablePermitted(false);
    ASSERT_EQ(seen.size(), std::size_t(2), "no delivery after unsubscribe");
    ASSERT_EQ(signal.statusText(), std::string("Laser enable not permitted"), "status follows state");
}

static void testScheduledDropStopsRun() {
    EngineRig rig;
    devices::InterlockDropTimer drop(*rig.service.io(), rig.interlock);
    drop.schedule(300ms, "door opened");

    const auto start = exec::Clock::now();
    const auto result = rig.engine->execute(makeProtocol({powerLine(1, 0.5, 5.0)}));
    ASSERT_TRUE(drop.fired(), "drop fired during the run");
    ASSERT_EQ(result.message, std::string("Execution stopped by safety interlock"), "stop message");
    ASSERT_TRUE(secondsSince(start) < 1.0, "run ends shortly after the drop");
    ASSERT_TRUE(!rig.interlock->isEnablePermitted(), "interlock left open");
}

static void testPendingDropDoesNotOutliveRun() {
    EngineRig rig;
    devices::InterlockDropTimer drop(*rig.service.io(), rig.interlock);
    drop.schedule(600s, "door opened");

    const auto result = rig.engine->execute(makeProtocol({dwellLine(1, 0.05)}));
    ASSERT_TRUE(result.success, "run finishes before the drop");

    const auto cancelledAt = exec::Clock::now();
    drop.cancel();
    ASSERT_TRUE(secondsSince(cancelledAt) < 0.5, "cancel returns without waiting out the delay");
    ASSERT_TRUE(!drop.fired(), "drop never fired");
    ASSERT_TRUE(rig.interlock->isEnablePermitted(), "interlock still closed");
    drop.cancel();
}

int main() {
    testPreflightRefusesRun();
    testNoSafetySourceSkipsPreflight();
    testInterlockPreemptsLongDwell();
    testInterlockCutsRampShort();
    testStopIsIdempotent();
    testStopWhilePaused();
    testInterlockLossWhilePaused();
    testSignalsIgnoredWhenIdle();
    testSignalsIgnoredWhenTerminal();
    testStopFromIdle();
    testShutdownFailureIsNotRetried();
    testSubscriptionLifetime();
    testInterlockSignalNotifiesTransitionsOnly();
    testScheduledDropStopsRun();
    testPendingDropDoesNotOutliveRun();

    if (g_failures) {
        photon::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    photon::logInfo("Safety interlock tests passed.\n");
    return 0;
}
