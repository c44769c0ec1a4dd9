#include "photon/config/ConfigLoader.hpp"
#include "photon/log/Log.hpp"

#include <cstdio>
#include <fstream>
#include <string>

using namespace photon;
using namespace std::chrono_literals;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { photon::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { photon::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", _va, " != ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static std::string writeTemp(const std::string& name, const std::string& contents) {
    const std::string path = "photon_test_" + name + ".json";
    std::ofstream out(path);
    out << contents;
    return path;
}

static bool isConfigInvalid(const expected<config::RuntimeConfig>& result) {
    return !result && result.error().code == core::ErrorCode::ConfigInvalid;
}

static void testEmptyDocumentGivesDefaults() {
    auto loaded = config::ConfigLoader::fromJson(nlohmann::json::object());
    ASSERT_TRUE(loaded.has_value(), "empty object accepted");
    if (!loaded) return;
    ASSERT_EQ(loaded->engine.maxAttempts, 3, "three attempts");
    ASSERT_EQ(loaded->engine.retryDelay.count(), 1000, "one second backoff");
    ASSERT_EQ(loaded->engine.lineTimeout.count(), 120000, "two minute line budget");
    ASSERT_EQ(loaded->engine.rampUpdateRateHz, 10.0, "10 Hz ramps");
    ASSERT_EQ(loaded->engine.waitTick.count(), 100, "100 ms ticks");
    ASSERT_EQ(loaded->engine.laserSettleDelay.count(), 100, "100 ms settle");
    ASSERT_EQ(loaded->engine.milliampsPerWatt, 1000.0, "1 mA per mW");
    ASSERT_TRUE(loaded->safetyLimits == protocol::SafetyLimits{}, "default limits");
}

static void testLoadFromFile() {
    const auto path = writeTemp("full", R"({
        "engine": {"max_attempts": 5, "retry_delay_ms": 250, "line_timeout_s": 30.5,
                   "ramp_update_rate_hz": 20, "wait_tick_ms": 50, "laser_settle_ms": 0,
                   "milliamps_per_watt": 850, "unknown_key": 1},
        "safety_limits": {"max_power_watts": 4, "max_actuator_position_mm": 15},
        "site": "lab 3"
    })");
    auto loaded = config::ConfigLoader(path).load();
    std::remove(path.c_str());

    ASSERT_TRUE(loaded.has_value(), "file loads");
    if (!loaded) return;
    ASSERT_EQ(loaded->engine.maxAttempts, 5, "attempts");
    ASSERT_EQ(loaded->engine.retryDelay.count(), 250, "retry delay");
    ASSERT_EQ(loaded->engine.lineTimeout.count(), 30500, "fractional seconds kept");
    ASSERT_EQ(loaded->engine.rampUpdateRateHz, 20.0, "ramp rate");
    ASSERT_EQ(loaded->engine.waitTick.count(), 50, "tick");
    ASSERT_EQ(loaded->engine.laserSettleDelay.count(), 0, "settle may be zero");
    ASSERT_EQ(loaded->engine.milliampsPerWatt, 850.0, "calibration");
    ASSERT_EQ(loaded->safetyLimits.maxPowerW, 4.0, "power limit");
    ASSERT_EQ(loaded->safetyLimits.maxPositionMm, 15.0, "position limit");
    ASSERT_EQ(loaded->safetyLimits.minPositionMm, -20.0, "missing limit defaulted");
}

static void testEngineConfigRoundTrip() {
    engine::EngineConfig custom;
    custom.maxAttempts = 2;
    custom.retryDelay = 300ms;
    custom.lineTimeout = 45s;
    auto loaded = config::ConfigLoader::fromJson(nlohmann::json{{"engine", config::toJson(custom)}});
    ASSERT_TRUE(loaded && loaded->engine.maxAttempts == 2 && loaded->engine.retryDelay == 300ms &&
                    loaded->engine.lineTimeout == 45s,
                "toJson output loads back");
}

static void testRejections() {
    ASSERT_TRUE(isConfigInvalid(config::ConfigLoader("does/not/exist.json").load()),
                "missing file");

    const auto broken = writeTemp("broken", "{ \"engine\": ");
    ASSERT_TRUE(isConfigInvalid(config::ConfigLoader(broken).load()), "invalid JSON");
    std::remove(broken.c_str());

    using nlohmann::json;
    ASSERT_TRUE(isConfigInvalid(config::ConfigLoader::fromJson(json::array())), "not an object");
    ASSERT_TRUE(isConfigInvalid(config::ConfigLoader::fromJson(
                    json{{"engine", {{"max_attempts", "three"}}}})),
                "wrong type");
    ASSERT_TRUE(isConfigInvalid(config::ConfigLoader::fromJson(
                    json{{"engine", {{"max_attempts", 0}}}})),
                "zero attempts");
    ASSERT_TRUE(isConfigInvalid(config::ConfigLoader::fromJson(
                    json{{"engine", {{"ramp_update_rate_hz", 0}}}})),
                "zero ramp rate");
    ASSERT_TRUE(isConfigInvalid(config::ConfigLoader::fromJson(
                    json{{"engine", {{"line_timeout_s", -1}}}})),
                "negative timeout");
    ASSERT_TRUE(isConfigInvalid(config::ConfigLoader::fromJson(
                    json{{"safety_limits", {{"min_actuator_position_mm", 30}}}})),
                "inverted position range");
    ASSERT_TRUE(isConfigInvalid(config::ConfigLoader::fromJson(json{{"engine", 5}})),
                "engine must be an object");
}

int main() {
    testEmptyDocumentGivesDefaults();
    testLoadFromFile();
    testEngineConfigRoundTrip();
    testRejections();

    if (g_failures) {
        photon::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    photon::logInfo("ConfigLoader tests passed.\n");
    return 0;
}
