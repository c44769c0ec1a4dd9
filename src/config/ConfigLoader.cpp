#include "photon/config/ConfigLoader.hpp"
#include "photon/log/Log.hpp"
#include "photon/protocol/ProtocolWire.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace photon::config {

using nlohmann::json;
using core::Error;
using core::ErrorCode;

namespace {

Error configError(std::string message) {
    return Error{ErrorCode::ConfigInvalid, std::move(message)};
}

std::chrono::milliseconds millis(double value) {
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(std::llround(value)));
}

expected<engine::EngineConfig> engineFromJson(const json& node) {
    if (!node.is_object()) {
        return unexpected(configError("'engine' must be an object"));
    }

    engine::EngineConfig config;
    config.maxAttempts = node.value("max_attempts", config.maxAttempts);
    config.retryDelay = millis(node.value("retry_delay_ms", double(config.retryDelay.count())));
    config.lineTimeout =
        millis(1000.0 * node.value("line_timeout_s", config.lineTimeout.count() / 1000.0));
    config.rampUpdateRateHz = node.value("ramp_update_rate_hz", config.rampUpdateRateHz);
    config.waitTick = millis(node.value("wait_tick_ms", double(config.waitTick.count())));
    config.laserSettleDelay =
        millis(node.value("laser_settle_ms", double(config.laserSettleDelay.count())));
    config.milliampsPerWatt = node.value("milliamps_per_watt", config.milliampsPerWatt);

    if (config.maxAttempts < 1) {
        return unexpected(configError("engine.max_attempts must be at least 1"));
    }
    if (config.retryDelay.count() < 0) {
        return unexpected(configError("engine.retry_delay_ms must not be negative"));
    }
    if (config.lineTimeout.count() <= 0) {
        return unexpected(configError("engine.line_timeout_s must be positive"));
    }
    if (!(config.rampUpdateRateHz > 0.0) || !std::isfinite(config.rampUpdateRateHz)) {
        return unexpected(configError("engine.ramp_update_rate_hz must be positive"));
    }
    if (config.waitTick.count() <= 0) {
        return unexpected(configError("engine.wait_tick_ms must be positive"));
    }
    if (config.laserSettleDelay.count() < 0) {
        return unexpected(configError("engine.laser_settle_ms must not be negative"));
    }
    if (!(config.milliampsPerWatt > 0.0) || !std::isfinite(config.milliampsPerWatt)) {
        return unexpected(configError("engine.milliamps_per_watt must be positive"));
    }
    return config;
}

} // namespace

ConfigLoader::ConfigLoader(std::string configPath)
: path_(std::move(configPath))
{}

expected<RuntimeConfig> ConfigLoader::load() const {
    std::ifstream in(path_);
    if (!in) {
        logError("[ConfigLoader] cannot open ", path_, "\n");
        return unexpected(configError("cannot open config file '" + path_ + "'"));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    json document = json::parse(buffer.str(), nullptr, /*allow_exceptions=*/false);
    if (document.is_discarded()) {
        logError("[ConfigLoader] ", path_, " is not valid JSON\n");
        return unexpected(configError("config file '" + path_ + "' is not valid JSON"));
    }

    auto config = fromJson(document);
    if (!config) {
        logError("[ConfigLoader] ", path_, ": ", config.error().message, "\n");
        return config;
    }
    logInfo("[ConfigLoader] loaded ", path_, "\n");
    return config;
}

expected<RuntimeConfig> ConfigLoader::fromJson(const json& document) {
    if (!document.is_object()) {
        return unexpected(configError("config document must be an object"));
    }

    RuntimeConfig config;
    try {
        if (document.contains("engine")) {
            auto engine = engineFromJson(document.at("engine"));
            if (!engine) {
                return unexpected(engine.error());
            }
            config.engine = *engine;
        }
        if (document.contains("safety_limits")) {
            auto limits = protocol::limitsFromJson(document.at("safety_limits"));
            if (!limits) {
                return unexpected(configError(limits.error().message));
            }
            config.safetyLimits = *limits;
            const auto& l = config.safetyLimits;
            if (!(l.minPositionMm < l.maxPositionMm)) {
                return unexpected(configError("safety_limits: minimum position must be below maximum"));
            }
            if (!(l.maxPowerW > 0.0) || !(l.maxDurationS > 0.0) || !(l.maxSpeedMmPerS > 0.0)) {
                return unexpected(configError("safety_limits: power, duration and speed limits must be positive"));
            }
        }
    } catch (const json::exception& e) {
        return unexpected(configError(e.what()));
    }
    return config;
}

json toJson(const engine::EngineConfig& config) {
    return json{
        {"max_attempts", config.maxAttempts},
        {"retry_delay_ms", config.retryDelay.count()},
        {"line_timeout_s", config.lineTimeout.count() / 1000.0},
        {"ramp_update_rate_hz", config.rampUpdateRateHz},
        {"wait_tick_ms", config.waitTick.count()},
        {"laser_settle_ms", config.laserSettleDelay.count()},
        {"milliamps_per_watt", config.milliampsPerWatt},
    };
}

} // namespace photon::config
