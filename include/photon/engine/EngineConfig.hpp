#pragma once

#include "photon/engine/EngineDefaults.hpp"

#include <chrono>

namespace photon::engine {

/**
 * @brief Tunables injected into ExecutionEngine at construction.
 */
struct EngineConfig {
    /// Total attempts per hardware command (first try included).
    int maxAttempts = config::ENGINE_MAX_ATTEMPTS;
    std::chrono::milliseconds retryDelay = config::ENGINE_RETRY_DELAY;

    /// Budget for one execution of one line; paused time is not billed.
    std::chrono::milliseconds lineTimeout = config::ENGINE_LINE_TIMEOUT;

    double rampUpdateRateHz = config::ENGINE_RAMP_UPDATE_HZ;
    std::chrono::milliseconds waitTick = config::ENGINE_WAIT_TICK;
    std::chrono::milliseconds laserSettleDelay = config::ENGINE_LASER_SETTLE;

    double milliampsPerWatt = config::ENGINE_MILLIAMPS_PER_WATT;
};

} // namespace photon::engine
