#pragma once

#include <chrono>

namespace photon::engine::config {

/**
 * @brief Reference values for the engine's timing and retry behaviour.
 *
 * EngineConfig is default-initialised from these; deployments override them
 * through config::ConfigLoader rather than editing this file.
 */

// Retries -----------------------------------------------------------------------
constexpr int ENGINE_MAX_ATTEMPTS = 3;                        // per hardware command
constexpr std::chrono::milliseconds ENGINE_RETRY_DELAY{1000};

// Timing ------------------------------------------------------------------------
constexpr std::chrono::milliseconds ENGINE_LINE_TIMEOUT{120000};
constexpr double ENGINE_RAMP_UPDATE_HZ = 10.0;
constexpr std::chrono::milliseconds ENGINE_WAIT_TICK{100};    // dwell and travel polling
constexpr std::chrono::milliseconds ENGINE_LASER_SETTLE{100}; // after a SetPower command

// Laser calibration -------------------------------------------------------------
constexpr double ENGINE_MILLIAMPS_PER_WATT = 1000.0;          // placeholder until calibrated

} // namespace photon::engine::config
