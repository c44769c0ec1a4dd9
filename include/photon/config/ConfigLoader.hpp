#pragma once

#include "photon/core/Expected.hpp"
#include "photon/engine/EngineConfig.hpp"
#include "photon/protocol/SafetyLimits.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace photon::config {

/**
 * @brief Site configuration: engine tunables plus the instrument's safety
 * envelope, which every protocol must also satisfy.
 */
struct RuntimeConfig {
    engine::EngineConfig engine{};
    protocol::SafetyLimits safetyLimits{};
};

/**
 * @brief Reads a RuntimeConfig from a JSON file.
 *
 *   {"engine": {"max_attempts": 3, "retry_delay_ms": 1000, "line_timeout_s": 120,
 *               "ramp_update_rate_hz": 10, "wait_tick_ms": 100,
 *               "laser_settle_ms": 100, "milliamps_per_watt": 1000},
 *    "safety_limits": {...same keys as in a protocol document...}}
 *
 * Every key is optional; unknown keys are ignored. Wrong types and
 * out-of-range values fail with ConfigInvalid. The file is re-read on every
 * call to `load()`.
 */
class ConfigLoader {
public:
    explicit ConfigLoader(std::string configPath);

    expected<RuntimeConfig> load() const;

    /// Decode an already parsed document.
    static expected<RuntimeConfig> fromJson(const nlohmann::json& document);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

nlohmann::json toJson(const engine::EngineConfig& config);

} // namespace photon::config
