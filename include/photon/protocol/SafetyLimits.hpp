#pragma once

namespace photon::protocol {

/**
 * @brief Bounds every line of a protocol is validated against.
 *
 * Defaults are the bench values of the reference instrument; deployments load
 * their own through config::ConfigLoader.
 */
struct SafetyLimits {
    double maxPowerW = 10.0;
    double maxDurationS = 300.0;
    double minPositionMm = -20.0;
    double maxPositionMm = 20.0;
    double maxSpeedMmPerS = 5.0;
};

inline bool operator==(const SafetyLimits& a, const SafetyLimits& b) {
    return a.maxPowerW == b.maxPowerW && a.maxDurationS == b.maxDurationS &&
           a.minPositionMm == b.minPositionMm && a.maxPositionMm == b.maxPositionMm &&
           a.maxSpeedMmPerS == b.maxSpeedMmPerS;
}

inline bool operator!=(const SafetyLimits& a, const SafetyLimits& b) {
    return !(a == b);
}

} // namespace photon::protocol
