#pragma once

#include <variant>

namespace photon::protocol {

// Movement ---------------------------------------------------------------------

/// Move to an absolute actuator position.
struct AbsoluteMove {
    double targetMm = 0.0;
    double speedMmPerS = 1.0;
};

/// Move by a signed offset from the current position estimate.
struct RelativeMove {
    double deltaMm = 0.0;
    double speedMmPerS = 1.0;
};

/// Return to position zero.
struct HomeMove {
    double speedMmPerS = 2.0;
};

using MoveAction = std::variant<AbsoluteMove, RelativeMove, HomeMove>;

// Laser ------------------------------------------------------------------------

/// Hold a fixed output power.
struct SetPower {
    double watts = 0.0;
};

/// Interpolate output power linearly over an explicit duration.
struct PowerRamp {
    double startWatts = 0.0;
    double endWatts = 0.0;
    double durationS = 1.0;
};

using LaserAction = std::variant<SetPower, PowerRamp>;

// Dwell ------------------------------------------------------------------------

/// Pure wait; no hardware command.
struct Dwell {
    double durationS = 1.0;
};

inline bool operator==(const AbsoluteMove& a, const AbsoluteMove& b) {
    return a.targetMm == b.targetMm && a.speedMmPerS == b.speedMmPerS;
}
inline bool operator==(const RelativeMove& a, const RelativeMove& b) {
    return a.deltaMm == b.deltaMm && a.speedMmPerS == b.speedMmPerS;
}
inline bool operator==(const HomeMove& a, const HomeMove& b) {
    return a.speedMmPerS == b.speedMmPerS;
}
inline bool operator==(const SetPower& a, const SetPower& b) {
    return a.watts == b.watts;
}
inline bool operator==(const PowerRamp& a, const PowerRamp& b) {
    return a.startWatts == b.startWatts && a.endWatts == b.endWatts &&
           a.durationS == b.durationS;
}
inline bool operator==(const Dwell& a, const Dwell& b) {
    return a.durationS == b.durationS;
}

/// Commanded speed of any movement kind.
double speedOf(const MoveAction& move);

/// Absolute target of @p move when started from @p currentMm.
double targetOf(const MoveAction& move, double currentMm);

/// Travel time estimate; Home is billed for the full distance back to zero.
double travelSeconds(const MoveAction& move, double currentMm);

/// Ramp duration, or 0 for SetPower (which takes effect immediately).
double laserSeconds(const LaserAction& laser);

} // namespace photon::protocol
