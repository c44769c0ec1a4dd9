#pragma once

#include "photon/protocol/Actions.hpp"
#include "photon/protocol/SafetyLimits.hpp"

#include <optional>
#include <string>
#include <vector>

namespace photon::protocol {

/**
 * @brief One row of a protocol: up to one movement, one laser action and one
 * dwell, executed concurrently, `repeatCount` times in a row.
 *
 * The variants make "absolute xor relative xor home" and "set xor ramp"
 * structural; a line with nothing enabled is legal and takes no time.
 */
struct ProtocolLine {
    int lineNumber = 0;
    std::optional<MoveAction> movement;
    std::optional<LaserAction> laser;
    std::optional<Dwell> dwell;
    int repeatCount = 1;
    std::string notes;

    bool empty() const { return !movement && !laser && !dwell; }

    /**
     * @brief Duration of one execution of the line.
     *
     * The maximum of the enabled sub-actions: travel time from
     * @p currentPositionMm, ramp duration, dwell duration. Zero for an empty line.
     */
    double durationSeconds(double currentPositionMm = 0.0) const;

    /// Laser energy of one execution in joules.
    double energyJoules(double currentPositionMm = 0.0) const;

    /// Position estimate after one execution.
    double positionAfter(double currentPositionMm) const;

    /// Position estimate after all `repeatCount` executions.
    double positionAfterRepeats(double currentPositionMm) const;

    /**
     * @brief Check the line against @p limits.
     *
     * Relative targets are checked for every repetition, starting at
     * @p startPositionMm. Returns one message per offending sub-action,
     * prefixed with its kind ("Movement: ...", "Laser ramp: ...").
     */
    std::vector<std::string> validate(const SafetyLimits& limits,
                                      double startPositionMm = 0.0) const;

    /// e.g. "Line 2: [Move Abs] 5.0mm @ 1.0mm/s | [Laser] Set 0.5W | Duration: 5.0s"
    std::string summary(double currentPositionMm = 0.0) const;
};

bool operator==(const ProtocolLine& a, const ProtocolLine& b);

inline bool operator!=(const ProtocolLine& a, const ProtocolLine& b) {
    return !(a == b);
}

} // namespace photon::protocol
