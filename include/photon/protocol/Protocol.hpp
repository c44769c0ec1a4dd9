#pragma once

#include "photon/core/Expected.hpp"
#include "photon/protocol/ProtocolLine.hpp"
#include "photon/protocol/SafetyLimits.hpp"

#include <optional>
#include <string>
#include <vector>

namespace photon::protocol {

/**
 * @brief One validation finding. Protocol-level findings carry no line number.
 */
struct ValidationError {
    std::optional<int> lineNumber;
    std::string message;

    /// "Line 3: Movement: Position 25mm above maximum 20mm"
    std::string describe() const;
};

using ValidationResult = expected<void, std::vector<ValidationError>>;

/**
 * @brief A complete treatment: ordered lines, a loop count and the limits they
 * are validated against.
 *
 * Built by the caller, validated, then handed to the engine by reference for
 * one execute() call. The engine never mutates it.
 */
struct Protocol {
    std::string name;
    std::string version = "1.0";
    std::vector<ProtocolLine> lines;
    int loopCount = 1;
    SafetyLimits safetyLimits{};

    std::string description;
    std::string author;
    std::optional<std::string> createdDate;   ///< ISO-8601, as authored

    /// Validate against the protocol's own safety limits.
    ValidationResult validate() const;

    /**
     * @brief Validate against @p limits.
     *
     * Pure and total. Reports every offending line (each at most once), an
     * empty name, an empty line list and a loop count below one. Relative
     * moves are checked along the running position estimate, which starts at
     * zero and is carried through repeats and loop iterations.
     */
    ValidationResult validate(const SafetyLimits& limits) const;

    /// Σ over loops of Σ over lines of (line duration × repeat count), position carried.
    double totalDurationSeconds() const;

    /// Σ (line energy × repeat count) × loop count, in joules.
    double totalEnergyJoules() const;
};

bool operator==(const Protocol& a, const Protocol& b);

inline bool operator!=(const Protocol& a, const Protocol& b) {
    return !(a == b);
}

} // namespace photon::protocol
