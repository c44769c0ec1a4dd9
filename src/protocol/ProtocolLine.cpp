#include "photon/protocol/ProtocolLine.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace photon::protocol {

namespace {

// Overload set for std::visit.
template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

std::string fixed1(double value) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << value;
    return os.str();
}

std::string fmtNumber(double value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

std::optional<std::string> checkSpeed(double speed, double maxSpeed, const char* what) {
    if (!(speed > 0.0)) {
        return std::string(what) + " must be positive";
    }
    if (speed > maxSpeed) {
        return std::string(what) + " " + fmtNumber(speed) + "mm/s exceeds limit " +
               fmtNumber(maxSpeed) + "mm/s";
    }
    return std::nullopt;
}

std::optional<std::string> checkPosition(double position, const SafetyLimits& limits) {
    if (!std::isfinite(position)) {
        return std::string("Position must be a finite number");
    }
    if (position < limits.minPositionMm) {
        return "Position " + fmtNumber(position) + "mm below minimum " +
               fmtNumber(limits.minPositionMm) + "mm";
    }
    if (position > limits.maxPositionMm) {
        return "Position " + fmtNumber(position) + "mm above maximum " +
               fmtNumber(limits.maxPositionMm) + "mm";
    }
    return std::nullopt;
}

std::optional<std::string> checkPower(double watts, double maxPower) {
    if (!std::isfinite(watts)) {
        return std::string("Laser power must be a finite number");
    }
    if (watts < 0.0) {
        return std::string("Laser power cannot be negative");
    }
    if (watts > maxPower) {
        return "Laser power " + fmtNumber(watts) + "W exceeds limit " + fmtNumber(maxPower) + "W";
    }
    return std::nullopt;
}

std::optional<std::string> checkDuration(double seconds, double maxDuration, const char* what) {
    if (!(seconds > 0.0)) {
        return std::string(what) + " duration must be positive";
    }
    if (seconds > maxDuration) {
        return std::string(what) + " duration " + fmtNumber(seconds) + "s exceeds limit " +
               fmtNumber(maxDuration) + "s";
    }
    return std::nullopt;
}

std::optional<std::string> checkMovement(const MoveAction& move, const SafetyLimits& limits,
                                         double startPositionMm, int repeatCount) {
    return std::visit(Overloaded{
        [&](const AbsoluteMove& m) -> std::optional<std::string> {
            if (auto bad = checkPosition(m.targetMm, limits)) return bad;
            return checkSpeed(m.speedMmPerS, limits.maxSpeedMmPerS, "Speed");
        },
        [&](const RelativeMove& m) -> std::optional<std::string> {
            // Repetition i ends at start + i * delta. The in-bounds repetitions
            // form a prefix, so the first one out of bounds is found by bisection.
            auto after = [&](int i) { return startPositionMm + m.deltaMm * i; };
            const int repeats = std::max(repeatCount, 1);
            if (checkPosition(after(repeats), limits) || checkPosition(after(1), limits)) {
                int inside = 0;
                int outside = repeats;
                if (checkPosition(after(1), limits)) {
                    outside = 1;
                }
                while (outside - inside > 1) {
                    const int mid = inside + (outside - inside) / 2;
                    if (checkPosition(after(mid), limits)) {
                        outside = mid;
                    } else {
                        inside = mid;
                    }
                }
                return "Relative move of " + fmtNumber(m.deltaMm) + "mm reaches " +
                       *checkPosition(after(outside), limits);
            }
            return checkSpeed(m.speedMmPerS, limits.maxSpeedMmPerS, "Speed");
        },
        [&](const HomeMove& m) -> std::optional<std::string> {
            return checkSpeed(m.speedMmPerS, limits.maxSpeedMmPerS, "Homing speed");
        }
    }, move);
}

} // namespace

double speedOf(const MoveAction& move) {
    return std::visit([](const auto& m) { return m.speedMmPerS; }, move);
}

double targetOf(const MoveAction& move, double currentMm) {
    return std::visit(Overloaded{
        [](const AbsoluteMove& m) { return m.targetMm; },
        [&](const RelativeMove& m) { return currentMm + m.deltaMm; },
        [](const HomeMove&) { return 0.0; }
    }, move);
}

double travelSeconds(const MoveAction& move, double currentMm) {
    const double speed = speedOf(move);
    if (!(speed > 0.0)) {
        return 0.0;
    }
    return std::fabs(targetOf(move, currentMm) - currentMm) / speed;
}

double laserSeconds(const LaserAction& laser) {
    if (const auto* ramp = std::get_if<PowerRamp>(&laser)) {
        return ramp->durationS;
    }
    return 0.0;
}

double ProtocolLine::durationSeconds(double currentPositionMm) const {
    double duration = 0.0;
    if (movement) {
        duration = std::max(duration, travelSeconds(*movement, currentPositionMm));
    }
    if (laser) {
        duration = std::max(duration, laserSeconds(*laser));
    }
    if (dwell) {
        duration = std::max(duration, dwell->durationS);
    }
    return duration;
}

double ProtocolLine::energyJoules(double currentPositionMm) const {
    if (!laser) {
        return 0.0;
    }
    return std::visit(Overloaded{
        [&](const SetPower& s) { return s.watts * durationSeconds(currentPositionMm); },
        [](const PowerRamp& r) { return 0.5 * (r.startWatts + r.endWatts) * r.durationS; }
    }, *laser);
}

double ProtocolLine::positionAfter(double currentPositionMm) const {
    return movement ? targetOf(*movement, currentPositionMm) : currentPositionMm;
}

double ProtocolLine::positionAfterRepeats(double currentPositionMm) const {
    if (movement) {
        if (auto relative = std::get_if<RelativeMove>(&*movement)) {
            return currentPositionMm + relative->deltaMm * std::max(repeatCount, 1);
        }
    }
    return positionAfter(currentPositionMm);
}

std::vector<std::string> ProtocolLine::validate(const SafetyLimits& limits,
                                                double startPositionMm) const {
    std::vector<std::string> errors;

    if (repeatCount < 1) {
        errors.push_back("Repeat count must be at least 1");
    }

    if (movement) {
        if (auto bad = checkMovement(*movement, limits, startPositionMm, repeatCount)) {
            const bool homing = std::holds_alternative<HomeMove>(*movement);
            errors.push_back(std::string(homing ? "Homing: " : "Movement: ") + *bad);
        }
    }

    if (laser) {
        std::visit(Overloaded{
            [&](const SetPower& s) {
                if (auto bad = checkPower(s.watts, limits.maxPowerW)) {
                    errors.push_back("Laser: " + *bad);
                }
            },
            [&](const PowerRamp& r) {
                auto bad = checkPower(r.startWatts, limits.maxPowerW);
                if (!bad) bad = checkPower(r.endWatts, limits.maxPowerW);
                if (!bad) bad = checkDuration(r.durationS, limits.maxDurationS, "Ramp");
                if (bad) {
                    errors.push_back("Laser ramp: " + *bad);
                }
            }
        }, *laser);
    }

    if (dwell) {
        if (auto bad = checkDuration(dwell->durationS, limits.maxDurationS, "Dwell")) {
            errors.push_back("Dwell: " + *bad);
        }
    }

    return errors;
}

std::string ProtocolLine::summary(double currentPositionMm) const {
    std::vector<std::string> parts;
    parts.push_back("Line " + std::to_string(lineNumber) + ":");

    if (movement) {
        parts.push_back(std::visit(Overloaded{
            [](const AbsoluteMove& m) {
                return "[Move Abs] " + fixed1(m.targetMm) + "mm @ " + fixed1(m.speedMmPerS) + "mm/s";
            },
            [](const RelativeMove& m) {
                return "[Move Rel] " + fixed1(m.deltaMm) + "mm @ " + fixed1(m.speedMmPerS) + "mm/s";
            },
            [](const HomeMove& m) {
                return "[Home] @ " + fixed1(m.speedMmPerS) + "mm/s";
            }
        }, *movement));
    }

    if (laser) {
        parts.push_back(std::visit(Overloaded{
            [](const SetPower& s) { return "[Laser] Set " + fixed1(s.watts) + "W"; },
            [](const PowerRamp& r) {
                return "[Laser] Ramp " + fixed1(r.startWatts) + "W -> " + fixed1(r.endWatts) +
                       "W over " + fixed1(r.durationS) + "s";
            }
        }, *laser));
    }

    if (dwell) {
        parts.push_back("[Dwell] " + fixed1(dwell->durationS) + "s");
    }

    if (repeatCount > 1) {
        parts.push_back("x" + std::to_string(repeatCount));
    }

    parts.push_back("Duration: " + fixed1(durationSeconds(currentPositionMm)) + "s");

    std::string out = parts.front();
    for (std::size_t i = 1; i < parts.size(); ++i) {
        out += (i == 1 ? " " : " | ") + parts[i];
    }
    return out;
}

bool operator==(const ProtocolLine& a, const ProtocolLine& b) {
    return a.lineNumber == b.lineNumber && a.movement == b.movement && a.laser == b.laser &&
           a.dwell == b.dwell && a.repeatCount == b.repeatCount && a.notes == b.notes;
}

} // namespace photon::protocol
