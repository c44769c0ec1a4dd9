#include "photon/protocol/Protocol.hpp"

namespace photon::protocol {

namespace {

bool anchorsPosition(const std::vector<ProtocolLine>& lines) {
    for (const auto& line : lines) {
        if (line.movement && !std::holds_alternative<RelativeMove>(*line.movement)) {
            return true;
        }
    }
    return false;
}

/// Duration of one pass over @p lines; advances @p position.
double loopDurationSeconds(const std::vector<ProtocolLine>& lines, double& position) {
    double total = 0.0;
    for (const auto& line : lines) {
        total += line.durationSeconds(position) * line.repeatCount;
        position = line.positionAfterRepeats(position);
    }
    return total;
}

} // namespace

std::string ValidationError::describe() const {
    if (lineNumber) {
        return "Line " + std::to_string(*lineNumber) + ": " + message;
    }
    return message;
}

ValidationResult Protocol::validate() const {
    return validate(safetyLimits);
}

ValidationResult Protocol::validate(const SafetyLimits& limits) const {
    std::vector<ValidationError> errors;

    if (name.empty()) {
        errors.push_back({std::nullopt, "Protocol name is required"});
    }
    if (lines.empty()) {
        errors.push_back({std::nullopt, "Protocol must contain at least one line"});
    }
    if (loopCount < 1) {
        errors.push_back({std::nullopt, "Loop count must be at least 1"});
    }

    std::vector<bool> reported(lines.size(), false);
    auto report = [&](std::size_t i, double start) {
        if (reported[i]) {
            return;
        }
        auto lineErrors = lines[i].validate(limits, start);
        if (lineErrors.empty()) {
            return;
        }
        reported[i] = true;
        for (auto& message : lineErrors) {
            errors.push_back({lines[i].lineNumber, std::move(message)});
        }
    };

    // First loop from home, remembering where each line starts.
    std::vector<double> starts(lines.size(), 0.0);
    double position = 0.0;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        starts[i] = position;
        report(i, position);
        position = lines[i].positionAfterRepeats(position);
    }

    // Later loops either repeat the second one exactly (an absolute or home
    // move pins the position) or shift every line start by the same drift.
    if (loopCount > 1 && anchorsPosition(lines)) {
        for (std::size_t i = 0; i < lines.size(); ++i) {
            report(i, position);
            position = lines[i].positionAfterRepeats(position);
        }
    } else if (loopCount > 1 && position != 0.0) {
        const double drift = position;
        for (std::size_t i = 0; i < lines.size(); ++i) {
            auto startOf = [&](int loop) { return starts[i] + drift * (loop - 1); };
            if (reported[i] || lines[i].validate(limits, startOf(loopCount)).empty()) {
                continue;
            }
            // Valid loops form a prefix; bisect for the first invalid one.
            int inside = 1;
            int outside = loopCount;
            while (outside - inside > 1) {
                const int mid = inside + (outside - inside) / 2;
                if (lines[i].validate(limits, startOf(mid)).empty()) {
                    inside = mid;
                } else {
                    outside = mid;
                }
            }
            report(i, startOf(outside));
        }
    }

    if (!errors.empty()) {
        return unexpected(std::move(errors));
    }
    return {};
}

double Protocol::totalDurationSeconds() const {
    if (loopCount < 1) {
        return 0.0;
    }
    // Relative travel time does not depend on where it starts, so every loop
    // after the first costs the same as the second.
    double position = 0.0;   // protocols start at home
    const double first = loopDurationSeconds(lines, position);
    if (loopCount == 1) {
        return first;
    }
    return first + loopDurationSeconds(lines, position) * (loopCount - 1);
}

double Protocol::totalEnergyJoules() const {
    double perLoop = 0.0;
    double position = 0.0;
    for (const auto& line : lines) {
        perLoop += line.energyJoules(position) * line.repeatCount;
        position = line.positionAfterRepeats(position);
    }
    return perLoop * loopCount;
}

bool operator==(const Protocol& a, const Protocol& b) {
    return a.name == b.name && a.version == b.version && a.lines == b.lines &&
           a.loopCount == b.loopCount && a.safetyLimits == b.safetyLimits &&
           a.description == b.description && a.author == b.author &&
           a.createdDate == b.createdDate;
}

} // namespace photon::protocol
