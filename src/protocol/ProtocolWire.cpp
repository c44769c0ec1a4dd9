#include "photon/protocol/ProtocolWire.hpp"
#include "photon/log/Log.hpp"

#include <type_traits>

namespace photon::protocol {

using nlohmann::json;
using core::Error;
using core::ErrorCode;

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

constexpr const char* kMoveTypeAbsolute = "absolute";
constexpr const char* kMoveTypeRelative = "relative";

Error wireError(std::string message) {
    return Error{ErrorCode::WireFormatInvalid, std::move(message)};
}

json tagged(const char* type, json params) {
    return json{{"type", type}, {"params", std::move(params)}};
}

json moveToJson(const MoveAction& move) {
    return std::visit(Overloaded{
        [](const AbsoluteMove& m) {
            return tagged("move", {{"target_position_mm", m.targetMm},
                                   {"speed_mm_per_s", m.speedMmPerS},
                                   {"move_type", kMoveTypeAbsolute}});
        },
        [](const RelativeMove& m) {
            return tagged("move", {{"target_position_mm", m.deltaMm},
                                   {"speed_mm_per_s", m.speedMmPerS},
                                   {"move_type", kMoveTypeRelative}});
        },
        [](const HomeMove& m) {
            return tagged("home", {{"speed_mm_per_s", m.speedMmPerS}});
        }
    }, move);
}

json laserToJson(const LaserAction& laser) {
    return std::visit(Overloaded{
        [](const SetPower& s) {
            return tagged("set", {{"power_watts", s.watts}});
        },
        [](const PowerRamp& r) {
            return tagged("ramp", {{"start_power_watts", r.startWatts},
                                   {"end_power_watts", r.endWatts},
                                   {"duration_s", r.durationS}});
        }
    }, laser);
}

// {"type": ..., "params": {...}} -> (type, params).
expected<std::pair<std::string, json>> untag(const json& node, const char* field) {
    if (!node.is_object()) {
        return unexpected(wireError(std::string("'") + field + "' must be an object"));
    }
    return std::make_pair(node.at("type").get<std::string>(),
                          node.value("params", json::object()));
}

expected<MoveAction> moveFromJson(const json& node) {
    auto tag = untag(node, "movement");
    if (!tag) {
        return unexpected(tag.error());
    }
    const auto& [type, params] = *tag;
    if (type == "move") {
        const auto moveType = params.value("move_type", std::string(kMoveTypeAbsolute));
        const double target = params.at("target_position_mm").get<double>();
        const double speed = params.at("speed_mm_per_s").get<double>();
        if (moveType == kMoveTypeAbsolute) {
            return MoveAction{AbsoluteMove{target, speed}};
        }
        if (moveType == kMoveTypeRelative) {
            return MoveAction{RelativeMove{target, speed}};
        }
        return unexpected(wireError("unknown move_type '" + moveType + "'"));
    }
    if (type == "home") {
        return MoveAction{HomeMove{params.value("speed_mm_per_s", HomeMove{}.speedMmPerS)}};
    }
    return unexpected(wireError("unknown movement type '" + type + "'"));
}

expected<LaserAction> laserFromJson(const json& node) {
    auto tag = untag(node, "laser");
    if (!tag) {
        return unexpected(tag.error());
    }
    const auto& [type, params] = *tag;
    if (type == "set") {
        return LaserAction{SetPower{params.at("power_watts").get<double>()}};
    }
    if (type == "ramp") {
        return LaserAction{PowerRamp{params.at("start_power_watts").get<double>(),
                                     params.at("end_power_watts").get<double>(),
                                     params.at("duration_s").get<double>()}};
    }
    return unexpected(wireError("unknown laser type '" + type + "'"));
}

// Accepts the tagged form and the bare {"duration_s": x} form of older documents.
Dwell dwellFromJson(const json& node) {
    if (node.contains("params")) {
        return Dwell{node.at("params").at("duration_s").get<double>()};
    }
    return Dwell{node.at("duration_s").get<double>()};
}

bool present(const json& node, const char* key) {
    return node.contains(key) && !node.at(key).is_null();
}

} // namespace

json toJson(const SafetyLimits& limits) {
    return json{
        {"max_power_watts", limits.maxPowerW},
        {"max_duration_seconds", limits.maxDurationS},
        {"min_actuator_position_mm", limits.minPositionMm},
        {"max_actuator_position_mm", limits.maxPositionMm},
        {"max_actuator_speed_mm_per_s", limits.maxSpeedMmPerS},
    };
}

json toJson(const ProtocolLine& line) {
    json out{
        {"line_number", line.lineNumber},
        {"repeat_count", line.repeatCount},
        {"notes", line.notes},
    };
    if (line.movement) {
        out["movement"] = moveToJson(*line.movement);
    }
    if (line.laser) {
        out["laser"] = laserToJson(*line.laser);
    }
    if (line.dwell) {
        out["dwell"] = tagged("dwell", {{"duration_s", line.dwell->durationS}});
    }
    return out;
}

json toJson(const Protocol& protocol) {
    json lines = json::array();
    for (const auto& line : protocol.lines) {
        lines.push_back(toJson(line));
    }

    json out{
        {"protocol_name", protocol.name},
        {"version", protocol.version},
        {"description", protocol.description},
        {"author", protocol.author},
        {"loop_count", protocol.loopCount},
        {"safety_limits", toJson(protocol.safetyLimits)},
        {"lines", std::move(lines)},
    };
    if (protocol.createdDate) {
        out["created_date"] = *protocol.createdDate;
    }
    return out;
}

expected<SafetyLimits> limitsFromJson(const json& document) {
    try {
        if (!document.is_object()) {
            return unexpected(wireError("'safety_limits' must be an object"));
        }
        const SafetyLimits defaults{};
        SafetyLimits limits;
        limits.maxPowerW = document.value("max_power_watts", defaults.maxPowerW);
        limits.maxDurationS = document.value("max_duration_seconds", defaults.maxDurationS);
        limits.minPositionMm = document.value("min_actuator_position_mm", defaults.minPositionMm);
        limits.maxPositionMm = document.value("max_actuator_position_mm", defaults.maxPositionMm);
        limits.maxSpeedMmPerS =
            document.value("max_actuator_speed_mm_per_s", defaults.maxSpeedMmPerS);
        return limits;
    } catch (const json::exception& e) {
        return unexpected(wireError(std::string("safety_limits: ") + e.what()));
    }
}

expected<ProtocolLine> lineFromJson(const json& document) {
    try {
        if (!document.is_object()) {
            return unexpected(wireError("line entries must be objects"));
        }

        ProtocolLine line;
        line.lineNumber = document.at("line_number").get<int>();
        line.repeatCount = document.value("repeat_count", 1);
        line.notes = document.value("notes", std::string{});

        const std::string where = "line " + std::to_string(line.lineNumber) + ": ";

        if (present(document, "movement")) {
            auto move = moveFromJson(document.at("movement"));
            if (!move) {
                return unexpected(wireError(where + move.error().message));
            }
            line.movement = std::move(*move);
        }
        if (present(document, "laser")) {
            auto laser = laserFromJson(document.at("laser"));
            if (!laser) {
                return unexpected(wireError(where + laser.error().message));
            }
            line.laser = std::move(*laser);
        }
        if (present(document, "dwell")) {
            line.dwell = dwellFromJson(document.at("dwell"));
        }
        return line;
    } catch (const json::exception& e) {
        return unexpected(wireError(std::string("line: ") + e.what()));
    }
}

expected<Protocol> fromJson(const json& document) {
    try {
        if (!document.is_object()) {
            return unexpected(wireError("protocol document must be an object"));
        }

        Protocol protocol;
        protocol.name = document.at("protocol_name").get<std::string>();
        protocol.version = document.at("version").get<std::string>();
        protocol.description = document.value("description", std::string{});
        protocol.author = document.value("author", std::string{});
        protocol.loopCount = document.value("loop_count", 1);
        if (present(document, "created_date")) {
            protocol.createdDate = document.at("created_date").get<std::string>();
        }
        if (present(document, "safety_limits")) {
            auto limits = limitsFromJson(document.at("safety_limits"));
            if (!limits) {
                return unexpected(limits.error());
            }
            protocol.safetyLimits = *limits;
        }

        const auto& lines = document.at("lines");
        if (!lines.is_array()) {
            return unexpected(wireError("'lines' must be an array"));
        }
        protocol.lines.reserve(lines.size());
        for (const auto& node : lines) {
            auto line = lineFromJson(node);
            if (!line) {
                return unexpected(line.error());
            }
            protocol.lines.push_back(std::move(*line));
        }
        return protocol;
    } catch (const json::exception& e) {
        return unexpected(wireError(e.what()));
    }
}

std::string toWire(const Protocol& protocol, int indent) {
    return toJson(protocol).dump(indent);
}

expected<Protocol> fromWire(const std::string& text) {
    json document = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (document.is_discarded()) {
        logError("[ProtocolWire] rejected document: not valid JSON\n");
        return unexpected(wireError("protocol document is not valid JSON"));
    }
    auto protocol = fromJson(document);
    if (!protocol) {
        logError("[ProtocolWire] rejected document: ", protocol.error().message, "\n");
    }
    return protocol;
}

} // namespace photon::protocol
