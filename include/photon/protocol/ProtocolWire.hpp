#pragma once

#include "photon/core/Expected.hpp"
#include "photon/protocol/Protocol.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace photon::protocol {

/**
 * @brief JSON document form of a Protocol, shared with the UI and file storage.
 *
 * Layout:
 *   {"protocol_name", "version", "description", "author", "created_date",
 *    "loop_count", "safety_limits": {...}, "lines": [...]}
 * Each line carries "line_number", "repeat_count", "notes" and, when present,
 * "movement" / "laser" / "dwell" as {"type": ..., "params": {...}} objects.
 * Absent actions are omitted rather than written as null; unknown keys are
 * ignored on read so newer documents stay loadable by older builds.
 */
nlohmann::json toJson(const Protocol& protocol);
nlohmann::json toJson(const ProtocolLine& line);
nlohmann::json toJson(const SafetyLimits& limits);

expected<Protocol> fromJson(const nlohmann::json& document);
expected<ProtocolLine> lineFromJson(const nlohmann::json& document);
expected<SafetyLimits> limitsFromJson(const nlohmann::json& document);

/// Serialise to text; @p indent < 0 gives the compact form.
std::string toWire(const Protocol& protocol, int indent = 2);

/// Parse text produced by toWire() (or an older/newer build of it).
expected<Protocol> fromWire(const std::string& text);

} // namespace photon::protocol
