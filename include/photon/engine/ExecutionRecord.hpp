#pragma once

#include "photon/engine/ExecutionTypes.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace photon::engine {

/// "2025-01-01T10:00:00.250Z" (UTC, millisecond precision).
std::string isoTimestamp(WallClock::time_point when);

/**
 * @brief Audit record of a run, as handed to the session database.
 *
 *   {"protocol_name", "terminal_state", "stop_reason", "start_time",
 *    "end_time", "duration_s", "lines_completed", "loop_iterations_completed",
 *    "failed_lines": [...], "execution_log": [{"line_number",
 *    "loop_iteration", "timestamp", "event", "error"}]}
 *
 * Optional values that are unset are omitted.
 */
nlohmann::json toJson(const ExecutionSummary& summary);
nlohmann::json toJson(const ExecutionLogEntry& entry);

} // namespace photon::engine
