#include "photon/engine/ExecutionRecord.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace photon::engine {

using nlohmann::json;

std::string isoTimestamp(WallClock::time_point when) {
    const auto sinceEpoch = when.time_since_epoch();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch).count() % 1000;
    const std::time_t seconds = WallClock::to_time_t(when);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
        << std::setfill('0') << (millis < 0 ? millis + 1000 : millis) << 'Z';
    return oss.str();
}

json toJson(const ExecutionLogEntry& entry) {
    json out{
        {"line_number", entry.lineNumber},
        {"loop_iteration", entry.loopIteration},
        {"timestamp", isoTimestamp(entry.timestamp)},
        {"event", toString(entry.event)},
    };
    if (entry.error) {
        out["error"] = *entry.error;
    }
    return out;
}

json toJson(const ExecutionSummary& summary) {
    json log = json::array();
    for (const auto& entry : summary.executionLog) {
        log.push_back(toJson(entry));
    }

    json out{
        {"protocol_name", summary.protocolName},
        {"terminal_state", toString(summary.terminalState)},
        {"duration_s", summary.durationS},
        {"lines_completed", summary.linesCompleted},
        {"loop_iterations_completed", summary.loopIterationsCompleted},
        {"failed_lines", summary.failedLines},
        {"execution_log", std::move(log)},
    };
    if (summary.stopReason) {
        out["stop_reason"] = toString(*summary.stopReason);
    }
    if (summary.startTime) {
        out["start_time"] = isoTimestamp(*summary.startTime);
    }
    if (summary.endTime) {
        out["end_time"] = isoTimestamp(*summary.endTime);
    }
    return out;
}

} // namespace photon::engine
