#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace photon::engine {

enum class ExecutionState {
    Idle,
    Running,
    Paused,
    Stopped,
    Completed,
    Error
};

const char* toString(ExecutionState state);

/// Stopped, Completed and Error end a run; a new execute() starts over.
bool isTerminal(ExecutionState state);

enum class LineEvent {
    Start,
    Complete,
    Error,
    Timeout
};

const char* toString(LineEvent event);

enum class StopReason {
    User,
    Safety
};

const char* toString(StopReason reason);

using WallClock = std::chrono::system_clock;

struct ExecutionLogEntry {
    int lineNumber = 0;
    int loopIteration = 0;              ///< 1-based
    WallClock::time_point timestamp{};
    LineEvent event = LineEvent::Start;
    std::optional<std::string> error;
};

/**
 * @brief Audit data of one run, handed to an external persister.
 */
struct ExecutionSummary {
    std::string protocolName;
    ExecutionState terminalState = ExecutionState::Idle;
    std::optional<StopReason> stopReason;
    std::optional<WallClock::time_point> startTime;
    std::optional<WallClock::time_point> endTime;
    double durationS = 0.0;
    int linesCompleted = 0;
    int loopIterationsCompleted = 0;
    std::vector<int> failedLines;       ///< one entry per failed line execution
    std::vector<ExecutionLogEntry> executionLog;
};

struct RunResult {
    bool success = false;
    std::string message;
    std::error_code code;   ///< empty on success; otherwise why the run was refused or ended
};

/**
 * @brief Observer hooks injected at construction.
 *
 * All callbacks run on the engine's executor thread and must not block; a
 * UI forwards them to its own thread. Any of them may be left empty.
 */
struct EngineCallbacks {
    std::function<void(ExecutionState)> onStateChanged;
    std::function<void(const ExecutionLogEntry&)> onLogEntry;
    std::function<void(int lineNumber, int loopIteration)> onLineStarted;
    std::function<void(int lineNumber, int loopIteration)> onLineCompleted;
    std::function<void(double fraction)> onProgress;
};

} // namespace photon::engine
