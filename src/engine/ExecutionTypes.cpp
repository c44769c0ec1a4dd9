#include "photon/engine/ExecutionTypes.hpp"

namespace photon::engine {

const char* toString(ExecutionState state) {
    switch (state) {
        case ExecutionState::Idle:      return "idle";
        case ExecutionState::Running:   return "running";
        case ExecutionState::Paused:    return "paused";
        case ExecutionState::Stopped:   return "stopped";
        case ExecutionState::Completed: return "completed";
        case ExecutionState::Error:     return "error";
    }
    return "unknown";
}

bool isTerminal(ExecutionState state) {
    return state == ExecutionState::Stopped || state == ExecutionState::Completed ||
           state == ExecutionState::Error;
}

const char* toString(LineEvent event) {
    switch (event) {
        case LineEvent::Start:    return "start";
        case LineEvent::Complete: return "complete";
        case LineEvent::Error:    return "error";
        case LineEvent::Timeout:  return "timeout";
    }
    return "unknown";
}

const char* toString(StopReason reason) {
    switch (reason) {
        case StopReason::User:   return "user";
        case StopReason::Safety: return "safety";
    }
    return "unknown";
}

} // namespace photon::engine
