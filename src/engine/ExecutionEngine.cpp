#include "photon/engine/ExecutionEngine.hpp"
#include "photon/log/Log.hpp"

#include <exception>
#include <iomanip>
#include <sstream>

namespace photon::engine {

using core::Error;
using core::ErrorCode;
namespace asio = exec::asio;

namespace {

std::string fixed1(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value;
    return oss.str();
}

std::string joinLineNumbers(const std::vector<int>& lines) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i) oss << ", ";
        oss << lines[i];
    }
    return oss.str();
}

std::string stopMessage(ErrorCode reason) {
    return reason == ErrorCode::SafetyStopped ? "Execution stopped by safety interlock"
                                              : "Execution stopped by user";
}

} // namespace

ExecutionEngine::ExecutionEngine(std::shared_ptr<core::ActuatorHandle> actuator,
                                 std::shared_ptr<core::LaserHandle> laser,
                                 std::shared_ptr<safety::SafetySource> safety,
                                 EngineConfig config,
                                 EngineCallbacks callbacks,
                                 std::shared_ptr<asio::io_context> io)
: io_(std::move(io))
, actuator_(std::move(actuator))
, laser_(std::move(laser))
, config_(config)
, callbacks_(std::move(callbacks))
, lineExecutor_(*io_, actuator_, laser_, config_)
{
    bridge_ = std::make_unique<SafetyInterlockBridge>(std::move(safety), [this](bool enabled) {
        asio::post(*io_, [this, enabled] { handleInterlockChange(enabled); });
    });
}

ExecutionEngine::~ExecutionEngine() {
    bridge_->detach();

    if (runActive_.load()) {
        stop();
        std::unique_lock lock(idleMtx_);
        idleCv_.wait(lock, [this] { return !runActive_.load(); });
    }

    // Drain control handlers that were posted before the run unwound.
    if (!onExecutorThread()) {
        exec::drain(*io_);
    }
}

// Control surface ---------------------------------------------------------------

RunResult ExecutionEngine::execute(const protocol::Protocol& protocol, bool stopOnError) {
    if (auto valid = protocol.validate(); !valid) {
        std::string message = "Protocol validation failed: ";
        const auto& errors = valid.error();
        for (std::size_t i = 0; i < errors.size(); ++i) {
            if (i) message += "; ";
            message += errors[i].describe();
        }
        logError("[ExecutionEngine] ", message, "\n");
        return {false, message, make_error_code(ErrorCode::ValidationFailed)};
    }

    if (onExecutorThread()) {
        logError("[ExecutionEngine] execute() called from the executor thread\n");
        return {false, "execute() must not be called from the engine's executor thread",
                make_error_code(ErrorCode::EngineBusy)};
    }

    bool idle = false;
    if (!runActive_.compare_exchange_strong(idle, true)) {
        logWarning("[ExecutionEngine] execute() rejected: a protocol is already running\n");
        return {false, "Engine busy: a protocol is already running",
                make_error_code(ErrorCode::EngineBusy)};
    }

    auto waiter = std::make_shared<RunWaiter>();
    asio::post(*io_, [this, &protocol, stopOnError, waiter] {
        startRun(protocol, stopOnError, waiter);
    });

    std::unique_lock lock(waiter->mtx);
    waiter->cv.wait(lock, [&] { return waiter->done; });
    return waiter->result;
}

void ExecutionEngine::pause() {
    asio::post(*io_, [this] { handlePause(); });
}

void ExecutionEngine::resume() {
    asio::post(*io_, [this] { handleResume(); });
}

void ExecutionEngine::stop() {
    asio::post(*io_, [this] { handleStop(ErrorCode::UserStopped); });
}

ExecutionSummary ExecutionEngine::lastSummary() const {
    std::lock_guard lock(summaryMtx_);
    return summary_;
}

bool ExecutionEngine::onExecutorThread() const {
    return io_->get_executor().running_in_this_thread();
}

// Run loop ----------------------------------------------------------------------

void ExecutionEngine::startRun(const protocol::Protocol& protocol, bool stopOnError,
                               std::shared_ptr<RunWaiter> waiter) {
    waiter_ = std::move(waiter);

    if (auto permitted = bridge_->preflight(); !permitted) {
        RunResult refused{false, permitted.error().message, permitted.error().code};
        auto pending = std::move(waiter_);
        {
            std::lock_guard lock(idleMtx_);
            runActive_.store(false);
        }
        idleCv_.notify_all();
        {
            std::lock_guard lock(pending->mtx);
            pending->result = std::move(refused);
            pending->done = true;
        }
        pending->cv.notify_all();
        return;
    }

    protocol_ = &protocol;
    stopOnError_ = stopOnError;
    stopReason_.reset();
    lineIndex_ = 0;
    repetition_ = 0;
    loopIndex_ = 0;
    gate_.open();
    runScope_ = std::make_shared<exec::CancelScope>(*io_, gate_);
    startedAt_ = exec::Clock::now();

    {
        std::lock_guard lock(summaryMtx_);
        summary_ = ExecutionSummary{};
        summary_.protocolName = protocol.name;
        summary_.terminalState = ExecutionState::Running;
        summary_.startTime = WallClock::now();
    }

    setState(ExecutionState::Running);
    logInfo("[ExecutionEngine] starting '", protocol.name, "': ", protocol.lines.size(),
            " line(s) x ", protocol.loopCount, " loop(s), estimated ",
            fixed1(protocol.totalDurationSeconds()), "s, ",
            fixed1(protocol.totalEnergyJoules()), "J",
            stopOnError ? "" : " (continuing past line errors)", "\n");

    asio::post(*io_, [this] { beginLine(); });
}

void ExecutionEngine::beginLine() {
    if (stopReason_) {
        finishRun(ExecutionState::Stopped,
                  {false, stopMessage(*stopReason_), make_error_code(*stopReason_)});
        return;
    }
    if (!gate_.isOpen()) {
        runScope_->waitUntilOpen([this] { beginLine(); });
        return;
    }
    if (loopIndex_ >= protocol_->loopCount) {
        std::vector<int> failed;
        {
            std::lock_guard lock(summaryMtx_);
            failed = summary_.failedLines;
        }
        if (failed.empty()) {
            finishRun(ExecutionState::Completed, {true, "Protocol completed successfully"});
        } else {
            const double elapsed =
                std::chrono::duration<double>(exec::Clock::now() - startedAt_).count();
            finishRun(ExecutionState::Completed,
                      {true, "Protocol completed with warnings in " + fixed1(elapsed) +
                                 " seconds. " + std::to_string(failed.size()) +
                                 " non-critical lines failed: " + joinLineNumbers(failed)});
        }
        return;
    }

    const auto& line = protocol_->lines[lineIndex_];
    const int iteration = loopIndex_ + 1;
    if (lineIndex_ == 0 && repetition_ == 0 && protocol_->loopCount > 1) {
        logInfo("[ExecutionEngine] loop iteration ", iteration, "/", protocol_->loopCount, "\n");
    }
    logInfo("[ExecutionEngine] ", line.summary(lineExecutor_.positionMm()),
            line.repeatCount > 1 ? " (repetition " + std::to_string(repetition_ + 1) + "/" +
                                       std::to_string(line.repeatCount) + ")"
                                 : std::string{},
            "\n");

    appendLog(line, LineEvent::Start);
    if (callbacks_.onLineStarted) {
        callbacks_.onLineStarted(line.lineNumber, iteration);
    }
    reportProgress();

    lineExecutor_.run(line, runScope_, [this](const Error& error) { onLineFinished(error); });
}

void ExecutionEngine::onLineFinished(const Error& error) {
    const auto& line = protocol_->lines[lineIndex_];

    if (!error) {
        appendLog(line, LineEvent::Complete);
        {
            std::lock_guard lock(summaryMtx_);
            ++summary_.linesCompleted;
        }
        if (callbacks_.onLineCompleted) {
            callbacks_.onLineCompleted(line.lineNumber, loopIndex_ + 1);
        }
    } else if (core::isStop(error.code)) {
        appendLog(line, LineEvent::Error, error.message);
        const auto reason = stopReason_.value_or(ErrorCode::UserStopped);
        finishRun(ExecutionState::Stopped, {false, stopMessage(reason), make_error_code(reason)});
        return;
    } else {
        const bool timedOut = error.code == ErrorCode::LineTimeout;
        appendLog(line, timedOut ? LineEvent::Timeout : LineEvent::Error, error.message);
        {
            std::lock_guard lock(summaryMtx_);
            summary_.failedLines.push_back(line.lineNumber);
        }
        const std::string message =
            timedOut ? error.message
                     : "Line " + std::to_string(line.lineNumber) + " failed: " + error.message;
        if (stopOnError_) {
            logError("[ExecutionEngine] ", message, "\n");
            finishRun(ExecutionState::Error, {false, message, error.code});
            return;
        }
        logWarning("[ExecutionEngine] ", message, "; continuing with next line\n");
    }

    advanceCursor();
    asio::post(*io_, [this] { beginLine(); });
}

void ExecutionEngine::advanceCursor() {
    const auto& line = protocol_->lines[lineIndex_];
    if (++repetition_ < line.repeatCount) {
        return;
    }
    repetition_ = 0;
    if (++lineIndex_ < protocol_->lines.size()) {
        return;
    }
    lineIndex_ = 0;
    ++loopIndex_;
    {
        std::lock_guard lock(summaryMtx_);
        summary_.loopIterationsCompleted = loopIndex_;
    }
}

void ExecutionEngine::finishRun(ExecutionState terminal, RunResult result) {
    const double elapsed = std::chrono::duration<double>(exec::Clock::now() - startedAt_).count();
    setState(terminal);

    {
        std::lock_guard lock(summaryMtx_);
        summary_.terminalState = terminal;
        summary_.endTime = WallClock::now();
        summary_.durationS = elapsed;
        if (stopReason_) {
            summary_.stopReason =
                *stopReason_ == ErrorCode::SafetyStopped ? StopReason::Safety : StopReason::User;
        }
    }

    if (terminal == ExecutionState::Completed) {
        if (callbacks_.onProgress) {
            callbacks_.onProgress(1.0);
        }
        logInfo("[ExecutionEngine] ", result.message, " (", fixed1(elapsed), "s)\n");
    } else {
        logWarning("[ExecutionEngine] run ended ", toString(terminal), ": ", result.message, "\n");
    }

    runScope_.reset();
    protocol_ = nullptr;
    gate_.open();

    auto waiter = std::move(waiter_);
    {
        std::lock_guard lock(idleMtx_);
        runActive_.store(false);
    }
    idleCv_.notify_all();

    if (waiter) {
        {
            std::lock_guard lock(waiter->mtx);
            waiter->result = std::move(result);
            waiter->done = true;
        }
        waiter->cv.notify_all();
    }
}

// Control handlers --------------------------------------------------------------

void ExecutionEngine::handlePause() {
    if (state_.load() != ExecutionState::Running) {
        logInfo("[ExecutionEngine] pause ignored in state ", toString(state_.load()), "\n");
        return;
    }
    gate_.close();
    lineExecutor_.suspendDeadline();
    setState(ExecutionState::Paused);
}

void ExecutionEngine::handleResume() {
    if (state_.load() != ExecutionState::Paused) {
        logInfo("[ExecutionEngine] resume ignored in state ", toString(state_.load()), "\n");
        return;
    }
    gate_.open();
    lineExecutor_.resumeDeadline();
    setState(ExecutionState::Running);
}

void ExecutionEngine::handleStop(ErrorCode reason) {
    const auto current = state_.load();
    if (isTerminal(current)) {
        logInfo("[ExecutionEngine] stop ignored: already ", toString(current), "\n");
        return;
    }

    stopReason_ = reason;
    gate_.open();
    setState(ExecutionState::Stopped);
    selectiveShutdown();

    if (runScope_) {
        runScope_->cancel(make_error_code(reason));
    }
}

void ExecutionEngine::handleInterlockChange(bool enabled) {
    const auto current = state_.load();
    if (enabled) {
        logInfo("[ExecutionEngine] interlock restored (state ", toString(current), ")\n");
        return;
    }
    if (current != ExecutionState::Running && current != ExecutionState::Paused) {
        logInfo("[ExecutionEngine] interlock lost while ", toString(current), "; nothing to stop\n");
        return;
    }
    logCritical("[ExecutionEngine] SAFETY INTERLOCK LOST - stopping protocol execution\n");
    handleStop(ErrorCode::SafetyStopped);
    logCritical("[ExecutionEngine] laser disabled by interlock; actuator and other systems remain operational\n");
}

void ExecutionEngine::selectiveShutdown() {
    auto attempt = [](const char* what, const std::function<bool()>& command) {
        try {
            if (command()) {
                return true;
            }
            logError("[ExecutionEngine] shutdown: ", what, " failed\n");
        } catch (const std::exception& e) {
            logError("[ExecutionEngine] shutdown: ", what, " threw: ", e.what(), "\n");
        } catch (...) {
            logError("[ExecutionEngine] shutdown: ", what, " threw an unknown exception\n");
        }
        return false;
    };

    auto laser = laser_;
    const bool outputOff = attempt("laser output off", [laser] { return laser->setOutput(false); });
    const bool currentZero = attempt("laser current to 0", [laser] { return laser->setCurrent(0.0); });
    if (outputOff && currentZero) {
        logInfo("[ExecutionEngine] laser disabled (actuator left as is)\n");
    }
}

// Observers ---------------------------------------------------------------------

void ExecutionEngine::setState(ExecutionState next) {
    const auto previous = state_.exchange(next);
    if (previous == next) {
        return;
    }
    logInfo("[ExecutionEngine] state ", toString(previous), " -> ", toString(next), "\n");
    if (callbacks_.onStateChanged) {
        callbacks_.onStateChanged(next);
    }
}

void ExecutionEngine::appendLog(const protocol::ProtocolLine& line, LineEvent event,
                                std::optional<std::string> error) {
    ExecutionLogEntry entry;
    entry.lineNumber = line.lineNumber;
    entry.loopIteration = loopIndex_ + 1;
    entry.timestamp = WallClock::now();
    entry.event = event;
    entry.error = std::move(error);
    {
        std::lock_guard lock(summaryMtx_);
        summary_.executionLog.push_back(entry);
    }
    if (callbacks_.onLogEntry) {
        callbacks_.onLogEntry(entry);
    }
}

void ExecutionEngine::reportProgress() {
    if (!callbacks_.onProgress || !protocol_ || protocol_->lines.empty()) {
        return;
    }
    const double perLoop = static_cast<double>(lineIndex_) / protocol_->lines.size();
    callbacks_.onProgress((loopIndex_ + perLoop) / protocol_->loopCount);
}

} // namespace photon::engine
