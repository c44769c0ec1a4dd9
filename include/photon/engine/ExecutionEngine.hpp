#pragma once

#include "photon/core/DeviceHandles.hpp"
#include "photon/core/Error.hpp"
#include "photon/engine/EngineConfig.hpp"
#include "photon/engine/ExecutionTypes.hpp"
#include "photon/engine/LineExecutor.hpp"
#include "photon/engine/SafetyInterlockBridge.hpp"
#include "photon/exec/CancelScope.hpp"
#include "photon/exec/ExecService.hpp"
#include "photon/exec/PauseGate.hpp"
#include "photon/protocol/Protocol.hpp"
#include "photon/safety/SafetySource.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace photon::engine {

/**
 * @brief Runs validated protocols against an actuator and a laser.
 *
 * Lifecycle:
 * - `execute()` validates the protocol, runs the pre-flight safety check and
 *   then blocks the calling thread until the run reaches a terminal state.
 * - Lines run in order, each `repeatCount` times, the whole list `loopCount`
 *   times. Within a line the enabled sub-actions run concurrently.
 * - `pause()`, `resume()` and `stop()` may be called from any thread; they
 *   are dispatched onto the executor so they never race with a line.
 * - An interlock transition to "not permitted" while Running or Paused is an
 *   emergency stop: laser output off, laser current zero, run cancelled.
 *   The actuator is never commanded by a stop.
 *
 * Threading:
 * - All run state lives on the io_context thread; observers are called there.
 * - `execute()` must not be called from that thread, and only one run may be
 *   active per engine (a second call fails with "busy").
 *
 * Lifetime:
 * - The destructor stops an active run and waits for it to unwind. The
 *   io_context must outlive the engine.
 */
class ExecutionEngine {
public:
    ExecutionEngine(std::shared_ptr<core::ActuatorHandle> actuator,
                    std::shared_ptr<core::LaserHandle> laser,
                    std::shared_ptr<safety::SafetySource> safety,
                    EngineConfig config = {},
                    EngineCallbacks callbacks = {},
                    std::shared_ptr<exec::asio::io_context> io = exec::shared_io_context());
    ~ExecutionEngine();

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    /**
     * @brief Run @p protocol to completion.
     *
     * With @p stopOnError false, failed lines are recorded and skipped and
     * the run completes with warnings. Returns the outcome message that is
     * shown to the operator.
     */
    RunResult execute(const protocol::Protocol& protocol, bool stopOnError = true);

    /// Running -> Paused; otherwise no effect.
    void pause();

    /// Paused -> Running; otherwise no effect.
    void resume();

    /// Emergency stop from any non-terminal state; a no-op once terminal.
    void stop();

    ExecutionState state() const { return state_.load(); }

    bool isRunActive() const { return runActive_.load(); }

    /// Summary of the current or most recent run.
    ExecutionSummary lastSummary() const;

    const EngineConfig& config() const { return config_; }

private:
    struct RunWaiter {
        std::mutex mtx;
        std::condition_variable cv;
        bool done = false;
        RunResult result;
    };

    // All of the following run on the executor thread.
    void startRun(const protocol::Protocol& protocol, bool stopOnError,
                  std::shared_ptr<RunWaiter> waiter);
    void beginLine();
    void onLineFinished(const core::Error& error);
    void advanceCursor();
    void finishRun(ExecutionState terminal, RunResult result);

    void handlePause();
    void handleResume();
    void handleStop(core::ErrorCode reason);
    void handleInterlockChange(bool enabled);

    void selectiveShutdown();
    void setState(ExecutionState next);
    void appendLog(const protocol::ProtocolLine& line, LineEvent event,
                   std::optional<std::string> error = std::nullopt);
    void reportProgress();

    bool onExecutorThread() const;

    std::shared_ptr<exec::asio::io_context> io_;
    std::shared_ptr<core::ActuatorHandle> actuator_;
    std::shared_ptr<core::LaserHandle> laser_;
    EngineConfig config_;
    EngineCallbacks callbacks_;

    std::atomic<ExecutionState> state_{ExecutionState::Idle};
    std::atomic<bool> runActive_{false};

    exec::PauseGate gate_;
    LineExecutor lineExecutor_;

    // Current run (executor thread only).
    const protocol::Protocol* protocol_ = nullptr;
    std::shared_ptr<RunWaiter> waiter_;
    std::shared_ptr<exec::CancelScope> runScope_;
    std::optional<core::ErrorCode> stopReason_;
    bool stopOnError_ = true;
    std::size_t lineIndex_ = 0;
    int repetition_ = 0;
    int loopIndex_ = 0;
    exec::Clock::time_point startedAt_{};

    mutable std::mutex summaryMtx_;
    ExecutionSummary summary_;

    std::mutex idleMtx_;
    std::condition_variable idleCv_;

    std::unique_ptr<SafetyInterlockBridge> bridge_;
};

} // namespace photon::engine
