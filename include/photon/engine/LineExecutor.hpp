#pragma once

#include "photon/core/DeviceHandles.hpp"
#include "photon/core/Error.hpp"
#include "photon/engine/EngineConfig.hpp"
#include "photon/exec/CancelScope.hpp"
#include "photon/exec/Deadline.hpp"
#include "photon/protocol/ProtocolLine.hpp"

#include <functional>
#include <memory>
#include <string>

namespace photon::engine {

/**
 * @brief Runs one execution of a ProtocolLine on the engine's executor.
 *
 * The enabled sub-actions (movement, laser, dwell) start together as
 * cooperative tasks inside a child of the run scope. The first failing task
 * cancels its siblings; the line completes only after every task has
 * observed that and unwound. A Deadline on the child scope enforces the
 * per-line budget and is suspended while the engine is paused.
 *
 * Each device command is attempted up to `maxAttempts` times with
 * `retryDelay` between attempts; the delay is cut short by stop, timeout or
 * sibling failure.
 *
 * Also owns the actuator position estimate, updated after each successful
 * positioning command and carried across lines, loops and runs.
 *
 * Not thread-safe: use only from the executor thread.
 */
class LineExecutor {
public:
    /// Receives an empty Error on success.
    using Done = std::function<void(const core::Error&)>;
    using ScopePtr = std::shared_ptr<exec::CancelScope>;

    LineExecutor(exec::asio::io_context& io,
                 std::shared_ptr<core::ActuatorHandle> actuator,
                 std::shared_ptr<core::LaserHandle> laser,
                 const EngineConfig& config);

    LineExecutor(const LineExecutor&) = delete;
    LineExecutor& operator=(const LineExecutor&) = delete;

    /// Start the line; @p done runs exactly once on the executor.
    void run(const protocol::ProtocolLine& line, const ScopePtr& runScope, Done done);

    void suspendDeadline();
    void resumeDeadline();

    double positionMm() const { return positionMm_; }

private:
    class TickedWait;
    class RampTask;
    struct Join;

    void runMovement(const protocol::MoveAction& move, const ScopePtr& scope, Done done);
    void runLaser(const protocol::LaserAction& laser, const ScopePtr& scope, Done done);
    void runDwell(const protocol::Dwell& dwell, const ScopePtr& scope, Done done);

    void invoke(const ScopePtr& scope, std::string what, std::function<bool()> command,
                Done done, int attempt = 1);

    void arrive(const std::shared_ptr<Join>& join, const core::Error& error);

    exec::asio::io_context& io_;
    std::shared_ptr<core::ActuatorHandle> actuator_;
    std::shared_ptr<core::LaserHandle> laser_;
    EngineConfig config_;
    std::shared_ptr<exec::Deadline> deadline_;
    double positionMm_ = 0.0;
};

/// Error reported by a task that woke up inside a cancelled scope.
core::Error interruptionError(const std::error_code& reason);

} // namespace photon::engine
